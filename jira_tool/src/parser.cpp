#include "parser.hpp"
#include <fmt/format.h>

namespace {

constexpr const char* kSeeHelp = "Use --help for usage information.";

std::string required(const std::string& what) {
    return what + " is required. " + kSeeHelp;
}

}

std::optional<std::string> ParsedCommand::get_arg(size_t index) const {
    if (index < args.size()) {
        return args[index];
    }
    return std::nullopt;
}

std::optional<CommandType> CommandParser::command_type(const std::string& name) {
    if (name == "get") return CommandType::GET;
    if (name == "status") return CommandType::STATUS;
    if (name == "comment") return CommandType::COMMENT;
    if (name == "time") return CommandType::TIME;
    if (name == "help" || name == "--help" || name == "-h") return CommandType::HELP;
    return std::nullopt;
}

ParsedCommand CommandParser::parse(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw UsageError("No command given", true);
    }

    auto type = command_type(argv[0]);
    if (!type) {
        throw UsageError("Invalid command: '" + argv[0] + "'", true);
    }

    ParsedCommand cmd;
    cmd.type = *type;
    cmd.name = argv[0];
    if (cmd.type == CommandType::HELP) {
        return cmd;
    }

    // Help wins over everything else, even malformed arguments
    if (argv.size() > 1 && (argv[1] == "--help" || argv[1] == "-h")) {
        cmd.help = true;
        return cmd;
    }

    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
            return cmd;
        }
        if (arg == "--raw" && cmd.type == CommandType::GET) {
            cmd.raw = true;
            continue;
        }
        if (arg == "--list" && cmd.type == CommandType::STATUS) {
            cmd.list = true;
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        }

        // Trailing words of free text are joined back together
        if (cmd.type == CommandType::COMMENT && cmd.args.size() == 2) {
            cmd.args[1] += " " + arg;
        } else if (cmd.type == CommandType::TIME && cmd.args.size() == 3) {
            cmd.args[2] += " " + arg;
        } else {
            cmd.args.push_back(arg);
        }
    }

    check_arguments(cmd);
    return cmd;
}

void CommandParser::check_arguments(const ParsedCommand& cmd) {
    if (cmd.args.empty() || cmd.args[0].empty()) {
        throw UsageError(required("Issue key or URL"));
    }

    switch (cmd.type) {
        case CommandType::GET:
            if (cmd.args.size() > 1) {
                throw UsageError("Too many arguments. Expected one issue key or URL.");
            }
            break;
        case CommandType::STATUS:
            if (cmd.args.size() > 2) {
                throw UsageError(std::string("Too many arguments. ") + kSeeHelp);
            }
            break;
        case CommandType::COMMENT:
            if (cmd.args.size() < 2 || cmd.args[1].empty()) {
                throw UsageError(required("Comment text"));
            }
            break;
        case CommandType::TIME:
            if (cmd.args.size() < 2 || cmd.args[1].empty()) {
                throw UsageError(required("Duration"));
            }
            if (cmd.args.size() < 3 || cmd.args[2].empty()) {
                throw UsageError(required("Description"));
            }
            break;
        case CommandType::HELP:
            break;
    }
}

std::string CommandParser::usage_text(const std::string& program) {
    return fmt::format(
        "Usage: {0} {{get|status|comment|time|help}} [options]\n"
        "\n"
        "Commands:\n"
        "  get      - Fetch and display JIRA issue details\n"
        "  status   - Change issue status via transitions\n"
        "  comment  - Add a comment to a JIRA issue\n"
        "  time     - Log work time to a JIRA issue\n"
        "  help     - Show detailed help information\n"
        "\n"
        "Use '{0} <command> --help' for detailed command usage.\n"
        "Use '{0} help' for comprehensive documentation.\n",
        program);
}

std::string CommandParser::general_help(const std::string& program) {
    return fmt::format(
        "JIRA CLI Tool\n"
        "==============\n"
        "\n"
        "Usage: {0} <command> [options]\n"
        "\n"
        "Commands:\n"
        "  get <issue-key>      Fetch and display JIRA issue details\n"
        "  status <issue-key>   Change issue status via transitions\n"
        "  comment <issue-key>  Add a comment to a JIRA issue\n"
        "  time <issue-key>     Log work time to a JIRA issue\n"
        "  help                 Show this help message\n"
        "\n"
        "Global Options:\n"
        "  --help, -h           Show help for command\n"
        "\n"
        "Examples:\n"
        "  {0} get PROJ-123\n"
        "  {0} get --raw PROJ-456\n"
        "  {0} get https://company.atlassian.net/browse/PROJ-123\n"
        "  {0} status PROJ-123 'In Progress'\n"
        "  {0} comment PROJ-123 'This is a comment'\n"
        "  {0} time PROJ-123 '2h 30m' 'Development work completed'\n"
        "\n"
        "Environment Variables Required:\n"
        "  JIRA_BASE_URL      Your JIRA instance URL (e.g., https://company.atlassian.net)\n"
        "  JIRA_EMAIL         Your email address\n"
        "  JIRA_API_TOKEN     Your API token from JIRA (or JIRA_API_TOKEN_FILE)\n"
        "\n"
        "Optional:\n"
        "  JIRA_TEST_MODE     Set to 'true' to answer from canned responses offline\n"
        "  JIRA_LOG_LEVEL     debug, info, warn, error or off (default: info)\n"
        "  JIRA_ENV_FILE      File loaded before reading the environment (default: .env)\n",
        program);
}

std::string CommandParser::command_help(CommandType type, const std::string& program) {
    switch (type) {
        case CommandType::GET:
            return fmt::format(
                "Usage: {0} get [--raw] <issue-key-or-url>\n"
                "\n"
                "Options:\n"
                "  --raw     Dump full JSON response\n"
                "  --help    Show this help message\n"
                "\n"
                "Examples:\n"
                "  {0} get PROJ-123\n"
                "  {0} get https://company.atlassian.net/browse/PROJ-123\n"
                "  {0} get --raw PROJ-123\n",
                program);
        case CommandType::STATUS:
            return fmt::format(
                "Usage: {0} status [--list] <issue-key-or-url> [<new-status>]\n"
                "\n"
                "Options:\n"
                "  --list    List available transitions for the issue\n"
                "  --help    Show this help message\n"
                "\n"
                "Examples:\n"
                "  {0} status PROJ-123                    # List available transitions\n"
                "  {0} status PROJ-123 'In Progress'      # Transition to 'In Progress'\n"
                "  {0} status PROJ-123 done               # Transition to 'Done' (case-insensitive)\n"
                "  {0} status --list PROJ-123             # List available transitions\n",
                program);
        case CommandType::COMMENT:
            return fmt::format(
                "Usage: {0} comment <issue-key-or-url> <comment-text>\n"
                "\n"
                "Options:\n"
                "  --help    Show this help message\n"
                "\n"
                "Examples:\n"
                "  {0} comment PROJ-123 'This is a comment'\n"
                "  {0} comment https://company.atlassian.net/browse/PROJ-123 'Bug fix applied'\n",
                program);
        case CommandType::TIME:
            return fmt::format(
                "Usage: {0} time <issue-key-or-url> <duration> <description>\n"
                "\n"
                "Duration format follows Jira time tracking conventions:\n"
                "  w = weeks (5 working days)\n"
                "  d = days (8 working hours)\n"
                "  h = hours (60 minutes)\n"
                "  m = minutes (60 seconds)\n"
                "\n"
                "Options:\n"
                "  --help    Show this help message\n"
                "\n"
                "Examples:\n"
                "  {0} time PROJ-123 '2h 30m' 'Development work completed'\n"
                "  {0} time PROJ-123 '45m' 'Code review'\n"
                "  {0} time PROJ-123 '1w 2d 4h 30m' 'Project milestone completed'\n",
                program);
        case CommandType::HELP:
            break;
    }
    return general_help(program);
}
