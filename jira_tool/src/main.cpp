#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "jira_client.hpp"
#include "output.hpp"
#include "parser.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    const std::string program = "jira_tool";
    util::setup_logging(util::get_env_var("JIRA_LOG_LEVEL", "info"));
    Console console = Console::standard();

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        console.out() << CommandParser::usage_text(program);
        return 1;
    }

    try {
        ParsedCommand cmd = CommandParser::parse(args);

        // Help never needs configuration
        if (cmd.type == CommandType::HELP) {
            console.out() << CommandParser::general_help(program);
            return 0;
        }
        if (cmd.help) {
            console.out() << CommandParser::command_help(cmd.type, program);
            return 0;
        }

        spdlog::info("Initializing JIRA Tool...");
        Config config = Config::from_env();
        util::setup_logging(config.log_level);
        config.validate();

        auto transport = make_transport(config);
        JiraClient client(*transport);
        CommandRunner runner(client, console);
        runner.run(cmd);

    } catch (const UsageError& e) {
        if (e.show_usage()) {
            console.error(e.what());
            console.line();
            console.out() << CommandParser::usage_text(program);
        } else {
            console.fatal(e.what());
        }
        return 1;
    } catch (const JiraError& e) {
        spdlog::debug("Command failed with {}", to_string(e.kind()));
        console.report(e);
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    return 0;
}
