#include "commands.hpp"
#include "duration.hpp"
#include "transition_resolver.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

CommandRunner::CommandRunner(JiraClient& client, Console& console)
    : client_(client), console_(console) {}

void CommandRunner::run(const ParsedCommand& cmd) {
    switch (cmd.type) {
        case CommandType::GET:
            get(cmd.args.at(0), cmd.raw);
            break;
        case CommandType::STATUS:
            status(cmd.args.at(0), cmd.get_arg(1), cmd.list);
            break;
        case CommandType::COMMENT:
            comment(cmd.args.at(0), cmd.args.at(1));
            break;
        case CommandType::TIME:
            log_time(cmd.args.at(0), cmd.args.at(1), cmd.args.at(2));
            break;
        case CommandType::HELP:
            console_.out() << CommandParser::general_help("jira_tool");
            break;
    }
}

void CommandRunner::get(const std::string& input, bool raw) {
    IssueKey key = IssueKey::normalize(input);
    spdlog::info("Fetching issue: {}", key.str());

    if (!raw) {
        console_.out() << format_issue(client_.get_issue(key, true));
        return;
    }

    // Pretty-print JSON, pass anything else through untouched
    std::string body = client_.get_issue_text(key, true);
    nlohmann::json issue = parse_body(body);
    if (issue.is_discarded()) {
        spdlog::warn("Issue response is not JSON, printing it as received");
        console_.out() << body;
        if (!body.empty() && body.back() != '\n') {
            console_.line();
        }
    } else {
        console_.line(issue.dump(2));
    }
}

void CommandRunner::status(const std::string& input, const std::optional<std::string>& desired, bool list) {
    IssueKey key = IssueKey::normalize(input);
    spdlog::info("Getting transitions for issue: {}", key.str());

    std::vector<Transition> transitions = client_.get_transitions(key);

    if (list || !desired || desired->empty()) {
        list_transitions(key, transitions);
        return;
    }

    std::string transition_id = resolve_transition(transitions, *desired);
    spdlog::info("Transitioning {} to '{}' (transition ID: {})", key.str(), *desired, transition_id);

    client_.transition_issue(key, transition_id);

    spdlog::info("Verifying transition...");
    IssueSummary updated = IssueSummary::from_json(client_.get_issue(key));

    console_.success(fmt::format("Issue {} transitioned to: {}", key.str(), updated.status));
    console_.line();
    print_issue_summary(key, updated);
}

void CommandRunner::list_transitions(const IssueKey& key, const std::vector<Transition>& transitions) {
    console_.line(fmt::format("📋 Available Transitions for {}", key.str()));
    console_.line("================================");
    console_.line();

    IssueSummary current = IssueSummary::from_json(client_.get_issue(key));
    console_.line(fmt::format("🔄 Current Status: {}", current.status));
    console_.line();

    if (transitions.empty()) {
        console_.line("❌ No transitions available for this issue");
    } else {
        console_.line("➡️ Available Transitions:");
        for (const auto& transition : transitions) {
            console_.line(fmt::format("  - {} (ID: {})", transition.to_status, transition.id));
        }
    }
    console_.line();
}

void CommandRunner::comment(const std::string& input, const std::string& text) {
    IssueKey key = IssueKey::normalize(input);
    spdlog::info("Adding comment to issue: {}", key.str());

    CommentResult result = client_.add_comment(key, text);

    console_.success("Comment added successfully!");
    console_.line();
    console_.line("💬 Comment Details:");
    console_.line(fmt::format("🔑 Comment ID:  {}", result.id));
    console_.line(fmt::format("📅 Created:     {}", result.created));
    console_.line(fmt::format("👤 Author:      {}", result.author));
    console_.line(fmt::format("📝 Text:        {}", text));
    console_.line();
}

void CommandRunner::log_time(const std::string& input, const std::string& duration, const std::string& description) {
    IssueKey key = IssueKey::normalize(input);

    spdlog::info("Parsing duration: {}", duration);
    Duration spent = Duration::parse(duration);

    spdlog::info("Adding worklog to issue: {} ({}s)", key.str(), spent.seconds());
    WorklogResult result = client_.add_worklog(key, spent, description);

    console_.success("Worklog added successfully!");
    console_.line();
    console_.line("⏰ Worklog Details:");
    console_.line(fmt::format("🔑 Worklog ID:      {}", result.id));
    console_.line(fmt::format("📅 Created:         {}", result.created));
    console_.line(fmt::format("👤 Author:          {}", result.author));
    console_.line(fmt::format("⏱️ Time Spent:       {} ({}s)", duration, spent.seconds()));
    console_.line(fmt::format("📝 Description:     {}", description));
    if (result.remaining_estimate_seconds && *result.remaining_estimate_seconds > 0) {
        console_.line(fmt::format("⏳ Remaining Est.:   {}", format_remaining_estimate(*result.remaining_estimate_seconds)));
    }
    console_.line();

    spdlog::info("Fetching updated issue details...");
    print_issue_summary(key, IssueSummary::from_json(client_.get_issue(key)));
}

void CommandRunner::print_issue_summary(const IssueKey& key, const IssueSummary& issue) {
    console_.line("📋 Issue Summary:");
    console_.line(fmt::format("🔑 Key:     {}", key.str()));
    console_.line(fmt::format("📝 Title:   {}", issue.summary));
    console_.line(fmt::format("📊 Status:  {}", issue.status));
}
