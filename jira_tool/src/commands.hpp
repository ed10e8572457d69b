#pragma once
#include "jira_client.hpp"
#include "output.hpp"
#include "parser.hpp"
#include <optional>
#include <string>

// The four user-facing commands. Each one performs its round-trips in
// sequence and lets any JiraError escape to the caller.
class CommandRunner {
public:
    CommandRunner(JiraClient& client, Console& console);

    void run(const ParsedCommand& cmd);

    void get(const std::string& input, bool raw);
    void status(const std::string& input, const std::optional<std::string>& desired, bool list);
    void comment(const std::string& input, const std::string& text);
    void log_time(const std::string& input, const std::string& duration, const std::string& description);

private:
    void list_transitions(const IssueKey& key, const std::vector<Transition>& transitions);
    void print_issue_summary(const IssueKey& key, const IssueSummary& issue);

    JiraClient& client_;
    Console& console_;
};
