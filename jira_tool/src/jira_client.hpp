#pragma once
#include "duration.hpp"
#include "issue_key.hpp"
#include "json_schemas.hpp"
#include "transport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class JiraClient {
public:
    explicit JiraClient(Transport& transport);

    nlohmann::json get_issue(const IssueKey& key, bool rendered_fields = false);
    // Status-checked body exactly as the server sent it
    std::string get_issue_text(const IssueKey& key, bool rendered_fields = false);
    std::vector<Transition> get_transitions(const IssueKey& key);
    void transition_issue(const IssueKey& key, const std::string& transition_id);
    CommentResult add_comment(const IssueKey& key, const std::string& text);
    WorklogResult add_worklog(const IssueKey& key, const Duration& duration, const std::string& description);

    // Sends the request and applies status handling. The decoded body is a
    // discarded json value when the server answered with something other
    // than JSON, and null when the body was empty.
    nlohmann::json request(const ApiRequest& req);

    // Throws HttpError for any status >= 400
    static void check_status(const ApiResponse& response);

    // Tracker-supplied error text, tried in order: errorMessages[0],
    // message, errors, error, detail
    static std::optional<std::string> extract_error_message(const std::string& body);
    static std::string fallback_message(long status);

private:
    std::string exchange(const ApiRequest& req);
    static ApiRequest issue_request(const IssueKey& key, bool rendered_fields);

    Transport& transport_;
};
