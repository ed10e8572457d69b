#include "simulation_transport.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* kTransitionsBody = R"({
  "transitions": [
    {"id": "21", "name": "Done", "to": {"name": "Done", "id": "3"}},
    {"id": "11", "name": "In Progress", "to": {"name": "In Progress", "id": "2"}},
    {"id": "31", "name": "To Do", "to": {"name": "To Do", "id": "1"}}
  ]
})";

const char* kCommentBody = R"({
  "id": "10123",
  "created": "2024-01-16T15:30:45.123Z",
  "updated": "2024-01-16T15:30:45.123Z",
  "author": {"displayName": "Test User"},
  "body": {
    "type": "doc",
    "version": 1,
    "content": [{"type": "paragraph", "content": [{"type": "text", "text": "This is a test comment"}]}]
  }
})";

const char* kWorklogBody = R"({
  "id": "10456",
  "created": "2024-01-16T16:15:30.456Z",
  "updated": "2024-01-16T16:15:30.456Z",
  "author": {"displayName": "Test User", "emailAddress": "test@example.com"},
  "timeSpent": "2h 30m",
  "timeSpentSeconds": 9000,
  "comment": {
    "type": "doc",
    "version": 1,
    "content": [{"type": "paragraph", "content": [{"type": "text", "text": "Development work completed"}]}]
  },
  "issue": {"fields": {"timeestimate": 14400}}
})";

const char* kIssueBody = R"({
  "key": "PROJ-123",
  "fields": {
    "summary": "Test Issue Summary",
    "status": {"name": "In Progress"},
    "assignee": {"displayName": "John Doe"},
    "reporter": {"displayName": "Jane Smith"},
    "issuetype": {"name": "Story"},
    "priority": {"name": "High"},
    "created": "2024-01-15T10:30:00.000Z",
    "updated": "2024-01-16T14:45:00.000Z",
    "description": "This is a test issue description that demonstrates how the tool formats and displays JIRA issue information.",
    "customfield_10016": 5
  },
  "renderedFields": {
    "description": "This is a test issue description that demonstrates how the tool formats and displays JIRA issue information."
  }
})";

bool matches(const SimulationTransport::CannedResponse& canned, const ApiRequest& request) {
    if (canned.method && *canned.method != request.method) {
        return false;
    }
    return canned.suffix.empty() || util::ends_with(request.endpoint, canned.suffix);
}

}

SimulationTransport::SimulationTransport() {
    spdlog::debug("Simulation transport active, no requests will leave this process");
}

const std::vector<SimulationTransport::CannedResponse>& SimulationTransport::canned_responses() {
    // First match wins, the final entry is the catch-all issue body
    static const std::vector<CannedResponse> table = {
        {HttpMethod::GET, "/transitions", 200, kTransitionsBody},
        {HttpMethod::POST, "/transitions", 204, ""},
        {HttpMethod::POST, "/comment", 201, kCommentBody},
        {HttpMethod::POST, "/worklog", 201, kWorklogBody},
        {std::nullopt, "", 200, kIssueBody},
    };
    return table;
}

ApiResponse SimulationTransport::send(const ApiRequest& request) {
    history_.push_back(request);

    spdlog::info("[TEST MODE] Would execute {} {} (API v{}) data: {}",
                 to_string(request.method),
                 request.path(),
                 static_cast<int>(request.version),
                 request.body ? serialize_body(*request.body) : "(none)");

    for (const auto& canned : canned_responses()) {
        if (matches(canned, request)) {
            return ApiResponse{canned.status, canned.body};
        }
    }
    return ApiResponse{200, kIssueBody};
}
