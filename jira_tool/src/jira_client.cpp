#include "jira_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

constexpr long HTTP_ERROR_THRESHOLD = 400;

std::string issue_endpoint(const IssueKey& key) {
    return "issue/" + key.str();
}

std::optional<std::string> usable_text(const nlohmann::json& value) {
    if (value.is_string()) {
        auto text = util::trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }

    if (value.is_array()) {
        for (const auto& item : value) {
            if (auto text = usable_text(item)) {
                return text;
            }
        }
        return std::nullopt;
    }

    if (value.is_object()) {
        std::vector<std::string> parts;
        for (const auto& [field, detail] : value.items()) {
            auto text = usable_text(detail);
            parts.push_back(text ? field + ": " + *text : field);
        }
        if (parts.empty()) {
            return std::nullopt;
        }
        return util::join(parts, "; ");
    }

    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }

    return std::nullopt;
}

}

JiraClient::JiraClient(Transport& transport)
    : transport_(transport) {}

std::string JiraClient::exchange(const ApiRequest& req) {
    ApiResponse response = transport_.send(req);
    check_status(response);
    return response.body;
}

nlohmann::json JiraClient::request(const ApiRequest& req) {
    std::string body = exchange(req);

    if (util::trim(body).empty()) {
        return nullptr;
    }

    auto decoded = parse_body(body);
    if (decoded.is_discarded()) {
        spdlog::warn("Response from {} is not valid JSON", req.path());
    }
    return decoded;
}

void JiraClient::check_status(const ApiResponse& response) {
    if (response.status < HTTP_ERROR_THRESHOLD) {
        return;
    }

    spdlog::debug("Error body: {}", response.body);

    auto message = extract_error_message(response.body);
    throw HttpError(response.status, message ? *message : fallback_message(response.status));
}

std::optional<std::string> JiraClient::extract_error_message(const std::string& body) {
    auto decoded = parse_body(body);
    if (decoded.is_discarded() || !decoded.is_object()) {
        return std::nullopt;
    }

    for (const char* field : {"errorMessages", "message", "errors", "error", "detail"}) {
        auto it = decoded.find(field);
        if (it == decoded.end()) {
            continue;
        }
        if (auto text = usable_text(*it)) {
            return text;
        }
    }
    return std::nullopt;
}

std::string JiraClient::fallback_message(long status) {
    switch (status) {
        case 400: return "Bad Request: Invalid request format or parameters";
        case 401: return "Unauthorized: Invalid credentials or API token";
        case 403: return "Forbidden: Insufficient permissions for this operation";
        case 404: return "Not Found: Issue or resource does not exist";
        case 429: return "Rate Limited: Too many requests, please try again later";
        case 500: return "Internal Server Error: JIRA server error";
        case 503: return "Service Unavailable: JIRA service temporarily unavailable";
        default: return "HTTP " + std::to_string(status) + ": Request failed";
    }
}

ApiRequest JiraClient::issue_request(const IssueKey& key, bool rendered_fields) {
    ApiRequest req;
    req.method = HttpMethod::GET;
    req.endpoint = issue_endpoint(key);
    req.version = ApiVersion::V3;
    if (rendered_fields) {
        req.query["expand"] = "renderedFields";
    }
    return req;
}

nlohmann::json JiraClient::get_issue(const IssueKey& key, bool rendered_fields) {
    return request(issue_request(key, rendered_fields));
}

std::string JiraClient::get_issue_text(const IssueKey& key, bool rendered_fields) {
    return exchange(issue_request(key, rendered_fields));
}

std::vector<Transition> JiraClient::get_transitions(const IssueKey& key) {
    ApiRequest req;
    req.method = HttpMethod::GET;
    req.endpoint = issue_endpoint(key) + "/transitions";
    req.version = ApiVersion::V3;
    return parse_transitions(request(req));
}

void JiraClient::transition_issue(const IssueKey& key, const std::string& transition_id) {
    ApiRequest req;
    req.method = HttpMethod::POST;
    req.endpoint = issue_endpoint(key) + "/transitions";
    req.body = TransitionRequest{transition_id}.to_json();
    req.version = ApiVersion::V3;
    request(req);
}

CommentResult JiraClient::add_comment(const IssueKey& key, const std::string& text) {
    ApiRequest req;
    req.method = HttpMethod::POST;
    req.endpoint = issue_endpoint(key) + "/comment";
    req.body = CommentRequest{text}.to_json();
    req.version = ApiVersion::V3;
    return CommentResult::from_json(request(req));
}

WorklogResult JiraClient::add_worklog(const IssueKey& key, const Duration& duration, const std::string& description) {
    ApiRequest req;
    req.method = HttpMethod::POST;
    req.endpoint = issue_endpoint(key) + "/worklog";
    req.body = WorklogRequest{duration.seconds(), description}.to_json();
    req.version = ApiVersion::V3;
    return WorklogResult::from_json(request(req));
}
