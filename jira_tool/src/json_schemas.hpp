#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Field extraction never throws. A null, absent or unreachable path and a
// body that is not JSON all yield default_value.
//
// Path syntax: ".a.b[0].c", alternatives separated by "//" are tried left
// to right and the first non-null value wins.
std::string extract(const std::string& json_text, const std::string& path, const std::string& default_value);
std::string json_field(const nlohmann::json& j, const std::string& path, const std::string& default_value);

// Returns nullptr when the path does not resolve
const nlohmann::json* json_lookup(const nlohmann::json& j, const std::string& path);

// Parses without throwing; a discarded value is returned for bad input
nlohmann::json parse_body(const std::string& body);

// Compact wire form. Invalid UTF-8 in user text becomes U+FFFD instead of throwing.
std::string serialize_body(const nlohmann::json& body);

// Single-paragraph structured document used for comment and worklog bodies
nlohmann::json make_document(const std::string& text);

std::vector<Transition> parse_transitions(const nlohmann::json& j);

struct CommentRequest {
    std::string text;

    nlohmann::json to_json() const;
};

struct WorklogRequest {
    int64_t time_spent_seconds;
    std::string description;

    nlohmann::json to_json() const;
};

struct TransitionRequest {
    std::string transition_id;

    nlohmann::json to_json() const;
};

struct CommentResult {
    std::string id;
    std::string created;
    std::string author;

    static CommentResult from_json(const nlohmann::json& j);
};

struct WorklogResult {
    std::string id;
    std::string created;
    std::string author;
    std::string time_spent;
    std::optional<int64_t> remaining_estimate_seconds;

    static WorklogResult from_json(const nlohmann::json& j);
};

struct IssueSummary {
    std::string key;
    std::string summary;
    std::string status;

    static IssueSummary from_json(const nlohmann::json& j);
};
