#include "json_schemas.hpp"
#include "util.hpp"
#include <cctype>

namespace {

constexpr const char* kNotAvailable = "N/A";

struct PathStep {
    std::optional<std::string> key;
    std::optional<size_t> index;
};

// Splits ".fields.items[0].name" into key and index steps
std::optional<std::vector<PathStep>> compile_path(const std::string& raw) {
    std::vector<PathStep> steps;
    std::string path = util::trim(raw);
    if (path.empty()) {
        return std::nullopt;
    }
    size_t i = 0;

    while (i < path.size()) {
        char c = path[i];
        if (c == '.') {
            ++i;
            continue;
        }

        if (c == '[') {
            auto close = path.find(']', i);
            if (close == std::string::npos || close == i + 1) {
                return std::nullopt;
            }
            std::string digits = path.substr(i + 1, close - i - 1);
            for (char d : digits) {
                if (!std::isdigit(static_cast<unsigned char>(d))) {
                    return std::nullopt;
                }
            }
            try {
                steps.push_back({std::nullopt, static_cast<size_t>(std::stoull(digits))});
            } catch (const std::exception&) {
                return std::nullopt;
            }
            i = close + 1;
            continue;
        }

        auto end = path.find_first_of(".[", i);
        if (end == std::string::npos) {
            end = path.size();
        }
        steps.push_back({path.substr(i, end - i), std::nullopt});
        i = end;
    }

    return steps;
}

const nlohmann::json* walk(const nlohmann::json& root, const std::vector<PathStep>& steps) {
    const nlohmann::json* current = &root;
    for (const auto& step : steps) {
        if (step.key) {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(*step.key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        } else {
            if (!current->is_array() || *step.index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[*step.index];
        }
    }
    return current;
}

}

nlohmann::json parse_body(const std::string& body) {
    return nlohmann::json::parse(body, nullptr, false);
}

std::string serialize_body(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const nlohmann::json* json_lookup(const nlohmann::json& j, const std::string& path) {
    if (j.is_discarded()) {
        return nullptr;
    }

    size_t start = 0;
    while (start <= path.size()) {
        auto sep = path.find("//", start);
        std::string alternative = path.substr(start, sep == std::string::npos ? std::string::npos : sep - start);

        auto steps = compile_path(alternative);
        if (steps) {
            const nlohmann::json* found = walk(j, *steps);
            if (found != nullptr && !found->is_null()) {
                return found;
            }
        }

        if (sep == std::string::npos) {
            break;
        }
        start = sep + 2;
    }
    return nullptr;
}

std::string json_field(const nlohmann::json& j, const std::string& path, const std::string& default_value) {
    const nlohmann::json* found = json_lookup(j, path);
    if (found == nullptr) {
        return default_value;
    }
    if (found->is_string()) {
        return found->get<std::string>();
    }
    return found->dump();
}

std::string extract(const std::string& json_text, const std::string& path, const std::string& default_value) {
    return json_field(parse_body(json_text), path, default_value);
}

nlohmann::json make_document(const std::string& text) {
    return nlohmann::json{
        {"type", "doc"},
        {"version", 1},
        {"content", nlohmann::json::array({
            {
                {"type", "paragraph"},
                {"content", nlohmann::json::array({
                    {{"type", "text"}, {"text", text}}
                })}
            }
        })}
    };
}

std::vector<Transition> parse_transitions(const nlohmann::json& j) {
    std::vector<Transition> transitions;
    const nlohmann::json* list = json_lookup(j, ".transitions");
    if (list == nullptr || !list->is_array()) {
        return transitions;
    }

    for (const auto& item : *list) {
        if (item.is_object()) {
            transitions.push_back(Transition::from_json(item));
        }
    }
    return transitions;
}

nlohmann::json CommentRequest::to_json() const {
    return nlohmann::json{
        {"body", make_document(text)}
    };
}

nlohmann::json WorklogRequest::to_json() const {
    return nlohmann::json{
        {"timeSpentSeconds", time_spent_seconds},
        {"comment", make_document(description)}
    };
}

nlohmann::json TransitionRequest::to_json() const {
    return nlohmann::json{
        {"transition", {{"id", transition_id}}}
    };
}

CommentResult CommentResult::from_json(const nlohmann::json& j) {
    CommentResult result;
    result.id = json_field(j, ".id", kNotAvailable);
    result.created = json_field(j, ".created", kNotAvailable);
    result.author = json_field(j, ".author.displayName", kNotAvailable);
    return result;
}

WorklogResult WorklogResult::from_json(const nlohmann::json& j) {
    WorklogResult result;
    result.id = json_field(j, ".id", kNotAvailable);
    result.created = json_field(j, ".created", kNotAvailable);
    result.author = json_field(j, ".author.displayName", kNotAvailable);
    result.time_spent = json_field(j, ".timeSpent", kNotAvailable);

    const nlohmann::json* estimate = json_lookup(j, ".issue.fields.timeestimate");
    if (estimate != nullptr && estimate->is_number_integer()) {
        result.remaining_estimate_seconds = estimate->get<int64_t>();
    }
    return result;
}

IssueSummary IssueSummary::from_json(const nlohmann::json& j) {
    IssueSummary issue;
    issue.key = json_field(j, ".key", kNotAvailable);
    issue.summary = json_field(j, ".fields.summary", kNotAvailable);
    issue.status = json_field(j, ".fields.status.name", kNotAvailable);
    return issue;
}
