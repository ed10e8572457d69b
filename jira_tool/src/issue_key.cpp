#include "issue_key.hpp"
#include "errors.hpp"
#include <regex>

namespace {

const std::regex& key_pattern() {
    static const std::regex pattern("[A-Z]+[A-Z0-9]*-[0-9]+");
    return pattern;
}

}

bool IssueKey::is_key(const std::string& candidate) {
    return std::regex_match(candidate, key_pattern());
}

IssueKey IssueKey::normalize(const std::string& input) {
    if (is_key(input)) {
        return IssueKey(input);
    }

    std::smatch match;
    if (std::regex_search(input, match, key_pattern())) {
        return IssueKey(match.str(0));
    }

    throw InvalidKeyError(input);
}
