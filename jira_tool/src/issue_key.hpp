#pragma once
#include <string>

// A validated issue identifier such as PROJ-123. normalize() is the only
// way to obtain one, so holders never need to re-check the format.
class IssueKey {
public:
    // Accepts a bare key or any text embedding one (typically a browse URL).
    // Throws InvalidKeyError when no key can be found.
    static IssueKey normalize(const std::string& input);

    static bool is_key(const std::string& candidate);

    const std::string& str() const { return value_; }

private:
    explicit IssueKey(std::string value) : value_(std::move(value)) {}

    std::string value_;
};
