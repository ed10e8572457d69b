#include "errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_KEY: return "InvalidKey";
        case ErrorKind::MISSING_CREDENTIALS: return "MissingCredentials";
        case ErrorKind::NETWORK_FAILURE: return "NetworkFailure";
        case ErrorKind::HTTP_ERROR: return "HTTPError";
        case ErrorKind::INVALID_DURATION: return "InvalidDuration";
        case ErrorKind::NO_MATCHING_TRANSITION: return "NoMatchingTransition";
        case ErrorKind::AMBIGUOUS_TRANSITION: return "AmbiguousTransition";
    }
    return "Unknown";
}

JiraError::JiraError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

InvalidKeyError::InvalidKeyError(const std::string& input)
    : JiraError(ErrorKind::INVALID_KEY, "Invalid JIRA key or URL format: " + input)
    , input_(input) {}

MissingCredentialsError::MissingCredentialsError(const std::vector<std::string>& missing)
    : JiraError(ErrorKind::MISSING_CREDENTIALS,
                missing.empty()
                    ? std::string("JIRA environment variables not set")
                    : fmt::format("Missing required environment variables: {}", fmt::join(missing, ", ")))
    , missing_(missing) {}

NetworkError::NetworkError(const std::string& detail)
    : JiraError(ErrorKind::NETWORK_FAILURE,
                fmt::format("Network error or timeout occurred ({}). Check your JIRA_BASE_URL and internet connection.", detail)) {}

HttpError::HttpError(long status, const std::string& message)
    : JiraError(ErrorKind::HTTP_ERROR, fmt::format("HTTP {}: {}", status, message))
    , status_(status)
    , message_(message) {}

InvalidDurationError::InvalidDurationError(const std::string& message)
    : JiraError(ErrorKind::INVALID_DURATION, message) {}

NoMatchingTransitionError::NoMatchingTransitionError(const std::string& desired, std::vector<std::string> available)
    : JiraError(ErrorKind::NO_MATCHING_TRANSITION, fmt::format("No transitions found for status '{}'", desired))
    , desired_(desired)
    , available_(std::move(available)) {}

AmbiguousTransitionError::AmbiguousTransitionError(const std::string& desired, std::vector<Transition> candidates)
    : JiraError(ErrorKind::AMBIGUOUS_TRANSITION, fmt::format("Multiple transitions found for status '{}'", desired))
    , desired_(desired)
    , candidates_(std::move(candidates)) {}
