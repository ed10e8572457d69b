#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    INVALID_KEY,
    MISSING_CREDENTIALS,
    NETWORK_FAILURE,
    HTTP_ERROR,
    INVALID_DURATION,
    NO_MATCHING_TRANSITION,
    AMBIGUOUS_TRANSITION
};

std::string to_string(ErrorKind kind);

// Root of every failure the tool reports. Components throw, main() is the
// only place that turns one into a message and an exit code.
class JiraError : public std::runtime_error {
public:
    JiraError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidKeyError : public JiraError {
public:
    explicit InvalidKeyError(const std::string& input);

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

class MissingCredentialsError : public JiraError {
public:
    explicit MissingCredentialsError(const std::vector<std::string>& missing);

    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

class NetworkError : public JiraError {
public:
    explicit NetworkError(const std::string& detail);
};

class HttpError : public JiraError {
public:
    HttpError(long status, const std::string& message);

    long status() const { return status_; }
    const std::string& message() const { return message_; }

private:
    long status_;
    std::string message_;
};

class InvalidDurationError : public JiraError {
public:
    explicit InvalidDurationError(const std::string& message);
};

class NoMatchingTransitionError : public JiraError {
public:
    NoMatchingTransitionError(const std::string& desired, std::vector<std::string> available);

    const std::string& desired() const { return desired_; }
    const std::vector<std::string>& available() const { return available_; }

private:
    std::string desired_;
    std::vector<std::string> available_;
};

class AmbiguousTransitionError : public JiraError {
public:
    AmbiguousTransitionError(const std::string& desired, std::vector<Transition> candidates);

    const std::string& desired() const { return desired_; }
    const std::vector<Transition>& candidates() const { return candidates_; }

private:
    std::string desired_;
    std::vector<Transition> candidates_;
};
