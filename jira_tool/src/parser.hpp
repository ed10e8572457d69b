#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class CommandType {
    GET,
    STATUS,
    COMMENT,
    TIME,
    HELP
};

struct ParsedCommand {
    CommandType type = CommandType::HELP;
    std::string name;
    std::vector<std::string> args;
    bool raw = false;
    bool list = false;
    bool help = false;

    std::optional<std::string> get_arg(size_t index) const;
};

// Command-line misuse. show_usage asks the caller to print the global usage.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message, bool show_usage = false)
        : std::runtime_error(message), show_usage_(show_usage) {}

    bool show_usage() const { return show_usage_; }

private:
    bool show_usage_;
};

class CommandParser {
public:
    // argv without the program name. Throws UsageError.
    static ParsedCommand parse(const std::vector<std::string>& argv);

    static std::string usage_text(const std::string& program);
    static std::string general_help(const std::string& program);
    static std::string command_help(CommandType type, const std::string& program);

private:
    static std::optional<CommandType> command_type(const std::string& name);
    static void check_arguments(const ParsedCommand& cmd);
};
