#include "output.hpp"
#include "json_schemas.hpp"
#include <fmt/color.h>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <unistd.h>

namespace {

constexpr size_t kDescriptionLimit = 500;
constexpr const char* kNotAvailable = "N/A";

std::string paint(bool enabled, fmt::terminal_color color, const std::string& text) {
    if (!enabled) {
        return text;
    }
    return fmt::format(fmt::fg(color), "{}", text);
}

}

Console::Console(std::ostream& out, std::ostream& err, bool color_out, bool color_err)
    : out_(out), err_(err), color_out_(color_out), color_err_(color_err) {}

Console Console::standard() {
    return Console(std::cout, std::cerr, supports_color(STDOUT_FILENO), supports_color(STDERR_FILENO));
}

bool Console::supports_color(int fd) {
    const char* term = std::getenv("TERM");
    if (term == nullptr || std::string_view(term) == "dumb") {
        return false;
    }
    return isatty(fd) != 0;
}

void Console::line(const std::string& text) {
    out_ << text << '\n';
}

void Console::success(const std::string& message) {
    out_ << paint(color_out_, fmt::terminal_color::green, "✅ SUCCESS: " + message) << '\n';
}

void Console::error(const std::string& message) {
    err_ << paint(color_err_, fmt::terminal_color::red, "❌ ERROR: " + message) << '\n';
}

void Console::fatal(const std::string& message) {
    err_ << paint(color_err_, fmt::terminal_color::red, "💀 FATAL: " + message) << '\n';
}

void Console::report(const JiraError& failure) {
    switch (failure.kind()) {
        case ErrorKind::HTTP_ERROR: {
            const auto& http = static_cast<const HttpError&>(failure);
            error(fmt::format("JIRA API returned HTTP {}", http.status()));
            fatal("API Error: " + http.message());
            break;
        }
        case ErrorKind::NO_MATCHING_TRANSITION: {
            const auto& none = static_cast<const NoMatchingTransitionError&>(failure);
            error(none.what());
            err_ << "Available transitions:\n";
            for (const auto& name : none.available()) {
                err_ << "  - " << name << '\n';
            }
            break;
        }
        case ErrorKind::AMBIGUOUS_TRANSITION: {
            const auto& ambiguous = static_cast<const AmbiguousTransitionError&>(failure);
            error(ambiguous.what());
            for (const auto& candidate : ambiguous.candidates()) {
                err_ << fmt::format("  - {} (ID: {})\n", candidate.to_status, candidate.id);
            }
            break;
        }
        case ErrorKind::MISSING_CREDENTIALS: {
            const auto& missing = static_cast<const MissingCredentialsError&>(failure);
            error("Missing required environment variables:");
            for (const auto& name : missing.missing()) {
                err_ << "  - " << name << '\n';
            }
            err_ << "\nPlease either:\n"
                 << "  1. Create a .env file with the required variables\n"
                 << "  2. Set the variables in your environment\n";
            break;
        }
        default:
            fatal(failure.what());
            break;
    }
}

std::string trim_text(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length) + "...";
}

std::string format_remaining_estimate(int64_t seconds) {
    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;

    if (hours > 0 && minutes > 0) {
        return fmt::format("{}h {}m", hours, minutes);
    }
    if (hours > 0) {
        return fmt::format("{}h", hours);
    }
    if (minutes > 0) {
        return fmt::format("{}m", minutes);
    }
    return "0m";
}

std::string format_issue(const nlohmann::json& issue) {
    std::string key = json_field(issue, ".key", kNotAvailable);
    std::string summary = json_field(issue, ".fields.summary", kNotAvailable);
    std::string status = json_field(issue, ".fields.status.name", kNotAvailable);
    std::string assignee = json_field(issue, ".fields.assignee.displayName", kNotAvailable);
    std::string reporter = json_field(issue, ".fields.reporter.displayName", kNotAvailable);
    std::string story_points = json_field(issue, ".fields.customfield_10016", kNotAvailable);
    std::string issue_type = json_field(issue, ".fields.issuetype.name", kNotAvailable);
    std::string priority = json_field(issue, ".fields.priority.name", kNotAvailable);
    std::string created = json_field(issue, ".fields.created", kNotAvailable);
    std::string updated = json_field(issue, ".fields.updated", kNotAvailable);
    std::string description = json_field(issue, ".renderedFields.description // .fields.description", kNotAvailable);

    std::string text;
    text += "📋 JIRA Issue Details\n";
    text += "===================\n\n";
    text += fmt::format("🔑 Key:          {}\n", key);
    text += fmt::format("📝 Summary:      {}\n", summary);
    text += fmt::format("📊 Status:       {}\n", status);
    text += fmt::format("📋 Type:         {}\n", issue_type);
    text += fmt::format("⚡ Priority:     {}\n", priority);
    text += fmt::format("👤 Assignee:     {}\n", assignee);
    text += fmt::format("📧 Reporter:     {}\n", reporter);
    if (story_points != kNotAvailable) {
        text += fmt::format("📈 Story Points: {}\n", story_points);
    }
    text += fmt::format("📅 Created:      {}\n", created);
    text += fmt::format("🔄 Updated:      {}\n\n", updated);

    if (description != kNotAvailable) {
        text += "📄 Description:\n";
        text += "---------------\n";
        text += trim_text(description, kDescriptionLimit) + "\n\n";
    }

    return text;
}
