#pragma once
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>

class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool color_out, bool color_err);

    // std::cout / std::cerr, coloured only when attached to a terminal
    static Console standard();
    static bool supports_color(int fd);

    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }

    void line(const std::string& text = "");
    void success(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    // Prints the failure and, for the transition kinds, the names the user
    // can pick from on the next attempt
    void report(const JiraError& failure);

private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_out_;
    bool color_err_;
};

std::string format_issue(const nlohmann::json& issue);
std::string format_remaining_estimate(int64_t seconds);
std::string trim_text(const std::string& text, size_t max_length);
