#include "duration.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cctype>
#include <limits>
#include <optional>

namespace {

struct Token {
    size_t pos;
    size_t length;
    int64_t value;
    char unit;
};

std::optional<int64_t> unit_seconds(char unit) {
    switch (unit) {
        case 'w': return Duration::SECONDS_PER_WEEK;
        case 'd': return Duration::SECONDS_PER_DAY;
        case 'h': return Duration::SECONDS_PER_HOUR;
        case 'm': return Duration::SECONDS_PER_MINUTE;
        default: return std::nullopt;
    }
}

// Leftmost run of digits that is immediately followed by a unit letter.
// Returns nullopt when no such token remains or the number overflows.
std::optional<Token> next_token(const std::string& text, bool& overflow) {
    size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i == text.size() || !unit_seconds(text[i])) {
            continue;
        }

        int64_t value = 0;
        for (size_t k = start; k < i; ++k) {
            int digit = text[k] - '0';
            if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
                overflow = true;
                return std::nullopt;
            }
            value = value * 10 + digit;
        }
        return Token{start, i - start + 1, value, text[i]};
    }
    return std::nullopt;
}

}

Duration Duration::parse(const std::string& input) {
    std::string remaining;
    for (char c : util::to_lower(input)) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            remaining += c;
        }
    }

    int64_t total = 0;
    bool overflow = false;
    while (auto token = next_token(remaining, overflow)) {
        int64_t factor = *unit_seconds(token->unit);
        if (token->value > (std::numeric_limits<int64_t>::max() - total) / factor) {
            overflow = true;
            break;
        }
        total += token->value * factor;
        remaining.erase(token->pos, token->length);
    }

    if (overflow) {
        throw InvalidDurationError("Invalid time duration: '" + input + "' is too large");
    }

    if (!remaining.empty()) {
        throw InvalidDurationError("Invalid time format: '" + input +
                                   "'. Use format like '2h 30m', '1d 4h', '3w 2d 5h 15m'");
    }

    if (total == 0) {
        throw InvalidDurationError("Invalid or empty time duration: '" + input + "'");
    }

    return Duration(total);
}
