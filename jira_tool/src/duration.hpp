#pragma once
#include <cstdint>
#include <string>

// Work-time duration using the tracker's convention: 1w = 5d, 1d = 8h.
class Duration {
public:
    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = 3600;
    static constexpr int64_t SECONDS_PER_DAY = 8 * SECONDS_PER_HOUR;
    static constexpr int64_t SECONDS_PER_WEEK = 5 * SECONDS_PER_DAY;

    // Parses expressions like "2h 30m", "1w 2d", "45M". Whitespace and case
    // are ignored, tokens may come in any order and repeated units add up.
    // Throws InvalidDurationError on leftover text or a zero total.
    static Duration parse(const std::string& input);

    int64_t seconds() const { return seconds_; }

private:
    explicit Duration(int64_t seconds) : seconds_(seconds) {}

    int64_t seconds_;
};
