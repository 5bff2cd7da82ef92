#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    constexpr int64_t kMsPerMinute = 60 * 1000;
    constexpr int64_t kMsPerDay = 24 * 60 * kMsPerMinute;

    std::string iso8601_from_ms(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::vector<std::string> split(const std::string& str, char delim);
    int random_jitter(int min_ms, int max_ms);
    std::string redact_dsn(const std::string& dsn);

    int64_t floor_div(int64_t a, int64_t b);

    // Civil calendar <-> days since 1970-01-01 (proleptic Gregorian)
    int days_from_civil(int year, unsigned month, unsigned day);
    void civil_from_days(int days, int& year, unsigned& month, unsigned& day);
    int weekday_index(int days);  // 0 = Monday .. 6 = Sunday
    std::string weekday_name(int weekday);

    std::string format_date(int days);
    std::optional<int> parse_date(const std::string& text);

    std::optional<int> parse_hhmm(const std::string& text);  // minutes of day
    std::string format_hhmm(int minute_of_day);

    double round_to(double value, int decimals);
}
