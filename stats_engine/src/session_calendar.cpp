#include "session_calendar.hpp"
#include "util.hpp"
#include <algorithm>

namespace {

// Local date of the n-th Sunday (1-based) of a month
int nth_sunday(int year, unsigned month, int n) {
    int first = util::days_from_civil(year, month, 1);
    int to_sunday = (6 - util::weekday_index(first) + 7) % 7;
    return first + to_sunday + 7 * (n - 1);
}

constexpr int kDstSwitchMinute = 2 * 60;

} // namespace

SessionCalendar::SessionCalendar(const Config& config)
    : SessionCalendar(config.exchange_utc_offset_minutes,
                      config.exchange_dst_rule == "us",
                      config.day_close_minute,
                      config.session_close_grace_minutes,
                      config.skip_weekends) {}

SessionCalendar::SessionCalendar(int utc_offset_minutes, bool us_dst, int day_close_minute,
                                 int close_grace_minutes, bool skip_weekends)
    : base_offset_minutes_(utc_offset_minutes)
    , us_dst_(us_dst)
    , day_close_minute_(day_close_minute)
    , close_grace_minutes_(close_grace_minutes)
    , skip_weekends_(skip_weekends) {}

bool SessionCalendar::is_dst(int64_t utc_ms) const {
    if (!us_dst_) return false;

    int64_t standard_local = utc_ms + base_offset_minutes_ * util::kMsPerMinute;
    int year;
    unsigned month, day;
    util::civil_from_days(static_cast<int>(util::floor_div(standard_local, util::kMsPerDay)),
                    year, month, day);

    // Second Sunday of March 02:00 standard time .. first Sunday of November 02:00 daylight time
    int64_t start_local = nth_sunday(year, 3, 2) * util::kMsPerDay +
                          kDstSwitchMinute * util::kMsPerMinute;
    int64_t end_local = nth_sunday(year, 11, 1) * util::kMsPerDay +
                        kDstSwitchMinute * util::kMsPerMinute;

    int64_t start_utc = start_local - base_offset_minutes_ * util::kMsPerMinute;
    int64_t end_utc = end_local - (base_offset_minutes_ + 60) * util::kMsPerMinute;
    return utc_ms >= start_utc && utc_ms < end_utc;
}

int SessionCalendar::offset_minutes_at(int64_t utc_ms) const {
    return base_offset_minutes_ + (is_dst(utc_ms) ? 60 : 0);
}

SessionDate SessionCalendar::session_date_of(int64_t utc_ms) const {
    int64_t local = utc_ms + offset_minutes_at(utc_ms) * util::kMsPerMinute;
    return static_cast<SessionDate>(util::floor_div(local, util::kMsPerDay));
}

int SessionCalendar::minute_of_day(int64_t utc_ms) const {
    int64_t local = utc_ms + offset_minutes_at(utc_ms) * util::kMsPerMinute;
    int64_t in_day = local - util::floor_div(local, util::kMsPerDay) * util::kMsPerDay;
    return static_cast<int>(in_day / util::kMsPerMinute);
}

int64_t SessionCalendar::to_utc_ms(SessionDate date, int minute_of_day) const {
    int64_t local = static_cast<int64_t>(date) * util::kMsPerDay +
                    minute_of_day * util::kMsPerMinute;

    if (us_dst_) {
        int64_t daylight = local - (base_offset_minutes_ + 60) * util::kMsPerMinute;
        if (is_dst(daylight)) return daylight;
    }
    return local - base_offset_minutes_ * util::kMsPerMinute;
}

int64_t SessionCalendar::day_start_ms(SessionDate date) const {
    return to_utc_ms(date, 0);
}

int64_t SessionCalendar::day_end_ms(SessionDate date) const {
    return to_utc_ms(date + 1, 0);
}

int64_t SessionCalendar::close_ms(SessionDate date) const {
    return to_utc_ms(date, day_close_minute_) + util::kMsPerMinute;
}

bool SessionCalendar::is_trading_day(SessionDate date) const {
    return !skip_weekends_ || util::weekday_index(date) < 5;
}

std::vector<SessionDate> SessionCalendar::trading_days(SessionDate first, SessionDate last) const {
    std::vector<SessionDate> days;
    for (SessionDate d = first; d <= last; ++d) {
        if (is_trading_day(d)) days.push_back(d);
    }
    return days;
}

std::optional<SessionDate> SessionCalendar::previous_trading_day(SessionDate date,
                                                                 int max_lookback_days) const {
    for (int back = 1; back <= max_lookback_days; ++back) {
        if (is_trading_day(date - back)) return date - back;
    }
    return std::nullopt;
}

std::optional<SessionDate> SessionCalendar::latest_closed_session(
    int64_t now_ms, std::optional<int64_t> last_ingested_ms, int64_t interval_ms) const {

    if (!last_ingested_ms) return std::nullopt;

    SessionDate newest = std::min(session_date_of(now_ms),
                                  session_date_of(*last_ingested_ms + interval_ms));

    // A week always contains a trading day, two cover any close/grace overlap
    for (SessionDate d = newest; d > newest - 14; --d) {
        if (!is_trading_day(d)) continue;

        int64_t close = close_ms(d);
        bool clock_past = now_ms >= close + close_grace_minutes_ * util::kMsPerMinute;
        bool covered = *last_ingested_ms >= close - interval_ms;
        if (clock_past && covered) return d;
    }
    return std::nullopt;
}
