#pragma once

#include "config.hpp"
#include "types.hpp"
#include <vector>
#include <optional>
#include <cstdint>

// Exchange-local clock: fixed base offset plus an optional US daylight
// saving rule. Maps UTC timestamps to session dates and minutes of day.
class SessionCalendar {
public:
    explicit SessionCalendar(const Config& config);
    SessionCalendar(int utc_offset_minutes, bool us_dst, int day_close_minute,
                    int close_grace_minutes, bool skip_weekends);

    int offset_minutes_at(int64_t utc_ms) const;
    SessionDate session_date_of(int64_t utc_ms) const;
    int minute_of_day(int64_t utc_ms) const;

    // UTC instant of a local wall-clock minute on the given date
    int64_t to_utc_ms(SessionDate date, int minute_of_day) const;

    int64_t day_start_ms(SessionDate date) const;
    int64_t day_end_ms(SessionDate date) const;  // exclusive
    int64_t close_ms(SessionDate date) const;    // end of the DAY_CLOSE minute

    bool is_trading_day(SessionDate date) const;
    std::vector<SessionDate> trading_days(SessionDate first, SessionDate last) const;
    std::optional<SessionDate> previous_trading_day(SessionDate date, int max_lookback_days) const;

    // Newest trading date that is over (clock past close + grace) and fully
    // ingested (raw data reaches the last interval before close).
    std::optional<SessionDate> latest_closed_session(int64_t now_ms,
                                                     std::optional<int64_t> last_ingested_ms,
                                                     int64_t interval_ms) const;

private:
    int base_offset_minutes_;
    bool us_dst_;
    int day_close_minute_;
    int close_grace_minutes_;
    bool skip_weekends_;

    bool is_dst(int64_t utc_ms) const;
};
