#pragma once

#include "session_calendar.hpp"
#include "types.hpp"
#include <vector>
#include <optional>
#include <string>

struct SessionWindows {
    int ib_start_minute;
    int ib_end_minute;       // inclusive
    int session_end_minute;  // inclusive
    int day_close_minute;    // inclusive
};

struct PriorSession {
    double high;
    double low;
};

struct FootprintOutcome {
    std::optional<SessionMetric> metric;
    std::string skip_reason;  // set when metric is empty
};

// Aggregates one closed session's candles into its metric record.
class FootprintBuilder {
public:
    FootprintBuilder(const SessionCalendar& calendar, const SessionWindows& windows,
                     int min_candles);

    FootprintOutcome build(const std::string& asset_id, SessionDate date,
                           const std::vector<Candle>& candles,
                           const std::optional<PriorSession>& prior) const;

    // Day extremes of a candidate prior session, if it has enough candles
    std::optional<PriorSession> summarize_prior(const std::vector<Candle>& candles) const;

    static constexpr const char* kSkipInsufficient = "insufficient_candles";
    static constexpr const char* kSkipNoIb = "no_ib_candles";

private:
    SessionCalendar calendar_;
    SessionWindows windows_;
    int min_candles_;
};
