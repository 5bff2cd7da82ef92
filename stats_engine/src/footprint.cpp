#include "footprint.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <functional>

namespace {

struct TimedCandle {
    const Candle* candle;
    int minute;
};

struct WindowStats {
    bool empty = true;
    double high = -std::numeric_limits<double>::infinity();
    double low = std::numeric_limits<double>::infinity();
    double last_close = 0.0;
};

WindowStats window_stats(const std::vector<TimedCandle>& window) {
    WindowStats s;
    for (const auto& tc : window) {
        s.empty = false;
        s.high = std::max(s.high, tc.candle->high);
        s.low = std::min(s.low, tc.candle->low);
        s.last_close = tc.candle->close;
    }
    return s;
}

nlohmann::json first_time(const std::vector<TimedCandle>& window,
                          const std::function<bool(const Candle&)>& pred) {
    for (const auto& tc : window) {
        if (pred(*tc.candle)) return util::format_hhmm(tc.minute);
    }
    return nullptr;
}

// Per-window IB interaction: breaks, false breaks, extension targets,
// prior levels and mid retest, written under `prefix`.
void add_window_metrics(nlohmann::json& out, const std::string& prefix,
                        const std::vector<TimedCandle>& window,
                        double ib_high, double ib_low, double ib_range,
                        const std::optional<PriorSession>& prior) {
    auto s = window_stats(window);

    bool high_broken = !s.empty && s.high > ib_high;
    bool low_broken = !s.empty && s.low < ib_low;
    bool closed_inside = !s.empty && s.last_close >= ib_low && s.last_close <= ib_high;

    out[prefix + "high_broken"] = high_broken;
    out[prefix + "low_broken"] = low_broken;
    out[prefix + "false_break_high"] = high_broken && closed_inside;
    out[prefix + "false_break_low"] = low_broken && closed_inside;

    auto hit = [&](double k) {
        return !s.empty && (s.high >= ib_high + k * ib_range || s.low <= ib_low - k * ib_range);
    };
    out[prefix + "ext_05x"] = hit(0.5);
    out[prefix + "ext_1x"] = hit(1.0);
    out[prefix + "ext_2x"] = hit(2.0);

    double coeff = 0.0;
    if (!s.empty && ib_range > 0.0) {
        double up = std::max(0.0, s.high - ib_high);
        double down = std::max(0.0, ib_low - s.low);
        coeff = util::round_to(std::max(up, down) / ib_range, 2);
    }
    out[prefix + "ext_coeff"] = coeff;

    out[prefix + "hit_pdh"] = prior.has_value() && !s.empty && s.high >= prior->high;
    out[prefix + "hit_pdl"] = prior.has_value() && !s.empty && s.low <= prior->low;

    // Mid touched at or after the first candle trading outside the IB
    double mid = (ib_high + ib_low) / 2.0;
    bool broken = false;
    bool hit_mid = false;
    for (const auto& tc : window) {
        const Candle& c = *tc.candle;
        if (!broken && (c.high > ib_high || c.low < ib_low)) broken = true;
        if (broken && c.low <= mid && c.high >= mid) {
            hit_mid = true;
            break;
        }
    }
    out[prefix + "hit_ib_mid"] = hit_mid;
}

} // namespace

FootprintBuilder::FootprintBuilder(const SessionCalendar& calendar, const SessionWindows& windows,
                                   int min_candles)
    : calendar_(calendar), windows_(windows), min_candles_(min_candles) {}

std::optional<PriorSession> FootprintBuilder::summarize_prior(
    const std::vector<Candle>& candles) const {
    if (static_cast<int>(candles.size()) < min_candles_) return std::nullopt;

    PriorSession prior{candles.front().high, candles.front().low};
    for (const auto& c : candles) {
        prior.high = std::max(prior.high, c.high);
        prior.low = std::min(prior.low, c.low);
    }
    return prior;
}

FootprintOutcome FootprintBuilder::build(const std::string& asset_id, SessionDate date,
                                         const std::vector<Candle>& candles,
                                         const std::optional<PriorSession>& prior) const {
    FootprintOutcome outcome;

    std::vector<TimedCandle> day;
    day.reserve(candles.size());
    for (const auto& c : candles) {
        if (calendar_.session_date_of(c.timestamp_ms) != date) continue;
        day.push_back({&c, calendar_.minute_of_day(c.timestamp_ms)});
    }
    std::sort(day.begin(), day.end(), [](const TimedCandle& a, const TimedCandle& b) {
        return a.candle->timestamp_ms < b.candle->timestamp_ms;
    });

    if (static_cast<int>(day.size()) < min_candles_) {
        outcome.skip_reason = kSkipInsufficient;
        return outcome;
    }

    std::vector<TimedCandle> ib, post_session, post_full, after_hours;
    for (const auto& tc : day) {
        if (tc.minute >= windows_.ib_start_minute && tc.minute <= windows_.ib_end_minute) {
            ib.push_back(tc);
        }
        if (tc.minute > windows_.ib_end_minute && tc.minute <= windows_.day_close_minute) {
            post_full.push_back(tc);
            if (tc.minute <= windows_.session_end_minute) post_session.push_back(tc);
        }
        if (tc.minute > windows_.session_end_minute && tc.minute <= windows_.day_close_minute) {
            after_hours.push_back(tc);
        }
    }

    if (ib.empty()) {
        outcome.skip_reason = kSkipNoIb;
        return outcome;
    }

    nlohmann::json m = nlohmann::json::object();

    // Day aggregates
    auto day_stats = window_stats(day);
    double volume = 0.0;
    for (const auto& tc : day) volume += tc.candle->volume;

    m["open"] = day.front().candle->open;
    m["high"] = day_stats.high;
    m["low"] = day_stats.low;
    m["close"] = day_stats.last_close;
    m["range"] = day_stats.high - day_stats.low;
    m["volume"] = volume;

    // Initial balance
    auto ib_stats = window_stats(ib);
    double ib_high = ib_stats.high;
    double ib_low = ib_stats.low;
    double ib_range = ib_high - ib_low;

    double ib_open = day.front().candle->open;
    if (ib.front().minute == windows_.ib_start_minute) ib_open = ib.front().candle->open;

    double ib_vol = 0.0;
    for (const auto& tc : ib) ib_vol += tc.candle->volume;

    m["ib_high"] = ib_high;
    m["ib_low"] = ib_low;
    m["ib_range"] = ib_range;
    m["ib_range_usd"] = util::round_to(ib_range, 4);
    m["ib_range_pct"] = ib_open == 0.0 ? 0.0 : util::round_to(ib_range / ib_open * 100.0, 4);
    m["ib_vol"] = ib_vol;

    add_window_metrics(m, "session_", post_session, ib_high, ib_low, ib_range, prior);
    add_window_metrics(m, "full_", post_full, ib_high, ib_low, ib_range, prior);

    if (prior) {
        m["pdh"] = prior->high;
        m["pdl"] = prior->low;
    } else {
        m["pdh"] = nullptr;
        m["pdl"] = nullptr;
    }

    auto ah = window_stats(after_hours);
    m["after_hours_hit_ib"] = !ah.empty && ah.low <= ib_high && ah.high >= ib_low;

    // Event times over the post-IB full day
    m["time_break_high"] = first_time(post_full, [&](const Candle& c) { return c.high > ib_high; });
    m["time_break_low"] = first_time(post_full, [&](const Candle& c) { return c.low < ib_low; });

    auto target_time = [&](double k) {
        return first_time(post_full, [&](const Candle& c) {
            return c.high >= ib_high + k * ib_range || c.low <= ib_low - k * ib_range;
        });
    };
    m["time_hit_05x"] = target_time(0.5);
    m["time_hit_1x"] = target_time(1.0);
    m["time_hit_2x"] = target_time(2.0);

    m["time_day_high"] = first_time(day, [&](const Candle& c) { return c.high == day_stats.high; });
    m["time_day_low"] = first_time(day, [&](const Candle& c) { return c.low == day_stats.low; });

    SessionMetric metric;
    metric.asset_id = asset_id;
    metric.session_date = date;
    metric.fields = std::move(m);
    outcome.metric = std::move(metric);
    return outcome;
}
