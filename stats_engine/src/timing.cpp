#include "timing.hpp"
#include "ib_model.hpp"
#include "util.hpp"

using metric_fields::flag;

namespace {

const std::vector<std::pair<std::string, std::vector<std::string>>>& event_columns() {
    // A breakout on either side counts as one event each
    static const std::vector<std::pair<std::string, std::vector<std::string>>> columns = {
        {"breakout", {"time_break_high", "time_break_low"}},
        {"hit_05x", {"time_hit_05x"}},
        {"hit_1x", {"time_hit_1x"}},
        {"hit_2x", {"time_hit_2x"}},
    };
    return columns;
}

std::optional<int> event_minute(const nlohmann::json& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_string()) return std::nullopt;
    return util::parse_hhmm(it->get<std::string>());
}

bool two_sided(const nlohmann::json& fields, const std::string& prefix) {
    return flag(fields, prefix + "high_broken") && flag(fields, prefix + "low_broken");
}

} // namespace

TimingModel::TimingModel(int ib_end_minute, int session_end_minute, int day_close_minute,
                         int bucket_minutes, int min_sample_events)
    : ib_end_minute_(ib_end_minute)
    , session_end_minute_(session_end_minute)
    , day_close_minute_(day_close_minute)
    , bucket_minutes_(bucket_minutes)
    , min_sample_events_(min_sample_events) {}

TimeGrid TimingModel::build_grid(const std::vector<int>& event_minutes,
                                 int first_minute, int last_minute) const {
    TimeGrid grid;

    int first_bucket = first_minute / bucket_minutes_ * bucket_minutes_;
    int last_bucket = last_minute / bucket_minutes_ * bucket_minutes_;

    std::map<int, int> counts;
    for (int b = first_bucket; b <= last_bucket; b += bucket_minutes_) counts[b] = 0;

    for (int minute : event_minutes) {
        if (minute < first_minute || minute > last_minute) continue;
        counts[minute / bucket_minutes_ * bucket_minutes_]++;
        grid.total_events++;
    }

    for (const auto& [bucket, count] : counts) {
        grid.buckets[util::format_hhmm(bucket)] = metric_fields::percent(count, grid.total_events);
    }
    grid.low_confidence = grid.total_events < min_sample_events_;
    return grid;
}

TimingResult TimingModel::compute(const std::vector<SessionMetric>& metrics) const {
    TimingResult result;
    const int post_ib_first = ib_end_minute_ + 1;

    for (const auto& [event, columns] : event_columns()) {
        std::vector<int> all, clean_session, clean_full;

        for (const auto& m : metrics) {
            for (const auto& col : columns) {
                auto minute = event_minute(m.fields, col);
                if (!minute) continue;
                all.push_back(*minute);
                if (!two_sided(m.fields, "session_")) clean_session.push_back(*minute);
                if (!two_sided(m.fields, "full_")) clean_full.push_back(*minute);
            }
        }

        result.session.events[event] = build_grid(all, post_ib_first, session_end_minute_);
        result.full_day.events[event] = build_grid(all, post_ib_first, day_close_minute_);
        result.session.events_clean[event] =
            build_grid(clean_session, post_ib_first, session_end_minute_);
        result.full_day.events_clean[event] =
            build_grid(clean_full, post_ib_first, day_close_minute_);
    }

    std::vector<int> highs, lows;
    for (const auto& m : metrics) {
        if (auto h = event_minute(m.fields, "time_day_high")) highs.push_back(*h);
        if (auto l = event_minute(m.fields, "time_day_low")) lows.push_back(*l);
    }
    result.day_extremes["day_high"] = build_grid(highs, 0, day_close_minute_);
    result.day_extremes["day_low"] = build_grid(lows, 0, day_close_minute_);

    return result;
}

nlohmann::json TimingModel::to_json(const TimeGrid& grid) {
    nlohmann::json buckets = nlohmann::json::object();
    for (const auto& [key, pct] : grid.buckets) buckets[key] = pct;
    return {
        {"buckets", buckets},
        {"total_events", grid.total_events},
        {"low_confidence", grid.low_confidence}
    };
}

nlohmann::json TimingModel::to_json(const std::map<std::string, TimeGrid>& grids) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, grid] : grids) out[name] = to_json(grid);
    return out;
}
