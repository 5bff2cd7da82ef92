#include "report_builder.hpp"
#include "schema_tracker.hpp"
#include "util.hpp"

ReportBuilder::ReportBuilder(const Config& config)
    : ib_(config.min_sample_sessions)
    , seasonality_(config.min_bucket_sessions, !config.skip_weekends)
    , timing_(config.ib_end_minute, config.session_end_minute, config.day_close_minute,
              config.heatmap_bucket_minutes, config.min_sample_sessions)
    , history_floor_(util::parse_date(config.earliest_date).value_or(0)) {}

const std::vector<std::string>& ReportBuilder::periods() {
    static const std::vector<std::string> names = {
        "YTD",
        "last_730_days",
        "last_365_days",
        "last_180_days",
        "last_90_days",
        "last_60_days",
        "last_30_days",
        "last_14_days",
        "last_7_days",
    };
    return names;
}

std::optional<DateRange> ReportBuilder::period_range(const std::string& period,
                                                     SessionDate today) const {
    DateRange range{0, today - 1};

    if (period == "YTD") {
        range.first = history_floor_;
        return range;
    }

    // last_<N>_days
    auto parts = util::split(period, '_');
    if (parts.size() != 3 || parts[0] != "last" || parts[2] != "days") return std::nullopt;
    try {
        int days = std::stoi(parts[1]);
        if (days <= 0) return std::nullopt;
        range.first = today - days;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return range;
}

nlohmann::json ReportBuilder::window_json(const IbWindowStats& stats,
                                          const std::vector<WeekdayBucket>& weekdays,
                                          const TimingWindowGrids& grids,
                                          bool full_day) const {
    nlohmann::json out = IbModel::to_json(stats);
    out["weekday_chop"] = SeasonalityModel::chop_json(weekdays, full_day);
    out["weekday_targets"] = SeasonalityModel::targets_json(weekdays, full_day);
    out["weekday_targets_clean"] = SeasonalityModel::targets_clean_json(weekdays, full_day);
    out["time_heatmap"] = TimingModel::to_json(grids.events);
    out["time_heatmap_clean"] = TimingModel::to_json(grids.events_clean);
    return out;
}

nlohmann::json ReportBuilder::build(const std::string& asset_id,
                                    const std::vector<SessionMetric>& metrics) const {
    auto ib = ib_.compute(metrics);
    auto weekdays = seasonality_.compute(metrics);
    auto timing = timing_.compute(metrics);

    nlohmann::json report = {
        {"symbol", asset_id},
        {"schema_version", SchemaTracker::kSchemaVersion},
        {"total_days_analyzed", ib.sessions},
        {"low_confidence", ib.low_confidence},
        {"period_start", metrics.empty() ? nlohmann::json(nullptr)
                                         : nlohmann::json(util::format_date(metrics.front().session_date))},
        {"period_end", metrics.empty() ? nlohmann::json(nullptr)
                                       : nlohmann::json(util::format_date(metrics.back().session_date))},
        {"prob_return_to_ib_after_session", ib.prob_return_to_ib_after_session},
        {"avg_ib_range_usd", ib.avg_ib_range_usd},
        {"avg_ib_range_pct", ib.avg_ib_range_pct},
        {"avg_ib_volume", ib.avg_ib_volume},
        {"weekday_profile", SeasonalityModel::profile_json(weekdays)},
        {"day_extreme_heatmap", TimingModel::to_json(timing.day_extremes)}
    };

    report["session"] = window_json(ib.session, weekdays, timing.session, false);
    report["full_day"] = window_json(ib.full_day, weekdays, timing.full_day, true);
    return report;
}
