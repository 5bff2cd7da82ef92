#pragma once

#include "config.hpp"
#include "ib_model.hpp"
#include "seasonality.hpp"
#include "timing.hpp"
#include <optional>
#include <string>
#include <vector>

// Composes the model outputs into one analytics report per period.
class ReportBuilder {
public:
    explicit ReportBuilder(const Config& config);

    // YTD (all history) first, then the fixed look-back windows
    static const std::vector<std::string>& periods();

    // Dates a period covers as of `today`; the window ends on the previous day
    std::optional<DateRange> period_range(const std::string& period, SessionDate today) const;

    // `metrics` already restricted to the period, ascending by date
    nlohmann::json build(const std::string& asset_id,
                         const std::vector<SessionMetric>& metrics) const;

private:
    IbModel ib_;
    SeasonalityModel seasonality_;
    TimingModel timing_;
    SessionDate history_floor_;

    nlohmann::json window_json(const IbWindowStats& stats,
                               const std::vector<WeekdayBucket>& weekdays,
                               const TimingWindowGrids& grids,
                               bool full_day) const;
};
