#pragma once

#include "types.hpp"
#include <vector>
#include <string>

struct WeekdayWindowStats {
    int sessions_count = 0;
    double two_sided_prob = 0.0;
    double hit_05x_prob = 0.0;
    double hit_1x_prob = 0.0;
    double hit_2x_prob = 0.0;

    // Same targets with two-sided days removed
    int clean_sessions_count = 0;
    double clean_hit_05x_prob = 0.0;
    double clean_hit_1x_prob = 0.0;
    double clean_hit_2x_prob = 0.0;
};

struct WeekdayBucket {
    std::string weekday;
    int sessions_count = 0;
    double mean_range_pct = 0.0;
    double median_range_pct = 0.0;
    double bullish_share = 0.0;  // close > open, percent
    double mean_return_pct = 0.0;
    bool low_confidence = true;

    WeekdayWindowStats session;
    WeekdayWindowStats full_day;
};

class SeasonalityModel {
public:
    SeasonalityModel(int min_bucket_sessions = 5, bool include_weekends = false);

    // Monday first; Saturday and Sunday only when weekends are sessions
    std::vector<WeekdayBucket> compute(const std::vector<SessionMetric>& metrics) const;

    // {"Monday": {...}, ...} views in the published report layout
    static nlohmann::json chop_json(const std::vector<WeekdayBucket>& buckets, bool full_day);
    static nlohmann::json targets_json(const std::vector<WeekdayBucket>& buckets, bool full_day);
    static nlohmann::json targets_clean_json(const std::vector<WeekdayBucket>& buckets, bool full_day);
    static nlohmann::json profile_json(const std::vector<WeekdayBucket>& buckets);

private:
    int min_bucket_sessions_;
    bool include_weekends_;
};
