#pragma once

#include "types.hpp"
#include <vector>
#include <string>
#include <map>

// Share of events per time bucket, keyed "HH:MM" (bucket start), 1dp.
struct TimeGrid {
    std::map<std::string, double> buckets;
    int total_events = 0;
    bool low_confidence = true;
};

struct TimingWindowGrids {
    std::map<std::string, TimeGrid> events;        // breakout, hit_05x, hit_1x, hit_2x
    std::map<std::string, TimeGrid> events_clean;  // two-sided days removed
};

struct TimingResult {
    TimingWindowGrids session;
    TimingWindowGrids full_day;
    std::map<std::string, TimeGrid> day_extremes;  // day_high, day_low over the whole day
};

class TimingModel {
public:
    TimingModel(int ib_end_minute, int session_end_minute, int day_close_minute,
                int bucket_minutes = 30, int min_sample_events = 20);

    TimingResult compute(const std::vector<SessionMetric>& metrics) const;

    static nlohmann::json to_json(const TimeGrid& grid);
    static nlohmann::json to_json(const std::map<std::string, TimeGrid>& grids);

private:
    int ib_end_minute_;
    int session_end_minute_;
    int day_close_minute_;
    int bucket_minutes_;
    int min_sample_events_;

    TimeGrid build_grid(const std::vector<int>& event_minutes,
                        int first_minute, int last_minute) const;
};
