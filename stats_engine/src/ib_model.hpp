#pragma once

#include "types.hpp"
#include <vector>
#include <string>

// Breakout statistics for one post-IB window (session or full day).
// Chances and probabilities are percentages rounded to 1dp.
struct IbWindowStats {
    int sessions = 0;
    double break_high_chance = 0.0;
    double break_low_chance = 0.0;
    double one_sided_chance = 0.0;
    double two_sided_chance = 0.0;
    double no_breakout_chance = 0.0;

    int high_breaks = 0;
    int low_breaks = 0;
    double false_break_high_rate = 0.0;  // share of high breaks that closed back inside
    double false_break_low_rate = 0.0;

    double prob_hit_05x = 0.0;
    double prob_hit_1x = 0.0;
    double prob_hit_2x = 0.0;
    double avg_extension_coeff = 0.0;  // 2dp

    int prior_sessions = 0;  // sessions with a known PDH/PDL
    double prob_hit_pdh = 0.0;
    double prob_hit_pdl = 0.0;
    double prob_pdh_if_ibh_broken = 0.0;
    double prob_pdl_if_ibl_broken = 0.0;

    int breakout_sessions = 0;
    double prob_ib_mid_retest = 0.0;

    bool low_confidence = true;
};

struct IbModelResult {
    int sessions = 0;
    bool low_confidence = true;

    double avg_ib_range_usd = 0.0;  // 2dp
    double avg_ib_range_pct = 0.0;  // 3dp
    int64_t avg_ib_volume = 0;
    double prob_return_to_ib_after_session = 0.0;

    IbWindowStats session;
    IbWindowStats full_day;
};

class IbModel {
public:
    explicit IbModel(int min_sample_sessions = 20);

    IbModelResult compute(const std::vector<SessionMetric>& metrics) const;

    static nlohmann::json to_json(const IbWindowStats& stats);

private:
    int min_sample_sessions_;

    IbWindowStats compute_window(const std::vector<SessionMetric>& metrics,
                                 const std::string& prefix) const;
};

// Missing or null fields read as false / 0 so drifted rows never throw
namespace metric_fields {
    bool flag(const nlohmann::json& fields, const std::string& key);
    double number(const nlohmann::json& fields, const std::string& key);
    bool has_value(const nlohmann::json& fields, const std::string& key);
    double percent(int count, int total);
}
