#include "schema_tracker.hpp"

const std::vector<std::string>& SchemaTracker::expected_keys() {
    static const std::vector<std::string> keys = {
        // Day aggregates
        "open", "high", "low", "close", "range", "volume",

        // Initial balance
        "ib_high", "ib_low", "ib_range", "ib_range_usd", "ib_range_pct", "ib_vol",

        // Post-IB session window
        "session_high_broken", "session_low_broken",
        "session_false_break_high", "session_false_break_low",
        "session_ext_05x", "session_ext_1x", "session_ext_2x", "session_ext_coeff",
        "session_hit_pdh", "session_hit_pdl", "session_hit_ib_mid",

        // Post-IB full day window
        "full_high_broken", "full_low_broken",
        "full_false_break_high", "full_false_break_low",
        "full_ext_05x", "full_ext_1x", "full_ext_2x", "full_ext_coeff",
        "full_hit_pdh", "full_hit_pdl", "full_hit_ib_mid",

        // Prior session and after hours
        "pdh", "pdl", "after_hours_hit_ib",

        // Event times, HH:MM or null
        "time_break_high", "time_break_low",
        "time_hit_05x", "time_hit_1x", "time_hit_2x",
        "time_day_high", "time_day_low",
    };
    return keys;
}

std::vector<std::string> SchemaTracker::diff(const nlohmann::json& fields,
                                             const std::vector<std::string>& expected) {
    std::vector<std::string> missing;
    for (const auto& key : expected) {
        if (!fields.is_object() || !fields.contains(key)) {
            missing.push_back(key);
        }
    }
    return missing;
}

std::set<std::string> SchemaTracker::drifted_keys(const std::vector<SessionMetric>& metrics,
                                                  const std::vector<std::string>& expected) {
    std::set<std::string> drifted;
    for (const auto& m : metrics) {
        for (auto& key : diff(m.fields, expected)) {
            drifted.insert(std::move(key));
        }
    }
    return drifted;
}

nlohmann::json SchemaTracker::missing_patch(const nlohmann::json& existing,
                                            const nlohmann::json& computed,
                                            const std::vector<std::string>& expected) {
    nlohmann::json patch = nlohmann::json::object();
    for (const auto& key : diff(existing, expected)) {
        auto it = computed.find(key);
        if (it != computed.end()) {
            patch[key] = *it;
        }
    }
    return patch;
}
