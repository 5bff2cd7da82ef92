#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <set>

// Expected metric-key set of the running code and drift detection against
// what is stored.
class SchemaTracker {
public:
    static constexpr int kSchemaVersion = 3;

    static const std::vector<std::string>& expected_keys();

    // Expected keys absent from one stored metric object
    static std::vector<std::string> diff(const nlohmann::json& fields,
                                         const std::vector<std::string>& expected);

    // Union of missing keys across all rows
    static std::set<std::string> drifted_keys(const std::vector<SessionMetric>& metrics,
                                              const std::vector<std::string>& expected);

    // Only the entries of `computed` that `existing` lacks
    static nlohmann::json missing_patch(const nlohmann::json& existing,
                                        const nlohmann::json& computed,
                                        const std::vector<std::string>& expected);
};
