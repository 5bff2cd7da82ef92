#pragma once

#include "interfaces.hpp"
#include "report_builder.hpp"
#include "session_calendar.hpp"
#include <memory>
#include <string>
#include <vector>

// Serializes reports into the cache envelope and publishes them with one SET each.
class ReportPublisher {
public:
    ReportPublisher(std::shared_ptr<ReportCache> cache,
                    const ReportBuilder& builder,
                    const SessionCalendar& calendar,
                    int ttl_seconds = 0);

    void publish(const std::string& asset_id, const std::string& report_type,
                 const nlohmann::json& payload, int64_t computed_at_ms);

    // Every period the asset's history covers, plus its available_periods list.
    // Returns the published period names.
    std::vector<std::string> publish_asset(const std::string& asset_id,
                                           const std::vector<SessionMetric>& metrics,
                                           int64_t now_ms);

    void publish_asset_index(const std::vector<std::string>& assets);

    static std::string report_key(const std::string& asset_id, const std::string& period);
    static std::string available_periods_key(const std::string& asset_id);
    static constexpr const char* kAssetsKey = "analytics:assets";

    static nlohmann::json envelope(const std::string& asset_id, const std::string& report_type,
                                   const nlohmann::json& payload, int64_t computed_at_ms);

private:
    std::shared_ptr<ReportCache> cache_;
    ReportBuilder builder_;
    SessionCalendar calendar_;
    int ttl_seconds_;
};
