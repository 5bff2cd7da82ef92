#include "report_publisher.hpp"
#include "schema_tracker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ReportPublisher::ReportPublisher(std::shared_ptr<ReportCache> cache,
                                 const ReportBuilder& builder,
                                 const SessionCalendar& calendar,
                                 int ttl_seconds)
    : cache_(cache), builder_(builder), calendar_(calendar), ttl_seconds_(ttl_seconds) {}

std::string ReportPublisher::report_key(const std::string& asset_id, const std::string& period) {
    return "analytics:" + asset_id + ":" + period;
}

std::string ReportPublisher::available_periods_key(const std::string& asset_id) {
    return "analytics:" + asset_id + ":available_periods";
}

nlohmann::json ReportPublisher::envelope(const std::string& asset_id,
                                         const std::string& report_type,
                                         const nlohmann::json& payload,
                                         int64_t computed_at_ms) {
    return {
        {"asset", asset_id},
        {"report_type", report_type},
        {"schema_version", SchemaTracker::kSchemaVersion},
        {"computed_at", util::iso8601_from_ms(computed_at_ms)},
        {"computed_at_ms", computed_at_ms},
        {"payload", payload}
    };
}

void ReportPublisher::publish(const std::string& asset_id, const std::string& report_type,
                              const nlohmann::json& payload, int64_t computed_at_ms) {
    auto body = envelope(asset_id, report_type, payload, computed_at_ms).dump();
    cache_->publish(report_key(asset_id, report_type), body, ttl_seconds_);
}

std::vector<std::string> ReportPublisher::publish_asset(const std::string& asset_id,
                                                        const std::vector<SessionMetric>& metrics,
                                                        int64_t now_ms) {
    std::vector<std::string> published;
    if (metrics.empty()) {
        spdlog::warn("{}: no session metrics, nothing to publish", asset_id);
        return published;
    }

    const SessionDate today = calendar_.session_date_of(now_ms);
    const SessionDate first_stored = metrics.front().session_date;

    for (const auto& period : ReportBuilder::periods()) {
        auto range = builder_.period_range(period, today);
        if (!range) continue;

        // A fixed window longer than the asset's history would mislabel it
        if (period != "YTD" && range->first < first_stored) continue;

        std::vector<SessionMetric> in_range;
        for (const auto& m : metrics) {
            if (m.session_date >= range->first && m.session_date <= range->last) {
                in_range.push_back(m);
            }
        }
        if (in_range.empty()) continue;

        publish(asset_id, period, builder_.build(asset_id, in_range), now_ms);
        published.push_back(period);
    }

    cache_->publish(available_periods_key(asset_id), nlohmann::json(published).dump(), ttl_seconds_);
    spdlog::info("{}: published {} reports", asset_id, published.size());
    return published;
}

void ReportPublisher::publish_asset_index(const std::vector<std::string>& assets) {
    cache_->publish(kAssetsKey, nlohmann::json(assets).dump(), 0);
}
