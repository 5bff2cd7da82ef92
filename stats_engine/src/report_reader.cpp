#include "report_reader.hpp"
#include "report_publisher.hpp"
#include <spdlog/spdlog.h>

ReportReader::ReportReader(std::shared_ptr<ReportCache> cache, int stale_after_seconds)
    : cache_(cache), stale_after_seconds_(stale_after_seconds) {}

std::string ReportReader::status_name(ReportStatus status) {
    switch (status) {
        case ReportStatus::Fresh: return "fresh";
        case ReportStatus::Stale: return "stale";
        case ReportStatus::Unavailable: return "unavailable";
    }
    return "unavailable";
}

ReportLookup ReportReader::lookup(const std::string& asset_id, const std::string& period,
                                  int64_t now_ms) const {
    ReportLookup result;
    const auto key = ReportPublisher::report_key(asset_id, period);

    try {
        auto raw = cache_->get(key);
        if (!raw) return result;

        auto envelope = nlohmann::json::parse(*raw);
        int64_t computed_at_ms = envelope.at("computed_at_ms").get<int64_t>();

        bool stale = now_ms - computed_at_ms > static_cast<int64_t>(stale_after_seconds_) * 1000;
        result.status = stale ? ReportStatus::Stale : ReportStatus::Fresh;
        result.envelope = std::move(envelope);

    } catch (const std::exception& e) {
        spdlog::warn("Report {} unavailable: {}", key, e.what());
        result.status = ReportStatus::Unavailable;
        result.envelope = nullptr;
    }
    return result;
}

std::vector<std::string> ReportReader::read_list(const std::string& key) const {
    try {
        auto raw = cache_->get(key);
        if (!raw) return {};
        return nlohmann::json::parse(*raw).get<std::vector<std::string>>();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to read {}: {}", key, e.what());
        return {};
    }
}

std::vector<std::string> ReportReader::assets() const {
    return read_list(ReportPublisher::kAssetsKey);
}

std::vector<std::string> ReportReader::available_periods(const std::string& asset_id) const {
    return read_list(ReportPublisher::available_periods_key(asset_id));
}
