#pragma once

#include "interfaces.hpp"
#include <memory>
#include <string>
#include <vector>

enum class ReportStatus {
    Fresh,
    Stale,
    Unavailable
};

struct ReportLookup {
    ReportStatus status = ReportStatus::Unavailable;
    nlohmann::json envelope;
};

// Read-only serving path. Never computes, never blocks past the cache timeout.
class ReportReader {
public:
    ReportReader(std::shared_ptr<ReportCache> cache, int stale_after_seconds);

    ReportLookup lookup(const std::string& asset_id, const std::string& period,
                        int64_t now_ms) const;

    std::vector<std::string> assets() const;
    std::vector<std::string> available_periods(const std::string& asset_id) const;

    static std::string status_name(ReportStatus status);

private:
    std::shared_ptr<ReportCache> cache_;
    int stale_after_seconds_;

    std::vector<std::string> read_list(const std::string& key) const;
};
