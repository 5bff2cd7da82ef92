#include "health.hpp"
#include "util.hpp"

namespace {

std::string run_status_name(AssetRunStatus status) {
    switch (status) {
        case AssetRunStatus::Ok: return "ok";
        case AssetRunStatus::Locked: return "locked";
        case AssetRunStatus::FetchFailed: return "fetch_failed";
        case AssetRunStatus::PersistenceFailed: return "persistence_failed";
        case AssetRunStatus::Failed: return "failed";
    }
    return "failed";
}

} // namespace

HealthCheck::HealthCheck(std::shared_ptr<RedisReportCache> redis,
                         std::shared_ptr<PostgresStore> pg)
    : redis_(redis), pg_(pg), scheduler_status_("starting") {}

void HealthCheck::set_scheduler_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_status_ = status;
}

void HealthCheck::record_run(const RunSummary& summary, int64_t finished_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_run_ts_ = util::iso8601_from_ms(finished_ms);
    for (const auto& r : summary.assets) {
        asset_status_[r.asset_id] = run_status_name(r.status);
    }
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json assets_json = nlohmann::json::object();
    for (const auto& [asset, status] : asset_status_) {
        assets_json[asset] = status;
    }

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"scheduler", scheduler_status_},
        {"assets", assets_json}
    };
    if (!last_run_ts_.empty()) status["last_run_ts"] = last_run_ts_;

    return status;
}
