#pragma once

#include "redis_cache.hpp"
#include "store_pg.hpp"
#include "smart_runner.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <map>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisReportCache> redis,
                std::shared_ptr<PostgresStore> pg);

    nlohmann::json get_status();

    void set_scheduler_status(const std::string& status);
    void record_run(const RunSummary& summary, int64_t finished_ms);

private:
    std::shared_ptr<RedisReportCache> redis_;
    std::shared_ptr<PostgresStore> pg_;

    mutable std::mutex mutex_;
    std::string scheduler_status_;
    std::string last_run_ts_;
    std::map<std::string, std::string> asset_status_;
};
