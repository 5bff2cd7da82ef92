#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory>
#include <sw/redis++/redis++.h>

class RedisReportCache : public ReportCache {
public:
    explicit RedisReportCache(const std::string& redis_url, int timeout_ms = 2000);

    void publish(const std::string& key, const std::string& payload,
                 int ttl_seconds = 0) override;
    std::optional<std::string> get(const std::string& key) override;

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
