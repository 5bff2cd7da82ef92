#include "redis_cache.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

RedisReportCache::RedisReportCache(const std::string& redis_url, int timeout_ms) {
    try {
        sw::redis::ConnectionOptions opts(redis_url);
        opts.connect_timeout = std::chrono::milliseconds(timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts);
        spdlog::info("Connected to Redis: {}:{}", opts.host, opts.port);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisReportCache::publish(const std::string& key, const std::string& payload,
                               int ttl_seconds) {
    try {
        // Single SET: readers see the old value or the new one, never a mix
        if (ttl_seconds > 0) {
            redis_->set(key, payload, std::chrono::seconds(ttl_seconds));
        } else {
            redis_->set(key, payload);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish {}: {}", key, e.what());
        throw PersistenceError(e.what());
    }
}

std::optional<std::string> RedisReportCache::get(const std::string& key) {
    try {
        auto val = redis_->get(key);
        if (!val) return std::nullopt;
        return *val;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read {}: {}", key, e.what());
        throw PersistenceError(e.what());
    }
}

bool RedisReportCache::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error&) {
        return false;
    }
}
