#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <memory>

class MarketSource {
public:
    virtual ~MarketSource() = default;

    // Closed and open candles with start_ms <= open time < end_ms, ascending.
    // An empty result means no data, not an error. Throws FetchError.
    virtual std::vector<Candle> fetch_candles(const std::string& asset_id,
                                              int64_t start_ms, int64_t end_ms) = 0;
};

class RawStore {
public:
    virtual ~RawStore() = default;

    virtual std::optional<SyncCursor> get_cursor(const std::string& asset_id) = 0;
    virtual void upsert_candles(const std::string& asset_id,
                                const std::vector<Candle>& candles) = 0;
    virtual void set_cursor(const std::string& asset_id, const SyncCursor& cursor) = 0;

    // start_ms <= timestamp < end_ms, ascending
    virtual std::vector<Candle> get_candles(const std::string& asset_id,
                                            int64_t start_ms, int64_t end_ms) = 0;
    virtual std::optional<int64_t> first_candle_timestamp(const std::string& asset_id) = 0;
};

class MetricStore {
public:
    virtual ~MetricStore() = default;

    virtual std::vector<SessionMetric> get_session_metrics(const std::string& asset_id,
                                                           const DateRange& range) = 0;
    virtual void upsert_session_metric(const std::string& asset_id, SessionDate date,
                                       const nlohmann::json& fields) = 0;

    // Metric write and cursor advance are one durable unit. A skip record
    // replaces any metric row stored for the date, and vice versa.
    virtual void commit_session(const SessionMetric& metric, MetricWriteMode mode,
                                SessionDate processed_through) = 0;
    virtual void commit_skipped_session(const std::string& asset_id, SessionDate date,
                                        const std::string& reason,
                                        SessionDate processed_through) = 0;
    virtual std::set<SessionDate> get_skipped_sessions(const std::string& asset_id) = 0;
};

class ReportCache {
public:
    virtual ~ReportCache() = default;

    // ttl_seconds <= 0 means no expiry
    virtual void publish(const std::string& key, const std::string& payload,
                         int ttl_seconds = 0) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
};

// Held for the length of one asset's run, released on destruction.
class RunLease {
public:
    virtual ~RunLease() = default;
};

// Exclusion across processes sharing one store.
class RunLockProvider {
public:
    virtual ~RunLockProvider() = default;

    // nullptr when another holder has the asset. Throws PersistenceError.
    virtual std::unique_ptr<RunLease> try_lock(const std::string& asset_id) = 0;
};
