#pragma once

#include "interfaces.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

class PostgresStore : public RawStore, public MetricStore, public RunLockProvider {
public:
    PostgresStore(const std::string& dsn, int timeout_ms = 30000);

    void init_schema();
    bool ping();

    // RawStore
    std::optional<SyncCursor> get_cursor(const std::string& asset_id) override;
    void upsert_candles(const std::string& asset_id,
                        const std::vector<Candle>& candles) override;
    void set_cursor(const std::string& asset_id, const SyncCursor& cursor) override;
    std::vector<Candle> get_candles(const std::string& asset_id,
                                    int64_t start_ms, int64_t end_ms) override;
    std::optional<int64_t> first_candle_timestamp(const std::string& asset_id) override;

    // MetricStore
    std::vector<SessionMetric> get_session_metrics(const std::string& asset_id,
                                                   const DateRange& range) override;
    void upsert_session_metric(const std::string& asset_id, SessionDate date,
                               const nlohmann::json& fields) override;
    void commit_session(const SessionMetric& metric, MetricWriteMode mode,
                        SessionDate processed_through) override;
    void commit_skipped_session(const std::string& asset_id, SessionDate date,
                                const std::string& reason,
                                SessionDate processed_through) override;
    std::set<SessionDate> get_skipped_sessions(const std::string& asset_id) override;

    // RunLockProvider: session advisory lock on a connection the lease keeps open
    std::unique_ptr<RunLease> try_lock(const std::string& asset_id) override;

private:
    std::string dsn_;
    int timeout_ms_;

    pqxx::connection make_connection();
    static void advance_processed(pqxx::work& txn, const std::string& asset_id,
                                  SessionDate processed_through);
};
