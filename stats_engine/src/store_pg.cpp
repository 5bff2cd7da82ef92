#include "store_pg.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>

namespace {

std::string with_connect_timeout(const std::string& dsn, int timeout_ms) {
    int seconds = std::max(1, timeout_ms / 1000);
    if (dsn.find("connect_timeout") != std::string::npos) return dsn;

    if (dsn.find("://") != std::string::npos) {
        char sep = dsn.find('?') == std::string::npos ? '?' : '&';
        return dsn + sep + "connect_timeout=" + std::to_string(seconds);
    }
    return dsn + " connect_timeout=" + std::to_string(seconds);
}

class AdvisoryLease : public RunLease {
public:
    AdvisoryLease(std::unique_ptr<pqxx::connection> conn, const std::string& asset_id)
        : conn_(std::move(conn)), asset_id_(asset_id) {}

    ~AdvisoryLease() override {
        try {
            pqxx::nontransaction txn(*conn_);
            txn.exec_params("SELECT pg_advisory_unlock(hashtext($1))", asset_id_);
        } catch (const std::exception& e) {
            // Closing the connection drops the lock anyway
            spdlog::warn("Failed to release run lock for {}: {}", asset_id_, e.what());
        }
    }

private:
    std::unique_ptr<pqxx::connection> conn_;
    std::string asset_id_;
};

} // namespace

PostgresStore::PostgresStore(const std::string& dsn, int timeout_ms)
    : dsn_(with_connect_timeout(dsn, timeout_ms)), timeout_ms_(timeout_ms) {}

pqxx::connection PostgresStore::make_connection() {
    pqxx::connection conn(dsn_);
    {
        pqxx::nontransaction setup(conn);
        setup.exec("SET statement_timeout = " + std::to_string(timeout_ms_));
        setup.commit();
    }
    return conn;
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS candles (
                asset_id TEXT NOT NULL,
                ts TIMESTAMPTZ NOT NULL,
                open DOUBLE PRECISION NOT NULL,
                high DOUBLE PRECISION NOT NULL,
                low DOUBLE PRECISION NOT NULL,
                close DOUBLE PRECISION NOT NULL,
                volume DOUBLE PRECISION NOT NULL,
                PRIMARY KEY (asset_id, ts)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS session_metrics (
                asset_id TEXT NOT NULL,
                session_date DATE NOT NULL,
                metrics JSONB NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (asset_id, session_date)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS session_skips (
                asset_id TEXT NOT NULL,
                session_date DATE NOT NULL,
                reason TEXT NOT NULL,
                PRIMARY KEY (asset_id, session_date)
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS sync_cursors (
                asset_id TEXT PRIMARY KEY,
                last_ingested_ts TIMESTAMPTZ,
                last_processed_session DATE,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw PersistenceError(e.what());
    }
}

std::optional<SyncCursor> PostgresStore::get_cursor(const std::string& asset_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT (EXTRACT(EPOCH FROM last_ingested_ts) * 1000)::BIGINT, "
            "last_processed_session - DATE '1970-01-01' "
            "FROM sync_cursors WHERE asset_id = $1",
            asset_id
        );
        txn.commit();

        if (result.empty()) return std::nullopt;

        SyncCursor cursor;
        if (!result[0][0].is_null()) cursor.last_ingested_timestamp_ms = result[0][0].as<int64_t>();
        if (!result[0][1].is_null()) cursor.last_processed_session = result[0][1].as<int>();
        return cursor;

    } catch (const std::exception& e) {
        spdlog::error("Failed to read cursor for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

void PostgresStore::upsert_candles(const std::string& asset_id,
                                   const std::vector<Candle>& candles) {
    if (candles.empty()) return;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        for (const auto& c : candles) {
            txn.exec_params(
                "INSERT INTO candles (asset_id, ts, open, high, low, close, volume) "
                "VALUES ($1, to_timestamp($2::BIGINT / 1000.0), $3, $4, $5, $6, $7) "
                "ON CONFLICT (asset_id, ts) DO UPDATE SET "
                "open = $3, high = $4, low = $5, close = $6, volume = $7",
                asset_id, c.timestamp_ms, c.open, c.high, c.low, c.close, c.volume
            );
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to upsert {} candles for {}: {}", candles.size(), asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

void PostgresStore::set_cursor(const std::string& asset_id, const SyncCursor& cursor) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // Absent fields keep their stored value
        txn.exec_params(
            "INSERT INTO sync_cursors (asset_id, last_ingested_ts, last_processed_session) "
            "VALUES ($1, to_timestamp($2::BIGINT / 1000.0), DATE '1970-01-01' + $3::INT) "
            "ON CONFLICT (asset_id) DO UPDATE SET "
            "last_ingested_ts = COALESCE(EXCLUDED.last_ingested_ts, sync_cursors.last_ingested_ts), "
            "last_processed_session = COALESCE(EXCLUDED.last_processed_session, "
            "sync_cursors.last_processed_session), "
            "updated_at = NOW()",
            asset_id, cursor.last_ingested_timestamp_ms, cursor.last_processed_session
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to set cursor for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

std::vector<Candle> PostgresStore::get_candles(const std::string& asset_id,
                                               int64_t start_ms, int64_t end_ms) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT (EXTRACT(EPOCH FROM ts) * 1000)::BIGINT, open, high, low, close, volume "
            "FROM candles WHERE asset_id = $1 "
            "AND ts >= to_timestamp($2::BIGINT / 1000.0) AND ts < to_timestamp($3::BIGINT / 1000.0) "
            "ORDER BY ts",
            asset_id, start_ms, end_ms
        );
        txn.commit();

        std::vector<Candle> candles;
        candles.reserve(result.size());
        for (const auto& row : result) {
            Candle c;
            c.asset_id = asset_id;
            c.timestamp_ms = row[0].as<int64_t>();
            c.open = row[1].as<double>();
            c.high = row[2].as<double>();
            c.low = row[3].as<double>();
            c.close = row[4].as<double>();
            c.volume = row[5].as<double>();
            candles.push_back(c);
        }
        return candles;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load candles for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

std::optional<int64_t> PostgresStore::first_candle_timestamp(const std::string& asset_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT (EXTRACT(EPOCH FROM MIN(ts)) * 1000)::BIGINT FROM candles WHERE asset_id = $1",
            asset_id
        );
        txn.commit();

        if (result.empty() || result[0][0].is_null()) return std::nullopt;
        return result[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to read first candle for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

std::vector<SessionMetric> PostgresStore::get_session_metrics(const std::string& asset_id,
                                                              const DateRange& range) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT session_date - DATE '1970-01-01', metrics::TEXT "
            "FROM session_metrics WHERE asset_id = $1 "
            "AND session_date BETWEEN DATE '1970-01-01' + $2::INT AND DATE '1970-01-01' + $3::INT "
            "ORDER BY session_date",
            asset_id, range.first, range.last
        );
        txn.commit();

        std::vector<SessionMetric> metrics;
        metrics.reserve(result.size());
        for (const auto& row : result) {
            SessionMetric m;
            m.asset_id = asset_id;
            m.session_date = row[0].as<int>();
            m.fields = nlohmann::json::parse(row[1].c_str());
            metrics.push_back(std::move(m));
        }
        return metrics;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load session metrics for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

void PostgresStore::upsert_session_metric(const std::string& asset_id, SessionDate date,
                                          const nlohmann::json& fields) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO session_metrics (asset_id, session_date, metrics) "
            "VALUES ($1, DATE '1970-01-01' + $2::INT, $3::JSONB) "
            "ON CONFLICT (asset_id, session_date) DO UPDATE SET "
            "metrics = session_metrics.metrics || EXCLUDED.metrics, updated_at = NOW()",
            asset_id, date, fields.dump()
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to upsert session metric for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

void PostgresStore::advance_processed(pqxx::work& txn, const std::string& asset_id,
                                      SessionDate processed_through) {
    txn.exec_params(
        "INSERT INTO sync_cursors (asset_id, last_processed_session) "
        "VALUES ($1, DATE '1970-01-01' + $2::INT) "
        "ON CONFLICT (asset_id) DO UPDATE SET "
        "last_processed_session = EXCLUDED.last_processed_session, updated_at = NOW()",
        asset_id, processed_through
    );
}

void PostgresStore::commit_session(const SessionMetric& metric, MetricWriteMode mode,
                                   SessionDate processed_through) {
    const char* merge_sql =
        "INSERT INTO session_metrics (asset_id, session_date, metrics) "
        "VALUES ($1, DATE '1970-01-01' + $2::INT, $3::JSONB) "
        "ON CONFLICT (asset_id, session_date) DO UPDATE SET "
        "metrics = session_metrics.metrics || EXCLUDED.metrics, updated_at = NOW()";
    const char* replace_sql =
        "INSERT INTO session_metrics (asset_id, session_date, metrics) "
        "VALUES ($1, DATE '1970-01-01' + $2::INT, $3::JSONB) "
        "ON CONFLICT (asset_id, session_date) DO UPDATE SET "
        "metrics = EXCLUDED.metrics, updated_at = NOW()";

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(mode == MetricWriteMode::Merge ? merge_sql : replace_sql,
                        metric.asset_id, metric.session_date, metric.fields.dump());
        txn.exec_params(
            "DELETE FROM session_skips WHERE asset_id = $1 "
            "AND session_date = DATE '1970-01-01' + $2::INT",
            metric.asset_id, metric.session_date
        );
        advance_processed(txn, metric.asset_id, processed_through);

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to commit session {} for {}: {}",
                      metric.session_date, metric.asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

void PostgresStore::commit_skipped_session(const std::string& asset_id, SessionDate date,
                                           const std::string& reason,
                                           SessionDate processed_through) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO session_skips (asset_id, session_date, reason) "
            "VALUES ($1, DATE '1970-01-01' + $2::INT, $3) "
            "ON CONFLICT (asset_id, session_date) DO UPDATE SET reason = $3",
            asset_id, date, reason
        );
        txn.exec_params(
            "DELETE FROM session_metrics WHERE asset_id = $1 "
            "AND session_date = DATE '1970-01-01' + $2::INT",
            asset_id, date
        );
        advance_processed(txn, asset_id, processed_through);

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to record skipped session {} for {}: {}", date, asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

std::set<SessionDate> PostgresStore::get_skipped_sessions(const std::string& asset_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT session_date - DATE '1970-01-01' FROM session_skips WHERE asset_id = $1",
            asset_id
        );
        txn.commit();

        std::set<SessionDate> dates;
        for (const auto& row : result) {
            dates.insert(row[0].as<int>());
        }
        return dates;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load skipped sessions for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}

std::unique_ptr<RunLease> PostgresStore::try_lock(const std::string& asset_id) {
    try {
        auto conn = std::make_unique<pqxx::connection>(make_connection());
        bool acquired = false;
        {
            pqxx::nontransaction txn(*conn);
            auto result = txn.exec_params(
                "SELECT pg_try_advisory_lock(hashtext($1))", asset_id);
            acquired = result[0][0].as<bool>();
        }

        if (!acquired) return nullptr;
        return std::make_unique<AdvisoryLease>(std::move(conn), asset_id);

    } catch (const std::exception& e) {
        spdlog::error("Failed to take run lock for {}: {}", asset_id, e.what());
        throw PersistenceError(e.what());
    }
}
