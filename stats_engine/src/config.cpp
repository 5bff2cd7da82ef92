#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace {

int interval_to_seconds(const std::string& interval) {
    if (interval == "1m") return 60;
    if (interval == "3m") return 180;
    if (interval == "5m") return 300;
    if (interval == "15m") return 900;
    if (interval == "30m") return 1800;
    if (interval == "1h") return 3600;
    return 0;
}

} // namespace

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

int Config::get_env_hhmm(const char* name, const std::string& default_val) {
    auto parsed = util::parse_hhmm(get_env(name, default_val));
    if (!parsed) {
        spdlog::warn("Invalid HH:MM for {}, using default {}", name, default_val);
        parsed = util::parse_hhmm(default_val);
    }
    return parsed.value_or(0);
}

Config Config::from_env() {
    Config cfg;

    cfg.pg_dsn = get_env("PG_DSN");
    cfg.store_timeout_ms = get_env_int("STORE_TIMEOUT_MS", 30000);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.cache_timeout_ms = get_env_int("CACHE_TIMEOUT_MS", 2000);
    cfg.report_ttl_seconds = get_env_int("REPORT_TTL_SECONDS", 0);
    cfg.report_stale_after_seconds = get_env_int("REPORT_STALE_AFTER_SECONDS", 26 * 3600);

    cfg.binance_base = get_env("BINANCE_BASE", "https://fapi.binance.com");
    cfg.candle_interval = get_env("CANDLE_INTERVAL", "1m");
    cfg.candle_interval_seconds = interval_to_seconds(cfg.candle_interval);
    cfg.fetch_timeout_ms = get_env_int("FETCH_TIMEOUT_MS", 10000);
    cfg.fetch_max_retries = get_env_int("FETCH_MAX_RETRIES", 3);
    cfg.retry_backoff_ms_min = get_env_int("RETRY_BACKOFF_MS_MIN", 500);
    cfg.retry_backoff_ms_max = get_env_int("RETRY_BACKOFF_MS_MAX", 5000);
    cfg.ingest_batch_candles = get_env_int("INGEST_BATCH_CANDLES", 10000);

    cfg.tracked_assets = util::split(
        get_env("TRACKED_ASSETS", "BTC/USDT,ETH/USDT,SOL/USDT,BNB/USDT"), ',');
    cfg.earliest_date = get_env("EARLIEST_DATE", "2020-01-01");

    // Defaults describe the New York session the IB levels are taken from
    cfg.exchange_utc_offset_minutes = get_env_int("EXCHANGE_UTC_OFFSET_MINUTES", -300);
    cfg.exchange_dst_rule = get_env("EXCHANGE_DST_RULE", "us");
    cfg.ib_start_minute = get_env_hhmm("IB_START", "09:30");
    cfg.ib_end_minute = get_env_hhmm("IB_END", "10:29");
    cfg.session_end_minute = get_env_hhmm("SESSION_END", "16:29");
    cfg.day_close_minute = get_env_hhmm("DAY_CLOSE", "23:59");
    cfg.session_close_grace_minutes = get_env_int("SESSION_CLOSE_GRACE_MINUTES", 0);
    cfg.skip_weekends = get_env_bool("SKIP_WEEKENDS", true);

    cfg.min_candles_per_session = get_env_int("MIN_CANDLES_PER_SESSION", 30);
    cfg.prior_lookback_days = get_env_int("PRIOR_LOOKBACK_DAYS", 7);
    cfg.process_chunk_days = get_env_int("PROCESS_CHUNK_DAYS", 31);
    cfg.max_parallel_assets = get_env_int("MAX_PARALLEL_ASSETS", 4);
    cfg.force_full_recalc = get_env_bool("FORCE_FULL_RECALC", false);

    cfg.min_sample_sessions = get_env_int("MIN_SAMPLE_SESSIONS", 20);
    cfg.min_bucket_sessions = get_env_int("MIN_BUCKET_SESSIONS", 5);
    cfg.heatmap_bucket_minutes = get_env_int("HEATMAP_BUCKET_MINUTES", 30);

    cfg.sync_minute = get_env_hhmm("SYNC_TIME", "00:05");
    cfg.run_once = get_env_bool("RUN_ONCE", false);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "stats_engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (tracked_assets.empty()) {
        throw std::runtime_error("TRACKED_ASSETS must name at least one asset");
    }
    if (candle_interval_seconds <= 0) {
        throw std::runtime_error("Unsupported CANDLE_INTERVAL: " + candle_interval);
    }
    if (!util::parse_date(earliest_date)) {
        throw std::runtime_error("EARLIEST_DATE must be YYYY-MM-DD, got " + earliest_date);
    }
    if (exchange_dst_rule != "us" && exchange_dst_rule != "none") {
        throw std::runtime_error("EXCHANGE_DST_RULE must be 'us' or 'none'");
    }
    if (!(ib_start_minute <= ib_end_minute && ib_end_minute < session_end_minute &&
          session_end_minute <= day_close_minute)) {
        throw std::runtime_error("Session windows must satisfy IB_START <= IB_END < SESSION_END <= DAY_CLOSE");
    }
    if (heatmap_bucket_minutes <= 0 || 1440 % heatmap_bucket_minutes != 0) {
        throw std::runtime_error("HEATMAP_BUCKET_MINUTES must divide a day");
    }
    if (ingest_batch_candles <= 0 || process_chunk_days <= 0 || max_parallel_assets <= 0) {
        throw std::runtime_error("Batch sizes and MAX_PARALLEL_ASSETS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Assets: {}", tracked_assets.size());
    spdlog::info("  IB window: {}-{}, session end {}, day close {}",
                 util::format_hhmm(ib_start_minute), util::format_hhmm(ib_end_minute),
                 util::format_hhmm(session_end_minute), util::format_hhmm(day_close_minute));
    spdlog::info("  Exchange clock: UTC{:+} min, DST rule {}",
                 exchange_utc_offset_minutes, exchange_dst_rule);
    spdlog::info("  Min samples: {} sessions, {} per weekday bucket",
                 min_sample_sessions, min_bucket_sessions);
}
