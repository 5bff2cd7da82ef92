#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Postgres (candles, session metrics, cursors)
    std::string pg_dsn;
    int store_timeout_ms;

    // Redis (report cache)
    std::string redis_url;
    int cache_timeout_ms;
    int report_ttl_seconds;
    int report_stale_after_seconds;

    // Market source
    std::string binance_base;
    std::string candle_interval;
    int candle_interval_seconds;
    int fetch_timeout_ms;
    int fetch_max_retries;
    int retry_backoff_ms_min;
    int retry_backoff_ms_max;
    int ingest_batch_candles;

    // Tracked assets and history floor
    std::vector<std::string> tracked_assets;
    std::string earliest_date;

    // Exchange clock and session windows (minutes of local day)
    int exchange_utc_offset_minutes;
    std::string exchange_dst_rule;
    int ib_start_minute;
    int ib_end_minute;
    int session_end_minute;
    int day_close_minute;
    int session_close_grace_minutes;
    bool skip_weekends;

    // Footprint / SmartRunner
    int min_candles_per_session;
    int prior_lookback_days;
    int process_chunk_days;
    int max_parallel_assets;
    bool force_full_recalc;

    // Statistical models
    int min_sample_sessions;
    int min_bucket_sessions;
    int heatmap_bucket_minutes;

    // Scheduler
    int sync_minute;
    bool run_once;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
    static int get_env_hhmm(const char* name, const std::string& default_val);
};
