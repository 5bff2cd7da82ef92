#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Days since 1970-01-01 on the exchange-local calendar
using SessionDate = int;

struct Candle {
    std::string asset_id;
    int64_t timestamp_ms;  // open time, UTC
    double open;
    double high;
    double low;
    double close;
    double volume;
};

struct SessionMetric {
    std::string asset_id;
    SessionDate session_date;
    nlohmann::json fields = nlohmann::json::object();
};

struct SyncCursor {
    std::optional<int64_t> last_ingested_timestamp_ms;
    std::optional<SessionDate> last_processed_session;
};

struct SyncResult {
    std::string asset_id;
    int candles_added = 0;
    int64_t range_start_ms = 0;
    int64_t range_end_ms = 0;
};

struct DateRange {
    SessionDate first;
    SessionDate last;  // inclusive
};

// 1900-01-01 .. 2999-12-31
constexpr DateRange kAllSessions{-25567, 376199};

enum class MetricWriteMode {
    Merge,    // patch the given keys into the stored object
    Replace   // store exactly the given object
};
