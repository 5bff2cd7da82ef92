#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include "asset_locks.hpp"
#include "delta_ingestor.hpp"
#include "footprint.hpp"
#include "report_publisher.hpp"
#include "session_calendar.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

enum class RunMode {
    Append,
    FullRecalc,
    SelfHeal
};

enum class RunnerState {
    Idle,
    CheckCursor,
    Append,
    FullRecalc,
    SelfHeal,
    Persist
};

struct RunPlan {
    RunMode mode = RunMode::Append;
    bool forced = false;
    std::vector<SessionDate> scope;  // ascending, trading dates only

    std::set<std::string> drifted_keys;  // schema drift signal
    std::vector<SessionDate> gap_dates;  // gap signal

    std::optional<SessionDate> latest_closed;
    std::optional<SessionDate> processed_cursor;  // after clamping or derivation
    bool cursor_clamped = false;

    std::map<SessionDate, nlohmann::json> stored;
};

enum class AssetRunStatus {
    Ok,
    Locked,
    FetchFailed,
    PersistenceFailed,
    Failed
};

struct AssetRunResult {
    std::string asset_id;
    AssetRunStatus status = AssetRunStatus::Failed;
    RunMode mode = RunMode::Append;
    int candles_added = 0;
    int sessions_written = 0;
    int sessions_patched = 0;
    int sessions_skipped = 0;
    int reports_published = 0;
    std::string error;
};

struct RunSummary {
    std::vector<AssetRunResult> assets;
    int succeeded = 0;
    int failed = 0;
    int locked = 0;
};

// Per-asset driver: sync raw data, decide Append / Full / Self-heal, build
// the footprint of every session in scope and republish the reports.
class SmartRunner {
public:
    SmartRunner(const Config& config,
                std::shared_ptr<MarketSource> source,
                std::shared_ptr<RawStore> raw_store,
                std::shared_ptr<MetricStore> metric_store,
                std::shared_ptr<ReportCache> cache,
                std::shared_ptr<AssetLocks> locks);

    // Runs every tracked asset on up to MAX_PARALLEL_ASSETS threads.
    // Throws RunFatalError when every attempted asset failed on persistence.
    RunSummary run_all_assets(int64_t now_ms, bool force_full = false);

    AssetRunResult run_asset(const std::string& asset_id, int64_t now_ms, bool force_full = false);

    RunPlan make_plan(const std::string& asset_id, int64_t now_ms, bool force_full);

    static std::string mode_name(RunMode mode);
    static std::string state_name(RunnerState state);

private:
    Config config_;
    std::shared_ptr<RawStore> raw_store_;
    std::shared_ptr<MetricStore> metric_store_;
    std::shared_ptr<AssetLocks> locks_;

    SessionCalendar calendar_;
    DeltaIngestor ingestor_;
    FootprintBuilder footprint_;
    ReportPublisher publisher_;

    int64_t interval_ms_;
    SessionDate earliest_date_;

    void execute(const std::string& asset_id, const RunPlan& plan, AssetRunResult& result);
    void process_session(const std::string& asset_id, SessionDate date,
                         const std::map<SessionDate, std::vector<Candle>>& by_date,
                         const RunPlan& plan, std::optional<SessionDate>& processed,
                         AssetRunResult& result);
    void transition(const std::string& asset_id, RunnerState from, RunnerState to) const;
};
