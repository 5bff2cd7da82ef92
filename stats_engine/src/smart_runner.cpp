#include "smart_runner.hpp"
#include "errors.hpp"
#include "schema_tracker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>

namespace {

SessionDate earliest_or_epoch(const Config& config) {
    return util::parse_date(config.earliest_date).value_or(0);
}

std::string join_dates(const std::vector<SessionDate>& dates, size_t limit = 10) {
    std::string out;
    for (size_t i = 0; i < dates.size() && i < limit; ++i) {
        if (i) out += ", ";
        out += util::format_date(dates[i]);
    }
    if (dates.size() > limit) out += ", ...";
    return out;
}

std::string join_keys(const std::set<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

RunnerState state_for(RunMode mode) {
    switch (mode) {
        case RunMode::FullRecalc: return RunnerState::FullRecalc;
        case RunMode::SelfHeal: return RunnerState::SelfHeal;
        case RunMode::Append: return RunnerState::Append;
    }
    return RunnerState::Append;
}

} // namespace

SmartRunner::SmartRunner(const Config& config,
                         std::shared_ptr<MarketSource> source,
                         std::shared_ptr<RawStore> raw_store,
                         std::shared_ptr<MetricStore> metric_store,
                         std::shared_ptr<ReportCache> cache,
                         std::shared_ptr<AssetLocks> locks)
    : config_(config)
    , raw_store_(raw_store)
    , metric_store_(metric_store)
    , locks_(locks)
    , calendar_(config)
    , ingestor_(source, raw_store,
                static_cast<int64_t>(config.candle_interval_seconds) * 1000,
                calendar_.day_start_ms(earliest_or_epoch(config)),
                config.ingest_batch_candles)
    , footprint_(calendar_,
                 SessionWindows{config.ib_start_minute, config.ib_end_minute,
                                config.session_end_minute, config.day_close_minute},
                 config.min_candles_per_session)
    , publisher_(cache, ReportBuilder(config), calendar_, config.report_ttl_seconds)
    , interval_ms_(static_cast<int64_t>(config.candle_interval_seconds) * 1000)
    , earliest_date_(earliest_or_epoch(config)) {}

std::string SmartRunner::mode_name(RunMode mode) {
    switch (mode) {
        case RunMode::Append: return "append";
        case RunMode::FullRecalc: return "full_recalc";
        case RunMode::SelfHeal: return "self_heal";
    }
    return "unknown";
}

std::string SmartRunner::state_name(RunnerState state) {
    switch (state) {
        case RunnerState::Idle: return "IDLE";
        case RunnerState::CheckCursor: return "CHECK_CURSOR";
        case RunnerState::Append: return "APPEND";
        case RunnerState::FullRecalc: return "FULL_RECALC";
        case RunnerState::SelfHeal: return "SELF_HEAL";
        case RunnerState::Persist: return "PERSIST";
    }
    return "UNKNOWN";
}

void SmartRunner::transition(const std::string& asset_id, RunnerState from, RunnerState to) const {
    spdlog::debug("{}: {} -> {}", asset_id, state_name(from), state_name(to));
}

RunPlan SmartRunner::make_plan(const std::string& asset_id, int64_t now_ms, bool force_full) {
    RunPlan plan;
    plan.forced = force_full;

    auto metrics = metric_store_->get_session_metrics(asset_id, kAllSessions);
    auto skips = metric_store_->get_skipped_sessions(asset_id);
    auto cursor = raw_store_->get_cursor(asset_id);

    std::optional<int64_t> last_ingested;
    std::optional<SessionDate> processed;
    if (cursor) {
        last_ingested = cursor->last_ingested_timestamp_ms;
        processed = cursor->last_processed_session;
    }

    for (const auto& m : metrics) plan.stored[m.session_date] = m.fields;

    std::optional<SessionDate> newest_known;
    if (!metrics.empty()) newest_known = metrics.back().session_date;
    if (!skips.empty()) {
        SessionDate newest_skip = *skips.rbegin();
        newest_known = newest_known ? std::max(*newest_known, newest_skip) : newest_skip;
    }

    // A cursor ahead of what is stored means a write was lost after the cursor moved
    if (processed && (!newest_known || *processed > *newest_known)) {
        spdlog::warn("{}: cursor {} ahead of stored sessions, clamping to {}", asset_id,
                     util::format_date(*processed),
                     newest_known ? util::format_date(*newest_known) : "none");
        processed = newest_known;
        plan.cursor_clamped = true;
    }
    if (!processed && newest_known) processed = newest_known;
    plan.processed_cursor = processed;

    plan.latest_closed = calendar_.latest_closed_session(now_ms, last_ingested, interval_ms_);
    plan.drifted_keys = SchemaTracker::drifted_keys(metrics, SchemaTracker::expected_keys());

    if (!plan.latest_closed) {
        spdlog::info("{}: no closed session yet", asset_id);
        return plan;
    }

    bool nothing_stored = metrics.empty() && skips.empty();
    if (force_full || !plan.drifted_keys.empty() || nothing_stored) {
        plan.mode = RunMode::FullRecalc;

        auto first_ts = raw_store_->first_candle_timestamp(asset_id);
        if (first_ts) {
            SessionDate first = std::max(calendar_.session_date_of(*first_ts), earliest_date_);
            plan.scope = calendar_.trading_days(first, *plan.latest_closed);
        }

        // Stored rows outside the candle range are rebuilt too, or dropped as skips
        for (const auto& entry : plan.stored) plan.scope.push_back(entry.first);
        std::sort(plan.scope.begin(), plan.scope.end());
        plan.scope.erase(std::unique(plan.scope.begin(), plan.scope.end()), plan.scope.end());
        return plan;
    }

    if (!metrics.empty()) {
        SessionDate lo = metrics.front().session_date;
        SessionDate hi = metrics.back().session_date;
        for (SessionDate d : calendar_.trading_days(lo + 1, hi - 1)) {
            if (!plan.stored.count(d) && !skips.count(d)) plan.gap_dates.push_back(d);
        }
    }

    std::vector<SessionDate> appends;
    if (processed && *processed < *plan.latest_closed) {
        appends = calendar_.trading_days(*processed + 1, *plan.latest_closed);
    }

    if (!plan.gap_dates.empty()) {
        plan.mode = RunMode::SelfHeal;
        plan.scope = plan.gap_dates;
        plan.scope.insert(plan.scope.end(), appends.begin(), appends.end());
        std::sort(plan.scope.begin(), plan.scope.end());
        plan.scope.erase(std::unique(plan.scope.begin(), plan.scope.end()), plan.scope.end());
    } else {
        plan.mode = RunMode::Append;
        plan.scope = std::move(appends);
    }
    return plan;
}

void SmartRunner::process_session(const std::string& asset_id, SessionDate date,
                                  const std::map<SessionDate, std::vector<Candle>>& by_date,
                                  const RunPlan& plan, std::optional<SessionDate>& processed,
                                  AssetRunResult& result) {
    static const std::vector<Candle> kNoCandles;

    auto day_it = by_date.find(date);
    const auto& candles = day_it == by_date.end() ? kNoCandles : day_it->second;

    // Nearest preceding trading day with enough candles
    std::optional<PriorSession> prior;
    SessionDate from = date;
    int lookback_left = config_.prior_lookback_days;
    while (!prior) {
        auto candidate = calendar_.previous_trading_day(from, lookback_left);
        if (!candidate) break;
        lookback_left -= from - *candidate;
        from = *candidate;

        auto it = by_date.find(*candidate);
        if (it != by_date.end()) prior = footprint_.summarize_prior(it->second);
    }

    auto outcome = footprint_.build(asset_id, date, candles, prior);
    SessionDate through = processed ? std::max(*processed, date) : date;

    if (!outcome.metric) {
        spdlog::debug("{}: {} skipped ({})", asset_id, util::format_date(date), outcome.skip_reason);
        metric_store_->commit_skipped_session(asset_id, date, outcome.skip_reason, through);
        result.sessions_skipped++;
        processed = through;
        return;
    }

    auto existing = plan.stored.find(date);
    if (plan.mode == RunMode::FullRecalc && !plan.forced && existing != plan.stored.end()) {
        // Correct history stays as stored; only keys it lacks are added
        auto patch = SchemaTracker::missing_patch(existing->second, outcome.metric->fields,
                                                  SchemaTracker::expected_keys());
        if (patch.empty()) return;

        SessionMetric partial{asset_id, date, std::move(patch)};
        metric_store_->commit_session(partial, MetricWriteMode::Merge, through);
        result.sessions_patched++;
    } else {
        metric_store_->commit_session(*outcome.metric, MetricWriteMode::Replace, through);
        result.sessions_written++;
    }
    processed = through;
}

void SmartRunner::execute(const std::string& asset_id, const RunPlan& plan,
                          AssetRunResult& result) {
    std::optional<SessionDate> processed = plan.processed_cursor;

    if (plan.cursor_clamped && processed) {
        SyncCursor clamp;
        clamp.last_processed_session = processed;
        raw_store_->set_cursor(asset_id, clamp);
    }

    const auto& scope = plan.scope;
    size_t i = 0;
    while (i < scope.size()) {
        SessionDate chunk_first = scope[i];
        size_t j = i;
        while (j < scope.size() && scope[j] < chunk_first + config_.process_chunk_days) ++j;
        SessionDate chunk_last = scope[j - 1];

        // Look-back days ride along so prior sessions come from the same read
        auto candles = raw_store_->get_candles(
            asset_id,
            calendar_.day_start_ms(chunk_first - config_.prior_lookback_days),
            calendar_.day_end_ms(chunk_last));

        std::map<SessionDate, std::vector<Candle>> by_date;
        for (auto& c : candles) {
            by_date[calendar_.session_date_of(c.timestamp_ms)].push_back(std::move(c));
        }

        for (size_t k = i; k < j; ++k) {
            process_session(asset_id, scope[k], by_date, plan, processed, result);
        }
        i = j;
    }

    // Untouched complete rows at the tail of a full pass still count as processed
    if (!scope.empty() && (!processed || *processed < scope.back())) {
        SyncCursor tail;
        tail.last_processed_session = scope.back();
        raw_store_->set_cursor(asset_id, tail);
    }
}

AssetRunResult SmartRunner::run_asset(const std::string& asset_id, int64_t now_ms, bool force_full) {
    AssetRunResult result;
    result.asset_id = asset_id;

    try {
        AssetLockGuard guard(*locks_, asset_id);
        if (!guard.owns_lock()) {
            spdlog::info("{}: run already in progress, skipping", asset_id);
            result.status = AssetRunStatus::Locked;
            return result;
        }

        transition(asset_id, RunnerState::Idle, RunnerState::CheckCursor);
        auto sync = ingestor_.sync(asset_id, now_ms);
        result.candles_added = sync.candles_added;

        auto plan = make_plan(asset_id, now_ms, force_full);
        result.mode = plan.mode;

        if (!plan.drifted_keys.empty()) {
            spdlog::info("{}: schema drift detected, missing keys: {}", asset_id,
                         join_keys(plan.drifted_keys));
        }
        if (!plan.gap_dates.empty()) {
            spdlog::info("{}: gap detected at {} dates: {}", asset_id, plan.gap_dates.size(),
                         join_dates(plan.gap_dates));
        }
        spdlog::info("{}: mode={} scope={} sessions", asset_id, mode_name(plan.mode),
                     plan.scope.size());

        transition(asset_id, RunnerState::CheckCursor, state_for(plan.mode));
        execute(asset_id, plan, result);

        transition(asset_id, state_for(plan.mode), RunnerState::Persist);
        auto metrics = metric_store_->get_session_metrics(asset_id, kAllSessions);
        result.reports_published =
            static_cast<int>(publisher_.publish_asset(asset_id, metrics, now_ms).size());

        transition(asset_id, RunnerState::Persist, RunnerState::Idle);
        result.status = AssetRunStatus::Ok;

        spdlog::info("{}: done, {} written, {} patched, {} skipped", asset_id,
                     result.sessions_written, result.sessions_patched, result.sessions_skipped);

    } catch (const FetchError& e) {
        spdlog::error("{}: fetch failed, skipping this run: {}", asset_id, e.what());
        result.status = AssetRunStatus::FetchFailed;
        result.error = e.what();
    } catch (const PersistenceError& e) {
        spdlog::error("{}: persistence failed, skipping this run: {}", asset_id, e.what());
        result.status = AssetRunStatus::PersistenceFailed;
        result.error = e.what();
    } catch (const std::exception& e) {
        spdlog::error("{}: run failed: {}", asset_id, e.what());
        result.status = AssetRunStatus::Failed;
        result.error = e.what();
    }

    return result;
}

RunSummary SmartRunner::run_all_assets(int64_t now_ms, bool force_full) {
    const auto& assets = config_.tracked_assets;
    RunSummary summary;
    summary.assets.resize(assets.size());

    spdlog::info("Run started for {} assets{}", assets.size(), force_full ? " (full recalc)" : "");

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < assets.size(); i = next++) {
            summary.assets[i] = run_asset(assets[i], now_ms, force_full);
        }
    };

    size_t thread_count = std::min(assets.size(),
                                    static_cast<size_t>(std::max(1, config_.max_parallel_assets)));
    std::vector<std::thread> workers;
    for (size_t t = 0; t < thread_count; ++t) workers.emplace_back(worker);
    for (auto& w : workers) w.join();

    int attempted = 0;
    int persistence_failures = 0;
    for (const auto& r : summary.assets) {
        switch (r.status) {
            case AssetRunStatus::Ok: summary.succeeded++; break;
            case AssetRunStatus::Locked: summary.locked++; break;
            case AssetRunStatus::PersistenceFailed: persistence_failures++; summary.failed++; break;
            default: summary.failed++; break;
        }
        if (r.status != AssetRunStatus::Locked) attempted++;
    }

    try {
        publisher_.publish_asset_index(assets);
    } catch (const PersistenceError& e) {
        spdlog::error("Failed to publish asset index: {}", e.what());
    }

    spdlog::info("Run finished: {} ok, {} failed, {} locked",
                 summary.succeeded, summary.failed, summary.locked);

    if (attempted > 0 && persistence_failures == attempted) {
        throw RunFatalError("All " + std::to_string(attempted) + " assets failed on persistence");
    }
    return summary;
}
