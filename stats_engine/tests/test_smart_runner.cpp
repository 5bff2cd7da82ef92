#include <catch2/catch_test_macros.hpp>
#include "../src/smart_runner.hpp"
#include "../src/schema_tracker.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <memory>

namespace {

const SessionDate kD0 = date_of(2024, 1, 1);
const std::string kBtc = "BTC/USDT";
const std::string kEth = "ETH/USDT";

// Half an hour into the day after D4: D0..D4 are closed
const int64_t kNow = utc_ms(kD0 + 5, 30);

struct Harness {
    Config config = test_config();
    std::shared_ptr<FakeMarketSource> source;
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
    std::shared_ptr<FakeReportCache> cache = std::make_shared<FakeReportCache>();
    std::shared_ptr<AssetLocks> locks = std::make_shared<AssetLocks>();
    std::unique_ptr<SmartRunner> runner;

    explicit Harness(std::vector<std::string> assets = {kBtc}) {
        config.tracked_assets = std::move(assets);
        source = std::make_shared<FakeMarketSource>(utc_ms(kD0, 0), 5 * util::kMsPerMinute);
        runner = std::make_unique<SmartRunner>(config, source, store, store, cache, locks);
    }

    AssetRunResult run(int64_t now, bool force = false) {
        source->available_until_ms = now;
        return runner->run_asset(kBtc, now, force);
    }

    RunPlan plan(int64_t now) {
        return runner->make_plan(kBtc, now, false);
    }

    std::map<SessionDate, nlohmann::json>& rows() { return store->metrics[kBtc]; }
};

} // namespace

TEST_CASE("First run computes the whole history", "[runner]") {
    Harness h;
    auto result = h.run(kNow);

    REQUIRE(result.status == AssetRunStatus::Ok);
    REQUIRE(result.mode == RunMode::FullRecalc);
    REQUIRE(result.sessions_written == 5);
    REQUIRE(h.rows().size() == 5);
    REQUIRE(h.rows().begin()->first == kD0);
    REQUIRE(h.store->cursors[kBtc].last_processed_session == kD0 + 4);

    SECTION("Only the first session lacks prior levels") {
        REQUIRE(h.rows()[kD0]["pdh"].is_null());
        REQUIRE_FALSE(h.rows()[kD0 + 3]["pdh"].is_null());
    }

    SECTION("Reports are published with their envelope") {
        REQUIRE(result.reports_published == 1);
        auto raw = h.cache->entries.at("analytics:BTC/USDT:YTD");
        auto envelope = nlohmann::json::parse(raw);
        REQUIRE(envelope["asset"] == kBtc);
        REQUIRE(envelope["computed_at_ms"] == kNow);
        REQUIRE(envelope["payload"]["total_days_analyzed"] == 5);
        REQUIRE(envelope["payload"]["low_confidence"] == true);
        REQUIRE(h.cache->entries.count("analytics:BTC/USDT:available_periods") == 1);
    }

    SECTION("A second run with nothing new writes nothing") {
        int commits = h.store->commits;
        auto again = h.run(kNow + 1000);

        REQUIRE(again.status == AssetRunStatus::Ok);
        REQUIRE(again.mode == RunMode::Append);
        REQUIRE(again.sessions_written == 0);
        REQUIRE(h.store->commits == commits);
    }
}

TEST_CASE("Append processes exactly the newly closed sessions", "[runner]") {
    Harness h;
    h.run(kNow);

    const int64_t later = utc_ms(kD0 + 7, 30);
    auto plan = h.plan(later);
    REQUIRE(plan.mode == RunMode::Append);

    auto result = h.run(later);

    REQUIRE(result.mode == RunMode::Append);
    REQUIRE(result.sessions_written == 2);
    REQUIRE(h.rows().size() == 7);
    REQUIRE(h.rows().count(kD0 + 5) == 1);
    REQUIRE(h.rows().count(kD0 + 6) == 1);
    REQUIRE(h.store->cursors[kBtc].last_processed_session == kD0 + 6);
}

TEST_CASE("Self-heal recomputes exactly the missing dates", "[runner]") {
    Harness h;
    h.run(kNow);

    auto original = h.rows()[kD0 + 2];
    h.rows().erase(kD0 + 2);

    auto plan = h.plan(kNow);
    REQUIRE(plan.mode == RunMode::SelfHeal);
    REQUIRE(plan.gap_dates == std::vector<SessionDate>{kD0 + 2});
    REQUIRE(plan.scope == std::vector<SessionDate>{kD0 + 2});

    auto result = h.run(kNow);

    REQUIRE(result.mode == RunMode::SelfHeal);
    REQUIRE(result.sessions_written == 1);
    REQUIRE(h.rows()[kD0 + 2] == original);
    REQUIRE(h.store->cursors[kBtc].last_processed_session == kD0 + 4);
}

TEST_CASE("Schema drift forces a full pass that only backfills", "[runner]") {
    Harness h;
    h.run(kNow);

    for (auto& [date, fields] : h.rows()) fields.erase("full_hit_ib_mid");
    h.store->upsert_session_metric(kBtc, kD0 + 1, {{"open", 12345.0}});

    auto plan = h.plan(kNow);
    REQUIRE(plan.mode == RunMode::FullRecalc);
    REQUIRE(plan.drifted_keys == std::set<std::string>{"full_hit_ib_mid"});

    auto result = h.run(kNow);

    REQUIRE(result.mode == RunMode::FullRecalc);
    REQUIRE(result.sessions_patched == 5);
    REQUIRE(result.sessions_written == 0);
    for (const auto& [date, fields] : h.rows()) {
        REQUIRE(SchemaTracker::diff(fields, SchemaTracker::expected_keys()).empty());
    }
    REQUIRE(h.rows()[kD0 + 1]["open"] == 12345.0);

    SECTION("A forced recalc rewrites every row") {
        auto forced = h.run(kNow, true);
        REQUIRE(forced.sessions_written == 5);
        REQUIRE(h.rows()[kD0 + 1]["open"] != 12345.0);
    }
}

TEST_CASE("A drift pass converges when rows can no longer be rebuilt", "[runner]") {
    Harness h;
    h.run(kNow);

    SECTION("Row whose raw candles are gone becomes a skip") {
        auto& raw = h.store->candles[kBtc];
        raw.erase(raw.lower_bound(utc_ms(kD0 + 2, 0)), raw.lower_bound(utc_ms(kD0 + 3, 0)));
        for (auto& [date, fields] : h.rows()) fields.erase("full_hit_ib_mid");

        auto result = h.run(kNow);

        REQUIRE(result.mode == RunMode::FullRecalc);
        REQUIRE(result.sessions_patched == 4);
        REQUIRE(result.sessions_skipped == 1);
        REQUIRE(h.rows().count(kD0 + 2) == 0);
        REQUIRE(h.store->skips[kBtc].count(kD0 + 2) == 1);
    }

    SECTION("Row older than the candle history is revisited") {
        h.store->upsert_session_metric(kBtc, kD0 - 3, {{"open", 1.0}});

        auto plan = h.plan(kNow);
        REQUIRE(plan.mode == RunMode::FullRecalc);
        REQUIRE(plan.scope.front() == kD0 - 3);

        auto result = h.run(kNow);

        REQUIRE(result.sessions_skipped == 1);
        REQUIRE(result.sessions_patched == 0);
        REQUIRE(h.rows().count(kD0 - 3) == 0);
        REQUIRE(h.rows().size() == 5);
    }

    auto next = h.plan(kNow);
    REQUIRE(next.drifted_keys.empty());
    REQUIRE(next.mode == RunMode::Append);
    REQUIRE(next.scope.empty());
    for (const auto& [date, fields] : h.rows()) {
        REQUIRE(SchemaTracker::diff(fields, SchemaTracker::expected_keys()).empty());
    }
}

TEST_CASE("Sessions without data get a skip record", "[runner]") {
    Harness h;
    for (int minute = 0; minute < 24 * 60; minute += 5) {
        h.source->missing.insert(utc_ms(kD0 + 3, minute));
    }

    auto result = h.run(kNow);

    REQUIRE(result.sessions_written == 4);
    REQUIRE(result.sessions_skipped == 1);
    REQUIRE(h.store->skips[kBtc][kD0 + 3] == FootprintBuilder::kSkipInsufficient);
    REQUIRE(h.rows()[kD0 + 4]["pdh"] == h.rows()[kD0 + 2]["high"]);

    auto plan = h.plan(kNow);
    REQUIRE(plan.mode == RunMode::Append);
    REQUIRE(plan.gap_dates.empty());
    REQUIRE(plan.scope.empty());
}

TEST_CASE("Cursor ahead of stored sessions is clamped", "[runner]") {
    Harness h;
    h.run(kNow);

    h.rows().erase(kD0 + 3);
    h.rows().erase(kD0 + 4);

    auto plan = h.plan(kNow);
    REQUIRE(plan.cursor_clamped);
    REQUIRE(plan.processed_cursor == kD0 + 2);
    REQUIRE(plan.scope == std::vector<SessionDate>{kD0 + 3, kD0 + 4});

    auto result = h.run(kNow);
    REQUIRE(result.sessions_written == 2);
    REQUIRE(h.rows().size() == 5);
}

namespace {

// Highest high of the twelve 5m candles opening at `ib_start_utc`
double synthetic_ib_high(int64_t ib_start_utc) {
    double high = 0.0;
    for (int i = 0; i < 12; ++i) {
        high = std::max(high, synthetic_candle(kBtc, ib_start_utc + i * 5 * util::kMsPerMinute).high);
    }
    return high;
}

} // namespace

TEST_CASE("New York clock with daylight saving and weekends", "[runner]") {
    Harness h;
    h.config.exchange_utc_offset_minutes = -300;
    h.config.exchange_dst_rule = "us";
    h.config.skip_weekends = true;
    h.config.earliest_date = "2024-03-01";

    SessionCalendar calendar(h.config);
    const SessionDate mar1 = date_of(2024, 3, 1);
    h.source = std::make_shared<FakeMarketSource>(calendar.day_start_ms(mar1),
                                                  5 * util::kMsPerMinute);
    h.runner = std::make_unique<SmartRunner>(h.config, h.source, h.store, h.store, h.cache, h.locks);

    // Just after midnight New York time on Saturday 2024-03-16
    const int64_t saturday = calendar.to_utc_ms(date_of(2024, 3, 16), 30);
    auto result = h.run(saturday);

    REQUIRE(result.status == AssetRunStatus::Ok);
    REQUIRE(result.mode == RunMode::FullRecalc);
    REQUIRE(result.sessions_written == 11);
    REQUIRE(h.rows().count(date_of(2024, 3, 2)) == 0);
    REQUIRE(h.rows().count(date_of(2024, 3, 10)) == 0);
    REQUIRE(h.store->cursors[kBtc].last_processed_session == date_of(2024, 3, 15));

    SECTION("Sessions follow the local clock across the switch") {
        // 09:30 New York is 14:30 UTC before 2024-03-10 and 13:30 UTC after
        REQUIRE(h.rows()[date_of(2024, 3, 8)]["ib_high"] ==
                synthetic_ib_high(utc_ms(date_of(2024, 3, 8), 14 * 60 + 30)));
        REQUIRE(h.rows()[date_of(2024, 3, 12)]["ib_high"] ==
                synthetic_ib_high(utc_ms(date_of(2024, 3, 12), 13 * 60 + 30)));
    }

    SECTION("Monday's prior session is Friday") {
        REQUIRE(h.rows()[date_of(2024, 3, 11)]["pdh"] == h.rows()[date_of(2024, 3, 8)]["high"]);
    }

    SECTION("A weekend is not a gap") {
        h.rows().erase(date_of(2024, 3, 11));

        auto plan = h.plan(saturday);
        REQUIRE(plan.mode == RunMode::SelfHeal);
        REQUIRE(plan.gap_dates == std::vector<SessionDate>{date_of(2024, 3, 11)});
    }

    SECTION("Append across the weekend") {
        const int64_t tuesday = calendar.to_utc_ms(date_of(2024, 3, 19), 30);

        auto plan = h.plan(tuesday);
        REQUIRE(plan.mode == RunMode::Append);

        auto appended = h.run(tuesday);
        REQUIRE(appended.mode == RunMode::Append);
        REQUIRE(appended.sessions_written == 1);
        REQUIRE(h.rows().size() == 12);
        REQUIRE(h.rows().count(date_of(2024, 3, 18)) == 1);
        REQUIRE(h.store->cursors[kBtc].last_processed_session == date_of(2024, 3, 18));
    }
}

TEST_CASE("Runner edge cases", "[runner]") {
    Harness h;

    SECTION("Nothing closed yet") {
        auto result = h.run(utc_ms(kD0, 30));
        REQUIRE(result.status == AssetRunStatus::Ok);
        REQUIRE(result.sessions_written == 0);
        REQUIRE(h.rows().empty());
    }

    SECTION("A locked asset is skipped without touching the source") {
        REQUIRE(h.locks->try_acquire(kBtc));
        auto result = h.run(kNow);
        REQUIRE(result.status == AssetRunStatus::Locked);
        REQUIRE(h.source->calls == 0);

        h.locks->release(kBtc);
        REQUIRE(h.run(kNow).status == AssetRunStatus::Ok);
        REQUIRE_FALSE(h.locks->is_locked(kBtc));
    }
}

TEST_CASE("Runs of one asset exclude each other across processes", "[runner]") {
    auto server = std::make_shared<FakeLockServer>();
    Harness h;
    h.locks = std::make_shared<AssetLocks>(server);
    h.runner = std::make_unique<SmartRunner>(h.config, h.source, h.store, h.store, h.cache, h.locks);

    // Another process running on the same database
    auto other = std::make_shared<AssetLocks>(server);

    SECTION("Lock held by the other process") {
        REQUIRE(other->try_acquire(kBtc));

        auto result = h.run(kNow);
        REQUIRE(result.status == AssetRunStatus::Locked);
        REQUIRE(h.source->calls == 0);
        REQUIRE(h.rows().empty());
        REQUIRE_FALSE(h.locks->is_locked(kBtc));

        other->release(kBtc);
        REQUIRE(server->held.empty());

        REQUIRE(h.run(kNow).status == AssetRunStatus::Ok);
        REQUIRE(server->held.empty());
    }

    SECTION("Only one process holds the lease") {
        REQUIRE(h.locks->try_acquire(kBtc));
        REQUIRE_FALSE(other->try_acquire(kBtc));
        h.locks->release(kBtc);
        REQUIRE(other->try_acquire(kBtc));
    }

    SECTION("Unreachable lock server fails the asset") {
        server->unreachable = true;

        auto result = h.run(kNow);
        REQUIRE(result.status == AssetRunStatus::PersistenceFailed);
        REQUIRE(h.source->calls == 0);
        REQUIRE_FALSE(h.locks->is_locked(kBtc));
    }
}

TEST_CASE("Failures stay with their asset", "[runner]") {
    Harness h({kBtc, kEth});
    h.source->available_until_ms = kNow;

    SECTION("Persistence failure") {
        h.store->failing_assets.insert(kEth);
        auto summary = h.runner->run_all_assets(kNow);

        REQUIRE(summary.succeeded == 1);
        REQUIRE(summary.failed == 1);
        REQUIRE(summary.assets[0].status == AssetRunStatus::Ok);
        REQUIRE(summary.assets[1].status == AssetRunStatus::PersistenceFailed);
        REQUIRE(h.store->metrics[kBtc].size() == 5);
        REQUIRE(h.store->metrics[kEth].empty());
        REQUIRE(h.cache->entries.count(ReportPublisher::kAssetsKey) == 1);
    }

    SECTION("Fetch failure") {
        h.source->failing_assets.insert(kBtc);
        auto summary = h.runner->run_all_assets(kNow);

        REQUIRE(summary.assets[0].status == AssetRunStatus::FetchFailed);
        REQUIRE(summary.assets[1].status == AssetRunStatus::Ok);
        REQUIRE(h.store->cursors.count(kBtc) == 0);
    }

    SECTION("Every asset failing on persistence is fatal") {
        h.store->failing_assets = {kBtc, kEth};
        REQUIRE_THROWS_AS(h.runner->run_all_assets(kNow), RunFatalError);
    }
}
