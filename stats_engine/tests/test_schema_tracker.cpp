#include <catch2/catch_test_macros.hpp>
#include "../src/schema_tracker.hpp"
#include <algorithm>

TEST_CASE("Schema drift", "[schema]") {
    const std::vector<std::string> expected = {"open", "close", "ib_high"};

    SECTION("Complete rows do not drift") {
        std::vector<SessionMetric> rows = {
            {"BTC/USDT", 1, {{"open", 1.0}, {"close", 2.0}, {"ib_high", 3.0}}},
            {"BTC/USDT", 2, {{"open", 1.0}, {"close", 2.0}, {"ib_high", 3.0}, {"extra", 1}}},
        };
        REQUIRE(SchemaTracker::drifted_keys(rows, expected).empty());
    }

    SECTION("A key missing from any row is reported once") {
        std::vector<SessionMetric> rows = {
            {"BTC/USDT", 1, {{"open", 1.0}, {"close", 2.0}}},
            {"BTC/USDT", 2, {{"open", 1.0}}},
        };
        auto drifted = SchemaTracker::drifted_keys(rows, expected);
        REQUIRE(drifted == std::set<std::string>{"close", "ib_high"});
    }

    SECTION("Null values count as present") {
        nlohmann::json fields = {{"open", 1.0}, {"close", nullptr}, {"ib_high", 3.0}};
        REQUIRE(SchemaTracker::diff(fields, expected).empty());
    }

    SECTION("Patch carries only the missing keys") {
        nlohmann::json existing = {{"open", 1.0}};
        nlohmann::json computed = {{"open", 9.0}, {"close", 2.0}, {"ib_high", 3.0}};
        auto patch = SchemaTracker::missing_patch(existing, computed, expected);

        REQUIRE(patch.size() == 2);
        REQUIRE(patch["close"] == 2.0);
        REQUIRE_FALSE(patch.contains("open"));
    }

    SECTION("Current key set") {
        const auto& keys = SchemaTracker::expected_keys();
        REQUIRE(keys.size() == 44);
        REQUIRE(std::find(keys.begin(), keys.end(), "full_ext_05x") != keys.end());
    }
}
