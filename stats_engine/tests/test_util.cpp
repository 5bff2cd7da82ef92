#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"

TEST_CASE("Civil dates", "[util]") {
    SECTION("Epoch and weekday") {
        REQUIRE(util::days_from_civil(1970, 1, 1) == 0);
        REQUIRE(util::weekday_index(0) == 3);  // Thursday
        REQUIRE(util::weekday_index(util::days_from_civil(2024, 7, 1)) == 0);
        REQUIRE(util::weekday_name(6) == "Sunday");
    }

    SECTION("Format and parse") {
        int d = util::days_from_civil(2024, 2, 29);
        REQUIRE(util::format_date(d) == "2024-02-29");
        REQUIRE(util::parse_date("2024-02-29") == d);
        REQUIRE_FALSE(util::parse_date("2023-02-29").has_value());
        REQUIRE_FALSE(util::parse_date("2024-13-01").has_value());
        REQUIRE_FALSE(util::parse_date("yesterday").has_value());
    }

    SECTION("Negative day counts") {
        REQUIRE(util::format_date(-1) == "1969-12-31");
        REQUIRE(util::floor_div(-1, 5) == -1);
        REQUIRE(util::floor_div(10, 5) == 2);
    }
}

TEST_CASE("Clock strings", "[util]") {
    REQUIRE(util::parse_hhmm("09:30") == 570);
    REQUIRE(util::parse_hhmm("23:59") == 1439);
    REQUIRE_FALSE(util::parse_hhmm("24:00").has_value());
    REQUIRE_FALSE(util::parse_hhmm("0930").has_value());
    REQUIRE(util::format_hhmm(570) == "09:30");
    REQUIRE(util::iso8601_from_ms(0) == "1970-01-01T00:00:00Z");
}

TEST_CASE("DSN redaction", "[util]") {
    REQUIRE(util::redact_dsn("postgresql://user:secret@db:5432/stats") ==
            "postgresql://user:***@db:5432/stats");
    REQUIRE(util::redact_dsn("host=db password=secret dbname=stats") ==
            "host=db password=*** dbname=stats");
    REQUIRE(util::redact_dsn("host=db dbname=stats") == "host=db dbname=stats");
}

TEST_CASE("Split trims and drops empty tokens", "[util]") {
    auto parts = util::split(" BTC/USDT, ETH/USDT ,,SOL/USDT", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1] == "ETH/USDT");
}

TEST_CASE("Rounding", "[util]") {
    REQUIRE(util::round_to(2.345678, 2) == 2.35);
    REQUIRE(util::round_to(66.6666, 1) == 66.7);
}
