#include <catch2/catch_test_macros.hpp>
#include "../src/session_calendar.hpp"
#include "fakes.hpp"

namespace {

constexpr int64_t kMinute = util::kMsPerMinute;

// New York: EST base with US daylight saving, weekends closed
SessionCalendar new_york(int grace_minutes = 0) {
    return SessionCalendar(-300, true, 23 * 60 + 59, grace_minutes, true);
}

} // namespace

TEST_CASE("Exchange clock follows US daylight saving", "[calendar]") {
    auto cal = new_york();

    SECTION("Spring forward at 02:00 EST on the second Sunday of March") {
        SessionDate mar10 = date_of(2024, 3, 10);
        REQUIRE(cal.offset_minutes_at(utc_ms(mar10, 7 * 60) - 1) == -300);
        REQUIRE(cal.offset_minutes_at(utc_ms(mar10, 7 * 60)) == -240);
    }

    SECTION("Fall back at 02:00 EDT on the first Sunday of November") {
        SessionDate nov3 = date_of(2024, 11, 3);
        REQUIRE(cal.offset_minutes_at(utc_ms(nov3, 6 * 60) - 1) == -240);
        REQUIRE(cal.offset_minutes_at(utc_ms(nov3, 6 * 60)) == -300);
    }

    SECTION("Local wall clock to UTC") {
        REQUIRE(cal.to_utc_ms(date_of(2024, 7, 1), 570) == utc_ms(date_of(2024, 7, 1), 13 * 60 + 30));
        REQUIRE(cal.to_utc_ms(date_of(2024, 1, 2), 570) == utc_ms(date_of(2024, 1, 2), 14 * 60 + 30));
    }

    SECTION("Late UTC candles belong to the previous local date") {
        int64_t ts = utc_ms(date_of(2024, 7, 2), 3 * 60 + 59);
        REQUIRE(cal.session_date_of(ts) == date_of(2024, 7, 1));
        REQUIRE(cal.minute_of_day(ts) == 1439);
    }

    SECTION("Close is the end of the DAY_CLOSE minute") {
        REQUIRE(cal.close_ms(date_of(2024, 7, 1)) == utc_ms(date_of(2024, 7, 2), 4 * 60));
        REQUIRE(cal.day_end_ms(date_of(2024, 7, 1)) == cal.day_start_ms(date_of(2024, 7, 2)));
    }
}

TEST_CASE("Trading days", "[calendar]") {
    auto cal = new_york();

    auto days = cal.trading_days(date_of(2024, 7, 5), date_of(2024, 7, 8));
    REQUIRE(days.size() == 2);
    REQUIRE(days[0] == date_of(2024, 7, 5));
    REQUIRE(days[1] == date_of(2024, 7, 8));

    REQUIRE(cal.previous_trading_day(date_of(2024, 7, 8), 7) == date_of(2024, 7, 5));
    REQUIRE_FALSE(cal.is_trading_day(date_of(2024, 7, 6)));

    SessionCalendar every_day(0, false, 1439, 0, false);
    REQUIRE(every_day.is_trading_day(date_of(2024, 7, 6)));
}

TEST_CASE("Latest closed session", "[calendar]") {
    const SessionDate mon = date_of(2024, 7, 1);
    const SessionDate fri = date_of(2024, 6, 28);
    const int64_t close = utc_ms(date_of(2024, 7, 2), 4 * 60);

    SECTION("Nothing ingested means nothing closed") {
        REQUIRE_FALSE(new_york().latest_closed_session(close, std::nullopt, kMinute).has_value());
    }

    SECTION("Closed once the clock passes close and the last candle is stored") {
        auto cal = new_york();
        REQUIRE(cal.latest_closed_session(close, close - kMinute, kMinute) == mon);
        REQUIRE(cal.latest_closed_session(close - 1, close - kMinute, kMinute) == fri);
    }

    SECTION("Missing the final candle keeps the session open") {
        auto cal = new_york();
        REQUIRE(cal.latest_closed_session(close + 60 * kMinute, close - 2 * kMinute, kMinute) == fri);
    }

    SECTION("Grace period delays the close") {
        auto cal = new_york(10);
        REQUIRE(cal.latest_closed_session(close + 5 * kMinute, close - kMinute, kMinute) == fri);
        REQUIRE(cal.latest_closed_session(close + 10 * kMinute, close - kMinute, kMinute) == mon);
    }
}
