#include <catch2/catch_test_macros.hpp>
#include "../src/ib_model.hpp"

namespace {

SessionMetric row(SessionDate date, nlohmann::json fields) {
    return SessionMetric{"BTC/USDT", date, std::move(fields)};
}

std::vector<SessionMetric> sample() {
    return {
        row(1, {{"session_high_broken", true}, {"session_low_broken", false},
                {"session_false_break_high", true}, {"session_ext_05x", true},
                {"session_ext_coeff", 0.5}, {"pdh", 100.0}, {"pdl", 90.0},
                {"session_hit_pdh", true}, {"session_hit_ib_mid", true},
                {"ib_range_usd", 10.0}, {"ib_range_pct", 1.0}, {"ib_vol", 100.0},
                {"after_hours_hit_ib", true}}),
        row(2, {{"session_high_broken", true}, {"session_low_broken", true},
                {"session_ext_05x", true}, {"session_ext_1x", true},
                {"session_ext_coeff", 1.5}, {"pdh", 100.0}, {"pdl", 90.0},
                {"session_hit_pdl", true},
                {"ib_range_usd", 20.0}, {"ib_range_pct", 2.0}, {"ib_vol", 200.0}}),
        row(3, {{"session_high_broken", false}, {"session_low_broken", false},
                {"session_ext_coeff", 0.0}, {"pdh", nullptr}, {"pdl", nullptr},
                {"ib_range_usd", 30.0}, {"ib_range_pct", 3.0}, {"ib_vol", 300.0},
                {"after_hours_hit_ib", true}}),
        row(4, {{"session_low_broken", true}, {"session_ext_05x", true},
                {"session_ext_coeff", 1.0}, {"pdh", 100.0}, {"pdl", 90.0},
                {"ib_range_usd", 40.0}, {"ib_range_pct", 4.0}, {"ib_vol", 401.0}}),
    };
}

} // namespace

TEST_CASE("IB breakout statistics", "[ib_model]") {
    IbModel model(20);
    auto result = model.compute(sample());
    const auto& s = result.session;

    SECTION("Breakout chances") {
        REQUIRE(s.sessions == 4);
        REQUIRE(s.break_high_chance == 50.0);
        REQUIRE(s.break_low_chance == 50.0);
        REQUIRE(s.one_sided_chance == 50.0);
        REQUIRE(s.two_sided_chance == 25.0);
        REQUIRE(s.no_breakout_chance == 25.0);
    }

    SECTION("False breaks are rated against breaks of the same side") {
        REQUIRE(s.false_break_high_rate == 50.0);
        REQUIRE(s.false_break_low_rate == 0.0);
    }

    SECTION("Extension targets") {
        REQUIRE(s.prob_hit_05x == 75.0);
        REQUIRE(s.prob_hit_1x == 25.0);
        REQUIRE(s.prob_hit_2x == 0.0);
        REQUIRE(s.avg_extension_coeff == 0.75);
    }

    SECTION("Prior levels only over sessions that have them") {
        REQUIRE(s.prior_sessions == 3);
        REQUIRE(s.prob_hit_pdh == 33.3);
        REQUIRE(s.prob_hit_pdl == 33.3);
        REQUIRE(s.prob_pdh_if_ibh_broken == 50.0);
        REQUIRE(s.prob_pdl_if_ibl_broken == 50.0);
    }

    SECTION("Mid retest over breakout sessions") {
        REQUIRE(s.breakout_sessions == 3);
        REQUIRE(s.prob_ib_mid_retest == 33.3);
    }

    SECTION("Averages") {
        REQUIRE(result.avg_ib_range_usd == 25.0);
        REQUIRE(result.avg_ib_range_pct == 2.5);
        REQUIRE(result.avg_ib_volume == 250);
        REQUIRE(result.prob_return_to_ib_after_session == 50.0);
    }

    SECTION("Full-day window is computed from its own columns") {
        REQUIRE(result.full_day.sessions == 4);
        REQUIRE(result.full_day.break_high_chance == 0.0);
        REQUIRE(result.full_day.no_breakout_chance == 100.0);
    }
}

TEST_CASE("Low sample flagging", "[ib_model]") {
    SECTION("Below the minimum sample") {
        auto result = IbModel(20).compute(sample());
        REQUIRE(result.low_confidence);
        REQUIRE(result.session.low_confidence);

        auto json = IbModel::to_json(result.session);
        REQUIRE(json["low_confidence"] == true);
        REQUIRE(json["sample_sizes"]["sessions"] == 4);
    }

    SECTION("At the minimum sample") {
        auto result = IbModel(4).compute(sample());
        REQUIRE_FALSE(result.low_confidence);
        REQUIRE_FALSE(result.full_day.low_confidence);
    }

    SECTION("Empty input") {
        auto result = IbModel(20).compute({});
        REQUIRE(result.sessions == 0);
        REQUIRE(result.low_confidence);
        REQUIRE(result.session.break_high_chance == 0.0);
    }
}

TEST_CASE("Drifted rows read as absent", "[ib_model]") {
    nlohmann::json fields = {{"session_high_broken", nullptr}, {"session_ext_coeff", "n/a"}};
    REQUIRE_FALSE(metric_fields::flag(fields, "session_high_broken"));
    REQUIRE(metric_fields::number(fields, "session_ext_coeff") == 0.0);
    REQUIRE_FALSE(metric_fields::has_value(fields, "pdh"));
    REQUIRE(metric_fields::percent(1, 0) == 0.0);
}
