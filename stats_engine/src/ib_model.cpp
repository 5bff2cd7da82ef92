#include "ib_model.hpp"
#include "util.hpp"
#include <cmath>

namespace metric_fields {

bool flag(const nlohmann::json& fields, const std::string& key) {
    auto it = fields.find(key);
    return it != fields.end() && it->is_boolean() && it->get<bool>();
}

double number(const nlohmann::json& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

bool has_value(const nlohmann::json& fields, const std::string& key) {
    auto it = fields.find(key);
    return it != fields.end() && !it->is_null();
}

double percent(int count, int total) {
    if (total <= 0) return 0.0;
    return util::round_to(static_cast<double>(count) / total * 100.0, 1);
}

} // namespace metric_fields

using metric_fields::flag;
using metric_fields::number;
using metric_fields::percent;

IbModel::IbModel(int min_sample_sessions) : min_sample_sessions_(min_sample_sessions) {}

IbWindowStats IbModel::compute_window(const std::vector<SessionMetric>& metrics,
                                      const std::string& prefix) const {
    IbWindowStats s;
    s.sessions = static_cast<int>(metrics.size());
    s.low_confidence = s.sessions < min_sample_sessions_;
    if (metrics.empty()) return s;

    int high = 0, low = 0, two_sided = 0, one_sided = 0, none = 0;
    int false_high = 0, false_low = 0;
    int hit_05 = 0, hit_1 = 0, hit_2 = 0;
    double coeff_sum = 0.0;
    int pdh_hits = 0, pdl_hits = 0, pdh_after_ibh = 0, pdl_after_ibl = 0;
    int ibh_with_prior = 0, ibl_with_prior = 0;
    int retests = 0;

    for (const auto& m : metrics) {
        const auto& f = m.fields;
        bool hb = flag(f, prefix + "high_broken");
        bool lb = flag(f, prefix + "low_broken");

        if (hb) high++;
        if (lb) low++;
        if (hb && lb) two_sided++;
        else if (hb || lb) one_sided++;
        else none++;

        if (hb && flag(f, prefix + "false_break_high")) false_high++;
        if (lb && flag(f, prefix + "false_break_low")) false_low++;

        if (flag(f, prefix + "ext_05x")) hit_05++;
        if (flag(f, prefix + "ext_1x")) hit_1++;
        if (flag(f, prefix + "ext_2x")) hit_2++;
        coeff_sum += number(f, prefix + "ext_coeff");

        // First session in history has no prior levels
        if (metric_fields::has_value(f, "pdh")) {
            s.prior_sessions++;
            bool hit_pdh = flag(f, prefix + "hit_pdh");
            bool hit_pdl = flag(f, prefix + "hit_pdl");
            if (hit_pdh) pdh_hits++;
            if (hit_pdl) pdl_hits++;
            if (hb) {
                ibh_with_prior++;
                if (hit_pdh) pdh_after_ibh++;
            }
            if (lb) {
                ibl_with_prior++;
                if (hit_pdl) pdl_after_ibl++;
            }
        }

        if (hb || lb) {
            s.breakout_sessions++;
            if (flag(f, prefix + "hit_ib_mid")) retests++;
        }
    }

    s.break_high_chance = percent(high, s.sessions);
    s.break_low_chance = percent(low, s.sessions);
    s.one_sided_chance = percent(one_sided, s.sessions);
    s.two_sided_chance = percent(two_sided, s.sessions);
    s.no_breakout_chance = percent(none, s.sessions);

    s.high_breaks = high;
    s.low_breaks = low;
    s.false_break_high_rate = percent(false_high, high);
    s.false_break_low_rate = percent(false_low, low);

    s.prob_hit_05x = percent(hit_05, s.sessions);
    s.prob_hit_1x = percent(hit_1, s.sessions);
    s.prob_hit_2x = percent(hit_2, s.sessions);
    s.avg_extension_coeff = util::round_to(coeff_sum / s.sessions, 2);

    s.prob_hit_pdh = percent(pdh_hits, s.prior_sessions);
    s.prob_hit_pdl = percent(pdl_hits, s.prior_sessions);
    s.prob_pdh_if_ibh_broken = percent(pdh_after_ibh, ibh_with_prior);
    s.prob_pdl_if_ibl_broken = percent(pdl_after_ibl, ibl_with_prior);

    s.prob_ib_mid_retest = percent(retests, s.breakout_sessions);
    return s;
}

IbModelResult IbModel::compute(const std::vector<SessionMetric>& metrics) const {
    IbModelResult r;
    r.sessions = static_cast<int>(metrics.size());
    r.low_confidence = r.sessions < min_sample_sessions_;

    r.session = compute_window(metrics, "session_");
    r.full_day = compute_window(metrics, "full_");

    if (metrics.empty()) return r;

    double usd = 0.0, pct = 0.0, vol = 0.0;
    int returned = 0;
    for (const auto& m : metrics) {
        usd += number(m.fields, "ib_range_usd");
        pct += number(m.fields, "ib_range_pct");
        vol += number(m.fields, "ib_vol");
        if (flag(m.fields, "after_hours_hit_ib")) returned++;
    }

    r.avg_ib_range_usd = util::round_to(usd / r.sessions, 2);
    r.avg_ib_range_pct = util::round_to(pct / r.sessions, 3);
    r.avg_ib_volume = static_cast<int64_t>(vol / r.sessions);
    r.prob_return_to_ib_after_session = percent(returned, r.sessions);
    return r;
}

nlohmann::json IbModel::to_json(const IbWindowStats& s) {
    return {
        {"break_high_chance", s.break_high_chance},
        {"break_low_chance", s.break_low_chance},
        {"one_sided_chance", s.one_sided_chance},
        {"two_sided_chance", s.two_sided_chance},
        {"no_breakout_chance", s.no_breakout_chance},
        {"false_break_high_rate", s.false_break_high_rate},
        {"false_break_low_rate", s.false_break_low_rate},
        {"prob_hit_05x", s.prob_hit_05x},
        {"prob_hit_1x", s.prob_hit_1x},
        {"prob_hit_2x", s.prob_hit_2x},
        {"avg_extension_coeff", s.avg_extension_coeff},
        {"prob_hit_pdh", s.prob_hit_pdh},
        {"prob_hit_pdl", s.prob_hit_pdl},
        {"prob_pdh_if_ibh_broken", s.prob_pdh_if_ibh_broken},
        {"prob_pdl_if_ibl_broken", s.prob_pdl_if_ibl_broken},
        {"prob_ib_mid_retest", s.prob_ib_mid_retest},
        {"sample_sizes", {
            {"sessions", s.sessions},
            {"high_breaks", s.high_breaks},
            {"low_breaks", s.low_breaks},
            {"prior_sessions", s.prior_sessions},
            {"breakout_sessions", s.breakout_sessions}
        }},
        {"low_confidence", s.low_confidence}
    };
}
