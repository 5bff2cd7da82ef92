#include "seasonality.hpp"
#include "ib_model.hpp"
#include "util.hpp"
#include <algorithm>

using metric_fields::flag;
using metric_fields::number;
using metric_fields::percent;

namespace {

struct WindowCounts {
    int sessions = 0, two_sided = 0, hit_05 = 0, hit_1 = 0, hit_2 = 0;
    int clean = 0, clean_05 = 0, clean_1 = 0, clean_2 = 0;

    void add(const nlohmann::json& f, const std::string& prefix) {
        sessions++;
        bool chop = flag(f, prefix + "high_broken") && flag(f, prefix + "low_broken");
        bool h05 = flag(f, prefix + "ext_05x");
        bool h1 = flag(f, prefix + "ext_1x");
        bool h2 = flag(f, prefix + "ext_2x");

        if (chop) two_sided++;
        if (h05) hit_05++;
        if (h1) hit_1++;
        if (h2) hit_2++;

        if (!chop) {
            clean++;
            if (h05) clean_05++;
            if (h1) clean_1++;
            if (h2) clean_2++;
        }
    }

    WeekdayWindowStats stats() const {
        WeekdayWindowStats s;
        s.sessions_count = sessions;
        s.two_sided_prob = percent(two_sided, sessions);
        s.hit_05x_prob = percent(hit_05, sessions);
        s.hit_1x_prob = percent(hit_1, sessions);
        s.hit_2x_prob = percent(hit_2, sessions);
        s.clean_sessions_count = clean;
        s.clean_hit_05x_prob = percent(clean_05, clean);
        s.clean_hit_1x_prob = percent(clean_1, clean);
        s.clean_hit_2x_prob = percent(clean_2, clean);
        return s;
    }
};

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    return n % 2 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

} // namespace

SeasonalityModel::SeasonalityModel(int min_bucket_sessions, bool include_weekends)
    : min_bucket_sessions_(min_bucket_sessions), include_weekends_(include_weekends) {}

std::vector<WeekdayBucket> SeasonalityModel::compute(const std::vector<SessionMetric>& metrics) const {
    const int days = include_weekends_ ? 7 : 5;

    std::vector<WindowCounts> session(days), full(days);
    std::vector<std::vector<double>> ranges(days);
    std::vector<int> bullish(days, 0);
    std::vector<double> return_sum(days, 0.0);

    for (const auto& m : metrics) {
        int wd = util::weekday_index(m.session_date);
        if (wd >= days) continue;

        session[wd].add(m.fields, "session_");
        full[wd].add(m.fields, "full_");

        double open = number(m.fields, "open");
        double close = number(m.fields, "close");
        if (open > 0.0) {
            ranges[wd].push_back(number(m.fields, "range") / open * 100.0);
            return_sum[wd] += (close - open) / open * 100.0;
        } else {
            ranges[wd].push_back(0.0);
        }
        if (close > open) bullish[wd]++;
    }

    std::vector<WeekdayBucket> buckets;
    for (int wd = 0; wd < days; ++wd) {
        WeekdayBucket b;
        b.weekday = util::weekday_name(wd);
        b.sessions_count = static_cast<int>(ranges[wd].size());
        b.low_confidence = b.sessions_count < min_bucket_sessions_;

        if (b.sessions_count > 0) {
            double sum = 0.0;
            for (double r : ranges[wd]) sum += r;
            b.mean_range_pct = util::round_to(sum / b.sessions_count, 3);
            b.median_range_pct = util::round_to(median(ranges[wd]), 3);
            b.bullish_share = percent(bullish[wd], b.sessions_count);
            b.mean_return_pct = util::round_to(return_sum[wd] / b.sessions_count, 3);
        }

        b.session = session[wd].stats();
        b.full_day = full[wd].stats();
        buckets.push_back(std::move(b));
    }
    return buckets;
}

nlohmann::json SeasonalityModel::chop_json(const std::vector<WeekdayBucket>& buckets, bool full_day) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& b : buckets) {
        const auto& w = full_day ? b.full_day : b.session;
        out[b.weekday] = {
            {"two_sided_prob", w.two_sided_prob},
            {"sessions_count", w.sessions_count},
            {"low_confidence", b.low_confidence}
        };
    }
    return out;
}

nlohmann::json SeasonalityModel::targets_json(const std::vector<WeekdayBucket>& buckets, bool full_day) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& b : buckets) {
        const auto& w = full_day ? b.full_day : b.session;
        out[b.weekday] = {
            {"hit_05x_prob", w.hit_05x_prob},
            {"hit_1x_prob", w.hit_1x_prob},
            {"hit_2x_prob", w.hit_2x_prob}
        };
    }
    return out;
}

nlohmann::json SeasonalityModel::targets_clean_json(const std::vector<WeekdayBucket>& buckets,
                                                    bool full_day) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& b : buckets) {
        const auto& w = full_day ? b.full_day : b.session;
        out[b.weekday] = {
            {"hit_05x_prob", w.clean_hit_05x_prob},
            {"hit_1x_prob", w.clean_hit_1x_prob},
            {"hit_2x_prob", w.clean_hit_2x_prob},
            {"clean_sessions_count", w.clean_sessions_count}
        };
    }
    return out;
}

nlohmann::json SeasonalityModel::profile_json(const std::vector<WeekdayBucket>& buckets) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& b : buckets) {
        out[b.weekday] = {
            {"sessions_count", b.sessions_count},
            {"mean_range_pct", b.mean_range_pct},
            {"median_range_pct", b.median_range_pct},
            {"bullish_share", b.bullish_share},
            {"mean_return_pct", b.mean_return_pct},
            {"low_confidence", b.low_confidence}
        };
    }
    return out;
}
