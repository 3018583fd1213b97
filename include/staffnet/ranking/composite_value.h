// ranking/composite_value.h - Personal and network value of head-coach candidates
// Part of the staff network library (C++20)
//
// Every co-staff pairing (coach, co-staffer, season, team) contributes
// one record to the coach:
//
//   personal term = value(coach) * decay(season)
//   network term  = value(co-staffer) * closeness(coach role -> HC) * decay(season)
//
// decay(season) = exp(-rate * (anchor_year - season)).  A head coach's
// own closeness is replaced by a fixed weight below 1 so that the
// network term still separates head coaches from each other.
//
//   composite = (2 * pct_rank(network mean) + personal mean + 3 * personal best) / 6
//
// The network mean enters as a percentile rank over all coaches because
// its raw scale depends on staff size.

#ifndef STAFFNET_RANKING_COMPOSITE_VALUE_H
#define STAFFNET_RANKING_COMPOSITE_VALUE_H

#include "../core/coach_types.h"
#include "../core/defaults.h"
#include "../table/closeness_table.h"
#include "candidate_clustering.h"
#include "staff_summary.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace staffnet {

struct composite_params {
    int anchor_year = defaults::decay_anchor_year;
    double decay_rate = defaults::decay_rate;
    double head_coach_closeness = defaults::head_coach_self_closeness;
    std::size_t min_records = defaults::min_candidate_records;
    int recency_cutoff = defaults::recency_cutoff;
};

struct composite_value {
    coach_id id{};
    std::string name;
    /// Co-staff pairings, self excluded.
    std::size_t record_count = 0;
    std::string last_team;
    int last_year = 0;
    role_side last_role;
    std::string last_subcategory;

    std::optional<double> personal_mean;
    std::optional<double> personal_best;
    std::optional<double> network_mean;
    /// Percentile rank of network_mean in [0, 1]; 0 when network_mean is empty.
    double network_pct_rank = 0.0;
    /// Empty unless personal_mean, personal_best and network_mean are all present.
    std::optional<double> composite;
};

[[nodiscard]] inline double decay_weight(int season, composite_params const& p = {}) {
    return std::exp(-p.decay_rate * static_cast<double>(p.anchor_year - season));
}

namespace detail {

struct composite_accumulator {
    std::size_t count = 0;
    double personal_sum = 0.0;
    std::size_t personal_n = 0;
    std::optional<double> personal_max;
    double network_sum = 0.0;
    std::size_t network_n = 0;
    std::size_t latest = 0;
    bool have_latest = false;
};

/// dplyr-style percent_rank: (min_rank - 1) / (n - 1) over present values.
inline std::vector<double> percent_rank(std::vector<std::optional<double>> const& v) {
    std::vector<double> present;
    for (auto const& x : v) if (x) present.push_back(*x);
    std::sort(present.begin(), present.end());

    std::vector<double> out(v.size(), 0.0);
    if (present.size() < 2) return out;
    auto const denom = static_cast<double>(present.size() - 1);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!v[i]) continue;
        auto const below = std::lower_bound(present.begin(), present.end(), *v[i]) -
                           present.begin();
        out[i] = static_cast<double>(below) / denom;
    }
    return out;
}

} // namespace detail

/// Composite value for every coach in rows, sorted by coach id.
///
/// Pass rows through primary_roles() first when a coach may hold several
/// roles in one team-season; every row here is one tenure.
[[nodiscard]] inline std::vector<composite_value>
composite_values(std::vector<staff_row> const& rows, closeness_table const& closeness,
                 composite_params const& params = {}) {
    std::map<season_team, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < rows.size(); ++i)
        groups[season_team{rows[i].year, rows[i].team}].push_back(i);

    auto role_weight = [&](role_side const& rs) -> std::optional<double> {
        if (rs.is_head_coach()) return params.head_coach_closeness;
        return closeness.closeness_to_head_coach(rs);
    };
    auto newer = [&](staff_row const& a, staff_row const& b) {
        if (a.year != b.year) return a.year > b.year;
        auto const ra = closeness.hierarchy_rank(a.role);
        auto const rb = closeness.hierarchy_rank(b.role);
        if (ra != rb) return ra > rb;
        if (a.team != b.team) return a.team < b.team;
        return a.role < b.role;
    };

    std::map<std::uint32_t, detail::composite_accumulator> acc;
    for (auto const& [st, members] : groups) {
        double const decay = decay_weight(st.year, params);
        for (auto i : members) {
            auto const& r = rows[i];
            auto& a = acc[r.coach.value];
            if (!a.have_latest || newer(r, rows[a.latest])) {
                a.latest = i;
                a.have_latest = true;
            }
            auto const w = role_weight(r.role);

            for (auto j : members) {
                auto const& s = rows[j];
                if (s.coach == r.coach) continue;
                ++a.count;
                if (r.value) {
                    double const p = *r.value * decay;
                    a.personal_sum += p;
                    ++a.personal_n;
                    if (!a.personal_max || p > *a.personal_max) a.personal_max = p;
                }
                if (s.value && w) {
                    a.network_sum += *s.value * *w * decay;
                    ++a.network_n;
                }
            }
        }
    }

    std::vector<composite_value> out;
    out.reserve(acc.size());
    for (auto const& [id, a] : acc) {
        auto const& last = rows[a.latest];
        composite_value v;
        v.id = coach_id{id};
        v.name = last.coach_name;
        v.record_count = a.count;
        v.last_team = last.team;
        v.last_year = last.year;
        v.last_role = last.role;
        v.last_subcategory = last.subcategory;
        if (a.personal_n > 0) {
            v.personal_mean = a.personal_sum / static_cast<double>(a.personal_n);
            v.personal_best = a.personal_max;
        }
        if (a.network_n > 0)
            v.network_mean = a.network_sum / static_cast<double>(a.network_n);
        out.push_back(std::move(v));
    }

    std::vector<std::optional<double>> network;
    network.reserve(out.size());
    for (auto const& v : out) network.push_back(v.network_mean);
    auto const pct = detail::percent_rank(network);

    for (std::size_t i = 0; i < out.size(); ++i) {
        auto& v = out[i];
        v.network_pct_rank = pct[i];
        if (v.personal_mean && v.personal_best && v.network_mean)
            v.composite = (2.0 * pct[i] + *v.personal_mean + 3.0 * *v.personal_best) / 6.0;
    }
    return out;
}

/// Coaches with at least min_records pairings and last_year >=
/// recency_cutoff, by composite descending (missing composites last,
/// ties by coach id).
[[nodiscard]] inline std::vector<composite_value>
filter_candidates(std::vector<composite_value> values, composite_params const& params = {}) {
    std::erase_if(values, [&](composite_value const& v) {
        return v.record_count < params.min_records || v.last_year < params.recency_cutoff;
    });
    std::sort(values.begin(), values.end(),
        [](composite_value const& a, composite_value const& b) {
            if (a.composite.has_value() != b.composite.has_value())
                return a.composite.has_value();
            if (a.composite && *a.composite != *b.composite)
                return *a.composite > *b.composite;
            return a.id < b.id;
        });
    return values;
}

/// Join candidates with their staff rankings by name.  Candidates with no
/// composite, no ranking or no staff value are dropped.
[[nodiscard]] inline std::vector<candidate_point>
candidate_points(std::vector<composite_value> const& candidates,
                 std::vector<staff_ranking> const& rankings) {
    std::unordered_map<std::string, staff_summary const*> by_name;
    for (auto const& r : rankings) by_name.emplace(r.summary.head_coach, &r.summary);

    std::vector<candidate_point> out;
    for (auto const& c : candidates) {
        if (!c.composite) continue;
        auto it = by_name.find(c.name);
        if (it == by_name.end() || !it->second->avg_coach_value) continue;
        out.push_back(candidate_point{c.name, *c.composite, *it->second->avg_coach_value});
    }
    return out;
}

} // namespace staffnet

#endif // STAFFNET_RANKING_COMPOSITE_VALUE_H
