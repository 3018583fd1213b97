// ranking/staff_summary.h - Per-head-coach staff statistics and rankings
// Part of the staff network library (C++20)
//
// A staff summary condenses one head coach's recommendation rows into a
// handful of comparable numbers.  Only the best candidate per position
// counts: the question is how strong a staff the head coach could
// actually hire, not how deep each candidate list is.
//
// Percentages are on a 0-100 scale.

#ifndef STAFFNET_RANKING_STAFF_SUMMARY_H
#define STAFFNET_RANKING_STAFF_SUMMARY_H

#include "../core/defaults.h"
#include "../staff/staff_assembler.h"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace staffnet {

// =============================================================================
// Parameters
// =============================================================================

struct ranking_params {
    double quality_threshold = defaults::quality_threshold;
    std::string coordinator_marker{defaults::coordinator_marker};
    std::size_t top_positions = defaults::top_positions;
};

// =============================================================================
// Result types
// =============================================================================

/// One candidate row tagged with the staff it came from.
struct tagged_candidate {
    std::string head_coach;
    std::string source;
    candidate_record candidate;
};

struct staff_summary {
    std::string head_coach;
    /// Where the rows came from (file name), empty for in-memory input.
    std::string source;

    std::size_t total_positions = 0;
    double avg_score = 0.0;
    double median_score = 0.0;
    /// Mean over top candidates with a value; empty if none had one.
    std::optional<double> avg_coach_value;
    double avg_years_together = 0.0;
    double pct_direct = 0.0;
    double pct_quality = 0.0;
    int total_years_experience = 0;
    /// Mean over coordinator positions; empty if the staff has none.
    std::optional<double> coordinator_avg;
    double top3_avg = 0.0;
};

struct staff_ranking {
    staff_summary summary;
    std::size_t overall_rank = 0;
    std::size_t coordinator_rank = 0;
    std::size_t experience_rank = 0;
};

/// Statistics of every candidate row for one (head coach, position).
struct position_aggregate {
    std::string head_coach;
    std::string position_key;
    role_side position;
    double avg_score = 0.0;
    double max_score = 0.0;
    std::size_t candidate_count = 0;
    std::optional<double> avg_coach_value;
    double avg_years_together = 0.0;
    double pct_direct = 0.0;
};

/// Best score per (position, head coach); 0 where no candidate was found.
struct position_score_matrix {
    std::vector<std::string> positions;
    std::vector<std::string> head_coaches;
    /// values[row][col], row = position, col = head coach.
    std::vector<std::vector<double>> values;

    /// 0.0 for unknown keys.
    [[nodiscard]] double at(std::string const& position, std::string const& head_coach) const {
        auto r = std::lower_bound(positions.begin(), positions.end(), position);
        auto c = std::lower_bound(head_coaches.begin(), head_coaches.end(), head_coach);
        if (r == positions.end() || *r != position) return 0.0;
        if (c == head_coaches.end() || *c != head_coach) return 0.0;
        return values[static_cast<std::size_t>(r - positions.begin())]
                     [static_cast<std::size_t>(c - head_coaches.begin())];
    }
};

// =============================================================================
// Helpers
// =============================================================================

namespace detail {

inline double mean(std::vector<double> const& v) {
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (double x : v) s += x;
    return s / static_cast<double>(v.size());
}

inline double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    auto const n = v.size();
    if (n % 2 == 1) return v[n / 2];
    return 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

inline double percent(std::size_t part, std::size_t whole) {
    if (whole == 0) return 0.0;
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

/// 1 + number of strictly greater present values; a missing value ranks
/// after every present value.
inline std::vector<std::size_t>
min_rank_desc(std::vector<std::optional<double>> const& v) {
    std::size_t present = 0;
    for (auto const& x : v) if (x) ++present;

    std::vector<std::size_t> out(v.size(), 0);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!v[i]) {
            out[i] = present + 1;
            continue;
        }
        std::size_t greater = 0;
        for (auto const& y : v) if (y && *y > *v[i]) ++greater;
        out[i] = greater + 1;
    }
    return out;
}

} // namespace detail

/// Highest-scoring row per target (role, side) (ties: lower coach id),
/// in (role, side) order.
[[nodiscard]] inline std::vector<candidate_record>
top_per_position(std::vector<candidate_record> const& rows) {
    std::map<role_side, candidate_record const*> best;
    for (auto const& r : rows) {
        auto it = best.find(r.target);
        if (it == best.end()) {
            best.emplace(r.target, &r);
            continue;
        }
        auto const* cur = it->second;
        if (r.score > cur->score || (r.score == cur->score && r.id < cur->id))
            it->second = &r;
    }
    std::vector<candidate_record> out;
    out.reserve(best.size());
    for (auto const& [key, r] : best) out.push_back(*r);
    return out;
}

// =============================================================================
// Summaries
// =============================================================================

[[nodiscard]] inline staff_summary
summarize_staff(std::string head_coach, std::vector<candidate_record> const& rows,
                ranking_params const& params = {}) {
    staff_summary s;
    s.head_coach = std::move(head_coach);

    auto const top = top_per_position(rows);
    s.total_positions = top.size();
    if (top.empty()) return s;

    std::vector<double> scores, values, coordinator;
    double years = 0.0;
    std::size_t direct = 0;
    std::size_t quality = 0;
    for (auto const& c : top) {
        scores.push_back(c.score);
        if (c.value) values.push_back(*c.value);
        years += static_cast<double>(c.years_together);
        s.total_years_experience += c.years_together;
        if (c.degree == 1) ++direct;
        if (c.score >= params.quality_threshold) ++quality;
        if (c.target.role.find(params.coordinator_marker) != std::string::npos)
            coordinator.push_back(c.score);
    }

    s.avg_score = detail::mean(scores);
    s.median_score = detail::median(scores);
    if (!values.empty()) s.avg_coach_value = detail::mean(values);
    s.avg_years_together = years / static_cast<double>(top.size());
    s.pct_direct = detail::percent(direct, top.size());
    s.pct_quality = detail::percent(quality, top.size());
    if (!coordinator.empty()) s.coordinator_avg = detail::mean(coordinator);

    auto best = scores;
    std::sort(best.begin(), best.end(), [](double a, double b) { return a > b; });
    if (best.size() > params.top_positions) best.resize(params.top_positions);
    s.top3_avg = detail::mean(best);
    return s;
}

/// Order summaries by avg_score (desc, ties by head coach name) and
/// assign overall, coordinator and experience ranks.
[[nodiscard]] inline std::vector<staff_ranking>
rank_staffs(std::vector<staff_summary> summaries) {
    std::sort(summaries.begin(), summaries.end(),
        [](staff_summary const& a, staff_summary const& b) {
            if (a.avg_score != b.avg_score) return a.avg_score > b.avg_score;
            return a.head_coach < b.head_coach;
        });

    std::vector<std::optional<double>> coord, exp;
    for (auto const& s : summaries) {
        coord.push_back(s.coordinator_avg);
        exp.push_back(static_cast<double>(s.total_years_experience));
    }
    auto const coord_rank = detail::min_rank_desc(coord);
    auto const exp_rank = detail::min_rank_desc(exp);

    std::vector<staff_ranking> out;
    out.reserve(summaries.size());
    for (std::size_t i = 0; i < summaries.size(); ++i) {
        out.push_back(staff_ranking{std::move(summaries[i]), i + 1,
                                    coord_rank[i], exp_rank[i]});
    }
    return out;
}

} // namespace staffnet

#endif // STAFFNET_RANKING_STAFF_SUMMARY_H
