// table/relationship_table.h - Co-staff relationships from tenure rows
// Part of the staff network library (C++20)
//
// Turns raw (year, team, coach, role) rows into the two inputs of the
// co-staff graph: a roster of recently active coaches and one canonical
// relationship edge per coach pair that ever shared a staff.
//
// years_together counts distinct seasons, across any team: two coaches
// who moved together from one franchise to another keep accumulating
// tenure, and holding several roles in one season still counts once.
//
// The recency cutoff filters graph nodes only.  A pair whose members
// are both still active keeps its full shared history, including
// seasons before the cutoff.

#ifndef STAFFNET_TABLE_RELATIONSHIP_TABLE_H
#define STAFFNET_TABLE_RELATIONSHIP_TABLE_H

#include "../core/coach_types.h"
#include "../core/defaults.h"
#include "../graph/costaff_graph.h"
#include "closeness_table.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace staffnet {

namespace detail {

/// Most recent season per coach.
inline std::unordered_map<std::uint32_t, int>
last_active_year(std::vector<staff_row> const& rows) {
    std::unordered_map<std::uint32_t, int> last;
    for (auto const& r : rows) {
        auto [it, inserted] = last.emplace(r.coach.value, r.year);
        if (!inserted && r.year > it->second) it->second = r.year;
    }
    return last;
}

struct pair_accumulator {
    std::set<int> years;
    double sum_1 = 0.0;
    std::size_t n_1 = 0;
    double sum_2 = 0.0;
    std::size_t n_2 = 0;
};

struct coach_in_group {
    double sum = 0.0;
    std::size_t n = 0;
};

inline std::optional<double> mean_or_empty(double sum, std::size_t n) {
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

} // namespace detail

// =============================================================================
// Primary role per team-season
// =============================================================================

/// Keep, per (year, team, coach), only the row with the highest hierarchy
/// rank.  Ties keep the earlier row.  Relative row order is preserved.
[[nodiscard]] inline std::vector<staff_row>
primary_roles(std::vector<staff_row> const& rows, closeness_table const& closeness) {
    using key_t = std::tuple<int, std::string, std::uint32_t>;
    std::map<key_t, std::size_t> best;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto const& r = rows[i];
        key_t key{r.year, r.team, r.coach.value};
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(std::move(key), i);
            continue;
        }
        if (closeness.hierarchy_rank(r.role) >
            closeness.hierarchy_rank(rows[it->second].role)) {
            it->second = i;
        }
    }

    std::vector<bool> keep(rows.size(), false);
    for (auto const& [key, idx] : best) keep[idx] = true;

    std::vector<staff_row> out;
    out.reserve(best.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (keep[i]) out.push_back(rows[i]);
    }
    return out;
}

// =============================================================================
// Roster
// =============================================================================

/// One coach_record per coach whose most recent season >= recency_cutoff.
///
/// The record is taken from the coach's most recent row.  Several rows
/// in that season are ordered by higher hierarchy rank, then team name,
/// then role/side.  Output is sorted by coach id.
[[nodiscard]] inline std::vector<coach_record>
build_roster(std::vector<staff_row> const& rows,
             closeness_table const& closeness,
             int recency_cutoff = defaults::recency_cutoff) {
    std::map<std::uint32_t, std::size_t> latest;
    auto newer = [&](staff_row const& a, staff_row const& b) {
        if (a.year != b.year) return a.year > b.year;
        auto const ra = closeness.hierarchy_rank(a.role);
        auto const rb = closeness.hierarchy_rank(b.role);
        if (ra != rb) return ra > rb;
        if (a.team != b.team) return a.team < b.team;
        return a.role < b.role;
    };

    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto [it, inserted] = latest.emplace(rows[i].coach.value, i);
        if (!inserted && newer(rows[i], rows[it->second])) it->second = i;
    }

    std::vector<coach_record> roster;
    for (auto const& [id, idx] : latest) {
        auto const& r = rows[idx];
        if (r.year < recency_cutoff) continue;
        roster.push_back(coach_record{r.coach, r.coach_name, r.role, r.year, r.value});
    }
    return roster;
}

// =============================================================================
// Relationships
// =============================================================================

/// One relationship_edge per unordered pair of recently active coaches
/// that shared any (year, team).
///
/// - years_together: distinct shared seasons over the full history
/// - avg_value_k: mean of coach_k's row values inside the shared
///   (year, team) groups, each row counted once per group; empty if
///   none of those rows carried a value
///
/// Output is sorted by (coach_1, coach_2) with coach_1 < coach_2.
[[nodiscard]] inline std::vector<relationship_edge>
build_relationships(std::vector<staff_row> const& rows,
                    int recency_cutoff = defaults::recency_cutoff) {
    auto const last = detail::last_active_year(rows);

    std::map<season_team, std::map<std::uint32_t, detail::coach_in_group>> groups;
    for (auto const& r : rows) {
        if (last.at(r.coach.value) < recency_cutoff) continue;
        auto& slot = groups[season_team{r.year, r.team}][r.coach.value];
        if (r.value) {
            slot.sum += *r.value;
            slot.n += 1;
        }
    }

    std::map<std::pair<std::uint32_t, std::uint32_t>, detail::pair_accumulator> pairs;
    for (auto const& [st, members] : groups) {
        // std::map iteration gives ascending ids, so (a, b) is canonical.
        for (auto a = members.begin(); a != members.end(); ++a) {
            for (auto b = std::next(a); b != members.end(); ++b) {
                auto& acc = pairs[{a->first, b->first}];
                acc.years.insert(st.year);
                acc.sum_1 += a->second.sum;
                acc.n_1 += a->second.n;
                acc.sum_2 += b->second.sum;
                acc.n_2 += b->second.n;
            }
        }
    }

    std::vector<relationship_edge> edges;
    edges.reserve(pairs.size());
    for (auto const& [key, acc] : pairs) {
        relationship_edge e;
        e.coach_1 = coach_id{key.first};
        e.coach_2 = coach_id{key.second};
        e.years_together = static_cast<int>(acc.years.size());
        e.avg_value_1 = detail::mean_or_empty(acc.sum_1, acc.n_1);
        e.avg_value_2 = detail::mean_or_empty(acc.sum_2, acc.n_2);
        edges.push_back(std::move(e));
    }
    return edges;
}

// =============================================================================
// Graph
// =============================================================================

/// Roster + relationships -> co-staff graph.
[[nodiscard]] inline costaff_graph
build_costaff_graph(std::vector<staff_row> const& rows,
                    closeness_table const& closeness,
                    int recency_cutoff = defaults::recency_cutoff) {
    return costaff_graph::build(build_roster(rows, closeness, recency_cutoff),
                                build_relationships(rows, recency_cutoff));
}

} // namespace staffnet

#endif // STAFFNET_TABLE_RELATIONSHIP_TABLE_H
