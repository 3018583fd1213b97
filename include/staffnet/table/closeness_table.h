// table/closeness_table.h - Directed role/side closeness relation
// Part of the staff network library (C++20)
//
// A closeness entry says how near one (role, side) sits to another on
// the coaching ladder, in [0, 1], plus a hierarchy rank for the source
// role (higher = more senior).  The relation is directed: the closeness
// of a position coach to Head Coach says nothing about the reverse.
//
// The table is immutable once built and shared by const reference
// between the promotion mapper, roster builder and composite scorer.

#ifndef STAFFNET_TABLE_CLOSENESS_TABLE_H
#define STAFFNET_TABLE_CLOSENESS_TABLE_H

#include "../core/coach_types.h"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace staffnet {

/// One row of the closeness table.
struct closeness_entry {
    role_side from;
    role_side to;
    double closeness = 0.0;
    int hierarchy_rank = 0;
};

/// One rung of the head-coach ladder: a role/side and its closeness to
/// Head Coach.
struct ladder_rung {
    role_side position;
    double closeness = 0.0;
};

/// Rank reported for role/side pairs with no table entry.
inline constexpr int unknown_hierarchy_rank = 0;

/// Directed (role_from, side_from) -> (role_to, side_to) closeness relation.
class closeness_table {
public:
    closeness_table() = default;

    explicit closeness_table(std::vector<closeness_entry> entries) {
        for (auto& e : entries) add(std::move(e));
    }

    /// Add an entry.  A repeated (from, to) key replaces the closeness
    /// and rank of the earlier entry but keeps its table position.
    ///
    /// Throws std::invalid_argument if closeness is outside [0, 1].
    void add(closeness_entry e) {
        if (!(e.closeness >= 0.0 && e.closeness <= 1.0))
            throw std::invalid_argument(
                "closeness_table: closeness outside [0, 1] for " +
                e.from.position_key() + " -> " + e.to.position_key());

        auto key = std::make_pair(e.from, e.to);
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second] = std::move(e);
            return;
        }
        index_.emplace(std::move(key), entries_.size());
        entries_.push_back(std::move(e));
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::vector<closeness_entry> const& entries() const noexcept {
        return entries_;
    }

    /// Closeness of from -> to, or empty if the pair is not in the table.
    [[nodiscard]] std::optional<double>
    closeness(role_side const& from, role_side const& to) const {
        auto it = index_.find(std::make_pair(from, to));
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second].closeness;
    }

    /// Closeness of rs to the head-coach role, first matching entry in
    /// table order (any head-coach side).
    [[nodiscard]] std::optional<double>
    closeness_to_head_coach(role_side const& rs) const {
        for (auto const& e : entries_) {
            if (e.from == rs && e.to.is_head_coach()) return e.closeness;
        }
        return std::nullopt;
    }

    /// Highest hierarchy rank recorded for rs as a source role, or
    /// unknown_hierarchy_rank if rs never appears as a source.
    [[nodiscard]] int hierarchy_rank(role_side const& rs) const {
        int best = unknown_hierarchy_rank;
        bool found = false;
        for (auto const& e : entries_) {
            if (e.from != rs) continue;
            if (!found || e.hierarchy_rank > best) best = e.hierarchy_rank;
            found = true;
        }
        return best;
    }

    /// The head-coach ladder.
    ///
    /// Entries whose target role is Head Coach, excluding "Both"-side
    /// sources other than Head Coach itself, in table order, one rung per
    /// source role/side.
    [[nodiscard]] std::vector<ladder_rung> head_coach_ladder() const {
        std::vector<ladder_rung> ladder;
        for (auto const& e : entries_) {
            if (!e.to.is_head_coach()) continue;
            if (e.from.side == side_both && !e.from.is_head_coach()) continue;
            auto dup = std::find_if(ladder.begin(), ladder.end(),
                [&](ladder_rung const& r) { return r.position == e.from; });
            if (dup != ladder.end()) continue;
            ladder.push_back(ladder_rung{e.from, e.closeness});
        }
        return ladder;
    }

private:
    std::vector<closeness_entry> entries_;
    std::map<std::pair<role_side, role_side>, std::size_t> index_;
};

} // namespace staffnet

#endif // STAFFNET_TABLE_CLOSENESS_TABLE_H
