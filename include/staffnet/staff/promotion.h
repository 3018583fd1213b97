// staff/promotion.h - Permissible next roles for a coach
// Part of the staff network library (C++20)
//
// A coach may move sideways or climb at most one step up the head-coach
// ladder.  Steps are measured in closeness to Head Coach: from a current
// closeness c, every rung with closeness in [c, c + step] is a target.
//
// Side of ball is kept: an offensive coach stays on offense (or takes a
// "Both" role).  A coach whose current side is "Both" may go to either
// side.
//
// A role/side that is not on the ladder maps to itself.  Unknown roles
// never fail; they simply can only fill their own position.

#ifndef STAFFNET_STAFF_PROMOTION_H
#define STAFFNET_STAFF_PROMOTION_H

#include "../core/coach_types.h"
#include "../core/defaults.h"
#include "../table/closeness_table.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

namespace staffnet {

class promotion_mapper {
public:
    /// Throws std::invalid_argument if step is negative.
    explicit promotion_mapper(closeness_table const& table,
                              double step = defaults::promotion_step)
        : ladder_(table.head_coach_ladder()), step_(step) {
        if (!(step >= 0.0))
            throw std::invalid_argument("promotion_mapper: step must be >= 0");
    }

    [[nodiscard]] std::vector<ladder_rung> const& ladder() const noexcept { return ladder_; }
    [[nodiscard]] double step() const noexcept { return step_; }

    /// Closeness of the current position on the ladder: the first rung
    /// with the same role whose side is the current side or "Both".
    [[nodiscard]] std::optional<double> current_closeness(role_side const& current) const {
        for (auto const& r : ladder_) {
            if (r.position.role != current.role) continue;
            if (r.position.side == current.side || r.position.side == side_both)
                return r.closeness;
        }
        return std::nullopt;
    }

    /// Positions reachable in one move, in ladder order, without duplicates.
    [[nodiscard]] std::vector<role_side> targets(role_side const& current) const {
        auto c = current_closeness(current);
        if (!c) return {current};

        std::vector<role_side> out;
        for (auto const& r : ladder_) {
            if (r.closeness < *c || r.closeness > *c + step_) continue;
            if (current.side != side_both &&
                r.position.side != current.side && r.position.side != side_both)
                continue;
            if (std::find(out.begin(), out.end(), r.position) != out.end()) continue;
            out.push_back(r.position);
        }
        return out;
    }

    /// True if a coach at `current` may take `position`.  A "Both"
    /// position accepts a target of its role on any side.
    [[nodiscard]] bool can_fill(role_side const& current, role_side const& position) const {
        for (auto const& t : targets(current)) {
            if (t.role != position.role) continue;
            if (t.side == position.side || position.side == side_both) return true;
        }
        return false;
    }

    /// Staff positions to fill: every ladder rung except Head Coach.
    [[nodiscard]] std::vector<role_side> open_positions() const {
        std::vector<role_side> out;
        for (auto const& r : ladder_) {
            if (r.position.is_head_coach()) continue;
            out.push_back(r.position);
        }
        return out;
    }

private:
    std::vector<ladder_rung> ladder_;
    double step_;
};

} // namespace staffnet

#endif // STAFFNET_STAFF_PROMOTION_H
