// core/run_stats.h - Counters from one staff assembly run
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// assembly_stats is a trivially copyable aggregate attached to every
// staff_recommendation.  All counters default to 0; a strategy fills
// the subset it tracks.  Stats from independent runs add together so a
// batch over many head coaches can report totals.

#ifndef STAFFNET_CORE_RUN_STATS_H
#define STAFFNET_CORE_RUN_STATS_H

#include <cstddef>

namespace staffnet {

/// Statistics collected while assembling one staff.
struct assembly_stats {
    // =========================================================================
    // Pool
    // =========================================================================

    /// Coaches within max_degree of the target (excluding the target).
    std::size_t pool_size = 0;

    // =========================================================================
    // Candidates
    // =========================================================================

    /// (position, coach) pairs examined.
    std::size_t candidates_total = 0;

    /// Pairs that passed the promotion filter and were scored.
    std::size_t candidates_evaluated = 0;

    /// Pairs rejected by the promotion filter or already assigned.
    std::size_t candidates_pruned = 0;

    // =========================================================================
    // Positions
    // =========================================================================

    /// Open positions in the catalog.
    std::size_t positions_total = 0;

    /// Positions with an assigned candidate.
    std::size_t positions_filled = 0;

    /// Positions with no eligible candidate (no row emitted).
    std::size_t positions_skipped = 0;

    // =========================================================================
    // Aggregation
    // =========================================================================

    constexpr assembly_stats operator+(assembly_stats const& other) const {
        return assembly_stats{
            .pool_size = pool_size + other.pool_size,
            .candidates_total = candidates_total + other.candidates_total,
            .candidates_evaluated = candidates_evaluated + other.candidates_evaluated,
            .candidates_pruned = candidates_pruned + other.candidates_pruned,
            .positions_total = positions_total + other.positions_total,
            .positions_filled = positions_filled + other.positions_filled,
            .positions_skipped = positions_skipped + other.positions_skipped,
        };
    }

    constexpr assembly_stats& operator+=(assembly_stats const& other) {
        *this = *this + other;
        return *this;
    }

    /// Fraction of catalog positions filled (0.0 when the catalog is empty).
    [[nodiscard]] constexpr double fill_rate() const {
        if (positions_total == 0) return 0.0;
        return static_cast<double>(positions_filled) /
               static_cast<double>(positions_total);
    }
};

} // namespace staffnet

#endif // STAFFNET_CORE_RUN_STATS_H
