// core/coach_types.h - Descriptor and record types for staff analysis
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// coach_id is an opaque strong handle, kept distinct from the dense
// graph node_id so that identifiers from the source dataset never leak
// into CSR indexing.  All semantics (name, role, value) live in
// coach_record; the graph stores only topology.
//
// Role categories and sides of the ball are open string vocabularies
// produced upstream by job-title classification.  The only values the
// library interprets are the head-coach role and the "Both" side.

#ifndef STAFFNET_CORE_COACH_TYPES_H
#define STAFFNET_CORE_COACH_TYPES_H

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace staffnet {

// =============================================================================
// Descriptor Type
// =============================================================================

/// Opaque coach identifier, stable across runs of the same dataset.
struct coach_id {
    std::uint32_t value{};

    friend constexpr bool operator==(coach_id, coach_id) = default;
    friend constexpr auto operator<=>(coach_id, coach_id) = default;
};

/// Sentinel for unassigned coach references.
inline constexpr coach_id invalid_coach{std::uint32_t{0xFFFFFFFF}};

// =============================================================================
// Role / side vocabulary
// =============================================================================

inline constexpr std::string_view head_coach_role = "Head Coach";
inline constexpr std::string_view side_both = "Both";

/// (role category, side of ball) pair, e.g. {"Offensive Coordinator", "Offense"}.
struct role_side {
    std::string role;
    std::string side;

    friend bool operator==(role_side const&, role_side const&) = default;
    friend auto operator<=>(role_side const&, role_side const&) = default;

    /// Position key as used in recommendation tables: "role_side".
    [[nodiscard]] std::string position_key() const {
        return role + "_" + side;
    }

    [[nodiscard]] bool is_head_coach() const noexcept {
        return role == head_coach_role;
    }
};

// =============================================================================
// Records
// =============================================================================

/// One tenure record: a coach holding a role on a team in a season.
///
/// value is the precomputed performance composite for this
/// (coach, role, season, team); empty when no composite applies.
struct staff_row {
    int year = 0;
    std::string team;
    coach_id coach{};
    std::string coach_name;
    role_side role;
    std::string subcategory;
    std::optional<double> value;
};

/// One coach, deduplicated from staff rows (most recent row wins).
struct coach_record {
    coach_id id{};
    std::string name;
    role_side current;
    int last_year = 0;
    std::optional<double> value;
};

/// Canonical (year, team) key used to group co-staffers.
struct season_team {
    int year = 0;
    std::string team;

    friend bool operator==(season_team const&, season_team const&) = default;
    friend auto operator<=>(season_team const&, season_team const&) = default;
};

} // namespace staffnet

#endif // STAFFNET_CORE_COACH_TYPES_H
