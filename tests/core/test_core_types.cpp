// tests/core/test_core_types.cpp
// Tests for coach descriptors, role/side keys and run statistics.
//
// Validates:
//   1. coach_id ordering and sentinel
//   2. role_side ordering, position key and head-coach test
//   3. assembly_stats aggregation and fill rate
//   4. Defaults are internally consistent

#include "staffnet/core/coach_types.h"
#include "staffnet/core/defaults.h"
#include "staffnet/core/run_stats.h"
#include <gtest/gtest.h>

#include <set>

using namespace staffnet;

// =========================================================================
// 1. coach_id
// =========================================================================

TEST(CoachId, OrderingAndEquality) {
    static_assert(coach_id{1} < coach_id{2});
    static_assert(coach_id{7} == coach_id{7});
    static_assert(invalid_coach.value == 0xFFFFFFFFu);

    std::set<coach_id> ids{coach_id{3}, coach_id{1}, coach_id{2}, coach_id{1}};
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids.begin()->value, 1u);
}

// =========================================================================
// 2. role_side
// =========================================================================

TEST(RoleSide, PositionKey) {
    role_side oc{"Offensive Coordinator", "Offense"};
    EXPECT_EQ(oc.position_key(), "Offensive Coordinator_Offense");
    EXPECT_FALSE(oc.is_head_coach());
    EXPECT_TRUE((role_side{"Head Coach", "Both"}.is_head_coach()));
}

TEST(RoleSide, OrdersByRoleThenSide) {
    role_side a{"Position Coach", "Defense"};
    role_side b{"Position Coach", "Offense"};
    role_side c{"Defensive Coordinator", "Defense"};
    EXPECT_LT(a, b);
    EXPECT_LT(c, a);
    EXPECT_NE(a, b);
}

TEST(SeasonTeam, OrdersByYearThenTeam) {
    EXPECT_LT((season_team{2020, "KC"}), (season_team{2021, "BUF"}));
    EXPECT_LT((season_team{2020, "BUF"}), (season_team{2020, "KC"}));
}

// =========================================================================
// 3. assembly_stats
// =========================================================================

TEST(AssemblyStats, AddsFieldwise) {
    constexpr assembly_stats a{.pool_size = 4, .candidates_total = 10,
                               .positions_total = 5, .positions_filled = 3};
    constexpr assembly_stats b{.pool_size = 1, .candidates_total = 2,
                               .positions_total = 5, .positions_filled = 5};
    constexpr auto c = a + b;
    static_assert(c.pool_size == 5);
    static_assert(c.positions_filled == 8);

    assembly_stats d;
    d += a;
    d += b;
    EXPECT_EQ(d.candidates_total, 12u);
    EXPECT_DOUBLE_EQ(d.fill_rate(), 0.8);
}

TEST(AssemblyStats, FillRateOfEmptyCatalogIsZero) {
    assembly_stats s;
    EXPECT_DOUBLE_EQ(s.fill_rate(), 0.0);
}

// =========================================================================
// 4. Defaults
// =========================================================================

TEST(Defaults, Values) {
    static_assert(defaults::max_degree == 2);
    static_assert(defaults::top_n == 5);
    static_assert(defaults::missing_value_floor == 0.3);
    static_assert(defaults::promotion_step == 0.4);
    static_assert(defaults::recency_cutoff <= defaults::decay_anchor_year);
    EXPECT_EQ(defaults::coordinator_marker, "Coordinator");
}
