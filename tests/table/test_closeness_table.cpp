// tests/table/test_closeness_table.cpp
// Tests for the directed role/side closeness relation.
//
// Validates:
//   1. Directed lookup
//   2. Repeated keys replace in place
//   3. Out-of-range closeness throws
//   4. Hierarchy rank, including unknown roles
//   5. Head-coach ladder extraction

#include "staffnet/table/closeness_table.h"
#include "support/staff_fixtures.h"
#include <gtest/gtest.h>

#include <stdexcept>

using namespace staffnet;
using namespace staffnet::fixtures;

// =========================================================================
// 1. Directed lookup
// =========================================================================

TEST(ClosenessTable, DirectedLookup) {
    auto t = make_ladder_table();
    EXPECT_EQ(t.closeness(pc_off(), oc()), 0.7);
    EXPECT_FALSE(t.closeness(oc(), pc_off()).has_value());
    EXPECT_EQ(t.closeness_to_head_coach(oc()), 0.8);
    EXPECT_EQ(t.closeness_to_head_coach(hc()), 1.0);
    EXPECT_FALSE(t.closeness_to_head_coach(role_side{"Video", "Offense"}).has_value());
}

// =========================================================================
// 2. Repeated keys
// =========================================================================

TEST(ClosenessTable, RepeatedKeyReplacesInPlace) {
    closeness_table t;
    t.add({oc(), hc(), 0.8, 8});
    t.add({dc(), hc(), 0.8, 8});
    t.add({oc(), hc(), 0.75, 9});

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.entries()[0].from, oc());
    EXPECT_EQ(t.entries()[0].closeness, 0.75);
    EXPECT_EQ(t.hierarchy_rank(oc()), 9);
}

// =========================================================================
// 3. Validation
// =========================================================================

TEST(ClosenessTable, OutOfRangeThrows) {
    closeness_table t;
    EXPECT_THROW(t.add({oc(), hc(), 1.5, 8}), std::invalid_argument);
    EXPECT_THROW(t.add({oc(), hc(), -0.1, 8}), std::invalid_argument);
    EXPECT_TRUE(t.empty());
}

// =========================================================================
// 4. Hierarchy rank
// =========================================================================

TEST(ClosenessTable, HierarchyRankTakesHighest) {
    auto t = make_ladder_table();
    // pc_off appears twice as a source (rank 4 both times).
    EXPECT_EQ(t.hierarchy_rank(pc_off()), 4);
    EXPECT_EQ(t.hierarchy_rank(hc()), 10);
    EXPECT_EQ(t.hierarchy_rank(role_side{"Quality Control", "Defense"}),
              unknown_hierarchy_rank);
}

// =========================================================================
// 5. Ladder
// =========================================================================

TEST(ClosenessTable, HeadCoachLadder) {
    auto ladder = make_ladder_table().head_coach_ladder();
    ASSERT_EQ(ladder.size(), 6u);
    EXPECT_EQ(ladder[0].position, hc());
    EXPECT_EQ(ladder[1].position, oc());
    EXPECT_EQ(ladder[5].position, pc_def());
    EXPECT_DOUBLE_EQ(ladder[3].closeness, 0.6);
    for (auto const& rung : ladder) {
        EXPECT_NE(rung.position, assistant()) << "Both-side non-HC role on ladder";
    }
}

TEST(ClosenessTable, ConstructFromEntries) {
    closeness_table t({{oc(), hc(), 0.8, 8}, {pc_off(), oc(), 0.7, 4}});
    EXPECT_EQ(t.size(), 2u);
    auto ladder = t.head_coach_ladder();
    ASSERT_EQ(ladder.size(), 1u);
    EXPECT_EQ(ladder[0].position, oc());
}
