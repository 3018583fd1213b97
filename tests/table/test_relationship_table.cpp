// tests/table/test_relationship_table.cpp
// Tests for roster and relationship construction from tenure rows.
//
// Validates:
//   1. primary_roles keeps the most senior row per team-season
//   2. build_roster: recency cutoff, most recent row, sorted output
//   3. years_together counts distinct seasons across teams
//   4. Per-side average values, empty when no value was recorded
//   5. Cutoff removes inactive coaches from every edge
//   6. build_costaff_graph end to end

#include "staffnet/table/relationship_table.h"
#include "support/staff_fixtures.h"
#include <gtest/gtest.h>

#include <vector>

using namespace staffnet;
using namespace staffnet::fixtures;

// =========================================================================
// 1. primary_roles
// =========================================================================

TEST(PrimaryRoles, KeepsHighestRankPerTeamSeason) {
    auto t = make_ladder_table();
    std::vector<staff_row> rows{
        row(2020, "KC", 1, "Alice", pc_off(), 0.2),
        row(2020, "KC", 1, "Alice", oc(), 0.6),
        row(2020, "KC", 2, "Bea", dc()),
        row(2021, "KC", 1, "Alice", pc_off()),
    };
    auto kept = primary_roles(rows, t);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0].role, oc());
    EXPECT_EQ(kept[0].value, 0.6);
    EXPECT_EQ(kept[1].coach, coach_id{2});
    EXPECT_EQ(kept[2].year, 2021);
}

TEST(PrimaryRoles, TieKeepsEarlierRow) {
    auto t = make_ladder_table();
    std::vector<staff_row> rows{
        row(2020, "KC", 1, "Alice", pc_def(), 0.1),
        row(2020, "KC", 1, "Alice", pc_off(), 0.9),
    };
    auto kept = primary_roles(rows, t);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].role, pc_def());
}

// =========================================================================
// 2. build_roster
// =========================================================================

TEST(BuildRoster, MostRecentRowAndCutoff) {
    auto t = make_ladder_table();
    std::vector<staff_row> rows{
        row(2024, "BUF", 3, "Carl", pc_off(), 0.4),
        row(2023, "KC", 1, "Alice", pc_off(), 0.1),
        row(2024, "DAL", 1, "Alice", pc_off(), 0.2),
        row(2024, "DAL", 1, "Alice", oc(), 0.5),
        row(2019, "NYG", 2, "Bea", hc(), 0.9),
    };
    auto roster = build_roster(rows, t);

    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].id, coach_id{1});
    EXPECT_EQ(roster[0].current, oc());
    EXPECT_EQ(roster[0].last_year, 2024);
    EXPECT_EQ(roster[0].value, 0.5);
    EXPECT_EQ(roster[1].id, coach_id{3});
}

TEST(BuildRoster, LowerCutoffKeepsOlderCoaches) {
    auto t = make_ladder_table();
    std::vector<staff_row> rows{row(2019, "NYG", 2, "Bea", hc(), 0.9)};
    EXPECT_TRUE(build_roster(rows, t).empty());
    auto roster = build_roster(rows, t, 2015);
    ASSERT_EQ(roster.size(), 1u);
    EXPECT_EQ(roster[0].name, "Bea");
}

// =========================================================================
// 3. years_together
// =========================================================================

TEST(BuildRelationships, DistinctSharedSeasons) {
    // Alice and Bea: 2021 KC, 2022 KC, 2023 DAL (moved together).  Bea's
    // second 2022 role must not count the season twice.
    std::vector<staff_row> rows{
        row(2021, "KC", 1, "Alice", hc()),
        row(2021, "KC", 2, "Bea", oc()),
        row(2022, "KC", 1, "Alice", hc()),
        row(2022, "KC", 2, "Bea", oc()),
        row(2022, "KC", 2, "Bea", pc_off()),
        row(2023, "DAL", 1, "Alice", hc()),
        row(2023, "DAL", 2, "Bea", oc()),
        row(2024, "DAL", 1, "Alice", hc()),
        row(2024, "NYJ", 2, "Bea", oc()),
    };
    auto edges = build_relationships(rows);
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].coach_1, coach_id{1});
    EXPECT_EQ(edges[0].coach_2, coach_id{2});
    EXPECT_EQ(edges[0].years_together, 3);
}

TEST(BuildRelationships, CanonicalSortedPairs) {
    std::vector<staff_row> rows{
        row(2024, "KC", 9, "Zed", hc()),
        row(2024, "KC", 4, "Dan", oc()),
        row(2024, "KC", 7, "Gus", dc()),
    };
    auto edges = build_relationships(rows);
    ASSERT_EQ(edges.size(), 3u);
    EXPECT_EQ(edges[0].coach_1, coach_id{4});
    EXPECT_EQ(edges[0].coach_2, coach_id{7});
    EXPECT_EQ(edges[1].coach_2, coach_id{9});
    EXPECT_EQ(edges[2].coach_1, coach_id{7});
    for (auto const& e : edges) {
        EXPECT_LT(e.coach_1, e.coach_2);
        EXPECT_EQ(e.years_together, 1);
    }
}

// =========================================================================
// 4. Average values
// =========================================================================

TEST(BuildRelationships, PerSideAverageValues) {
    std::vector<staff_row> rows{
        row(2020, "KC", 1, "Alice", hc(), 0.5),
        row(2020, "KC", 2, "Bea", oc()),
        row(2021, "KC", 1, "Alice", hc(), 0.7),
        row(2021, "KC", 2, "Bea", oc()),
        row(2024, "KC", 1, "Alice", hc()),
        row(2024, "KC", 2, "Bea", oc()),
        // Not shared with Bea: must not enter the average.
        row(2019, "BUF", 1, "Alice", oc(), 0.0),
    };
    auto edges = build_relationships(rows);
    ASSERT_EQ(edges.size(), 1u);
    ASSERT_TRUE(edges[0].avg_value_1.has_value());
    EXPECT_DOUBLE_EQ(*edges[0].avg_value_1, 0.6);
    EXPECT_FALSE(edges[0].avg_value_2.has_value());
}

// =========================================================================
// 5. Cutoff
// =========================================================================

TEST(BuildRelationships, InactiveCoachHasNoEdges) {
    std::vector<staff_row> rows{
        row(2020, "KC", 1, "Alice", hc()),
        row(2020, "KC", 2, "Bea", oc()),
        row(2020, "KC", 3, "Old", dc()),
        row(2024, "KC", 1, "Alice", hc()),
        row(2024, "BUF", 2, "Bea", oc()),
    };
    auto edges = build_relationships(rows);
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].coach_1, coach_id{1});
    EXPECT_EQ(edges[0].coach_2, coach_id{2});
    // Shared history before the cutoff still counts.
    EXPECT_EQ(edges[0].years_together, 1);
}

// =========================================================================
// 6. Graph
// =========================================================================

TEST(BuildCostaffGraph, EndToEnd) {
    auto t = make_ladder_table();
    std::vector<staff_row> rows{
        row(2024, "KC", 1, "Alice", hc(), 0.9),
        row(2024, "KC", 2, "Bea", oc(), 0.6),
        row(2024, "BUF", 2, "Bea", oc(), 0.6),
        row(2024, "BUF", 3, "Carl", pc_off(), 0.3),
        row(2018, "BUF", 4, "Old", dc(), 0.8),
        row(2018, "BUF", 3, "Carl", pc_off()),
    };
    auto g = build_costaff_graph(rows, t);
    EXPECT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_FALSE(g.contains(coach_id{4}));
    EXPECT_EQ(g.distance(coach_id{1}, coach_id{3}), 2u);
    EXPECT_EQ(g.coach(coach_id{1}).current, hc());
}
