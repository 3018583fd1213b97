// tests/ranking/test_staff_summary.cpp
// Tests for per-head-coach staff summaries and rankings.
//
// Validates:
//   1. top_per_position: best score per key, ties to lower id
//   2. summarize_staff: every statistic on a hand-computed staff
//   3. Empty staff and missing values
//   4. rank_staffs: overall order, coordinator and experience ranks
//   5. Score matrix lookup

#include "staffnet/ranking/staff_summary.h"
#include "support/staff_fixtures.h"
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace staffnet;
using namespace staffnet::fixtures;

namespace {

candidate_record cand(std::uint32_t id, role_side target, double score,
                      std::size_t degree, int years,
                      std::optional<double> value = std::nullopt) {
    candidate_record c;
    c.id = coach_id{id};
    c.name = "C" + std::to_string(id);
    c.current = pc_off();
    c.target = std::move(target);
    c.score = score;
    c.degree = degree;
    c.years_together = years;
    c.value = value;
    return c;
}

// Top per position: DC 0.45, OC 1.2, PC-O 0.25.
std::vector<candidate_record> sample_rows() {
    return {
        cand(1, oc(), 1.2, 1, 3, 0.6),
        cand(2, oc(), 0.9, 1, 1, 0.9),
        cand(3, dc(), 0.45, 1, 2),
        cand(4, pc_off(), 0.25, 2, 0, 0.5),
        cand(5, pc_off(), 0.1, 2, 0, 0.2),
    };
}

staff_summary summary(std::string name, double avg, std::optional<double> coord, int years) {
    staff_summary s;
    s.head_coach = std::move(name);
    s.avg_score = avg;
    s.coordinator_avg = coord;
    s.total_years_experience = years;
    return s;
}

} // namespace

// =========================================================================
// 1. top_per_position
// =========================================================================

TEST(TopPerPosition, BestPerKeyInKeyOrder) {
    auto top = top_per_position(sample_rows());
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].target, dc());
    EXPECT_EQ(top[1].id, coach_id{1});
    EXPECT_EQ(top[2].id, coach_id{4});
}

TEST(TopPerPosition, GroupsByRoleAndSideNotJoinedKey) {
    // Both join to "Run_Game_Offense".
    role_side run_game{"Run_Game", "Offense"};
    role_side run{"Run", "Game_Offense"};
    ASSERT_EQ(run_game.position_key(), run.position_key());

    auto top = top_per_position({cand(1, run_game, 0.9, 1, 1), cand(2, run, 0.4, 1, 1)});
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].target, run);
    EXPECT_EQ(top[1].target, run_game);
}

TEST(TopPerPosition, TieGoesToLowerId) {
    auto top = top_per_position({cand(8, oc(), 0.5, 1, 1), cand(3, oc(), 0.5, 1, 1)});
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].id, coach_id{3});
}

// =========================================================================
// 2. summarize_staff
// =========================================================================

TEST(SummarizeStaff, HandComputedStatistics) {
    auto s = summarize_staff("Hank", sample_rows());
    EXPECT_EQ(s.head_coach, "Hank");
    EXPECT_EQ(s.total_positions, 3u);
    EXPECT_DOUBLE_EQ(s.avg_score, (1.2 + 0.45 + 0.25) / 3.0);
    EXPECT_DOUBLE_EQ(s.median_score, 0.45);
    ASSERT_TRUE(s.avg_coach_value.has_value());
    EXPECT_DOUBLE_EQ(*s.avg_coach_value, 0.55);
    EXPECT_DOUBLE_EQ(s.avg_years_together, 5.0 / 3.0);
    EXPECT_DOUBLE_EQ(s.pct_direct, 200.0 / 3.0);
    EXPECT_DOUBLE_EQ(s.pct_quality, 100.0 / 3.0);
    EXPECT_EQ(s.total_years_experience, 5);
    ASSERT_TRUE(s.coordinator_avg.has_value());
    EXPECT_DOUBLE_EQ(*s.coordinator_avg, (1.2 + 0.45) / 2.0);
    EXPECT_DOUBLE_EQ(s.top3_avg, s.avg_score);
}

TEST(SummarizeStaff, TopPositionsParameter) {
    ranking_params p;
    p.top_positions = 2;
    p.quality_threshold = 0.4;
    auto s = summarize_staff("Hank", sample_rows(), p);
    EXPECT_DOUBLE_EQ(s.top3_avg, (1.2 + 0.45) / 2.0);
    EXPECT_DOUBLE_EQ(s.pct_quality, 200.0 / 3.0);
}

TEST(SummarizeStaff, EvenCountMedian) {
    auto s = summarize_staff("Hank", {cand(1, oc(), 1.0, 1, 1), cand(2, dc(), 0.5, 1, 1)});
    EXPECT_DOUBLE_EQ(s.median_score, 0.75);
}

// =========================================================================
// 3. Empty staff and missing values
// =========================================================================

TEST(SummarizeStaff, EmptyStaffIsAllZero) {
    auto s = summarize_staff("Nobody", {});
    EXPECT_EQ(s.total_positions, 0u);
    EXPECT_DOUBLE_EQ(s.avg_score, 0.0);
    EXPECT_DOUBLE_EQ(s.median_score, 0.0);
    EXPECT_DOUBLE_EQ(s.top3_avg, 0.0);
    EXPECT_FALSE(s.avg_coach_value.has_value());
    EXPECT_FALSE(s.coordinator_avg.has_value());
}

TEST(SummarizeStaff, NoCoordinatorOrValues) {
    auto s = summarize_staff("Hank", {cand(1, pc_off(), 0.3, 2, 0)});
    EXPECT_FALSE(s.coordinator_avg.has_value());
    EXPECT_FALSE(s.avg_coach_value.has_value());
    EXPECT_DOUBLE_EQ(s.pct_direct, 0.0);
}

// =========================================================================
// 4. rank_staffs
// =========================================================================

TEST(RankStaffs, OverallCoordinatorExperience) {
    auto ranked = rank_staffs({
        summary("Bo", 0.5, 0.9, 5),
        summary("Al", 0.9, 0.8, 5),
        summary("Cy", 0.5, std::nullopt, 1),
    });
    ASSERT_EQ(ranked.size(), 3u);

    EXPECT_EQ(ranked[0].summary.head_coach, "Al");
    EXPECT_EQ(ranked[1].summary.head_coach, "Bo");
    EXPECT_EQ(ranked[2].summary.head_coach, "Cy");
    EXPECT_EQ(ranked[0].overall_rank, 1u);
    EXPECT_EQ(ranked[2].overall_rank, 3u);

    EXPECT_EQ(ranked[0].coordinator_rank, 2u);
    EXPECT_EQ(ranked[1].coordinator_rank, 1u);
    EXPECT_EQ(ranked[2].coordinator_rank, 3u);

    // Tied experience shares the better rank.
    EXPECT_EQ(ranked[0].experience_rank, 1u);
    EXPECT_EQ(ranked[1].experience_rank, 1u);
    EXPECT_EQ(ranked[2].experience_rank, 3u);
}

TEST(RankStaffs, Empty) {
    EXPECT_TRUE(rank_staffs({}).empty());
}

// =========================================================================
// 5. Score matrix
// =========================================================================

TEST(PositionScoreMatrix, LookupDefaultsToZero) {
    position_score_matrix m;
    m.positions = {"a", "b"};
    m.head_coaches = {"X", "Y"};
    m.values = {{1.0, 2.0}, {3.0, 4.0}};
    EXPECT_DOUBLE_EQ(m.at("b", "X"), 3.0);
    EXPECT_DOUBLE_EQ(m.at("a", "Y"), 2.0);
    EXPECT_DOUBLE_EQ(m.at("c", "X"), 0.0);
    EXPECT_DOUBLE_EQ(m.at("a", "Z"), 0.0);
}
