// tests/ranking/test_candidate_clustering.cpp
// Tests for k-means clustering of head-coach candidates.
//
// Validates:
//   1. Well-separated groups are recovered
//   2. Same seed, same result; labels ordered by centroid
//   3. k clamped to the number of points
//   4. Invalid arguments throw
//   5. Elbow selection on a known curve
//   6. cluster_candidates: empty input, fixed k, elbow k

#include "staffnet/ranking/candidate_clustering.h"
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace staffnet;

namespace {

// Three tight groups around (0,0), (5,5) and (10,0).
std::vector<point2> three_groups() {
    return {
        {10.0, 0.0}, {5.0, 5.0}, {0.0, 0.0},
        {10.1, 0.0}, {5.1, 5.0}, {0.1, 0.0},
        {10.0, 0.1}, {5.0, 5.1}, {0.0, 0.1},
    };
}

std::vector<candidate_point> three_group_candidates() {
    std::vector<candidate_point> out;
    char name = 'a';
    for (auto const& p : three_groups())
        out.push_back(candidate_point{std::string(1, name++), p.x, p.y});
    return out;
}

} // namespace

// =========================================================================
// 1. Separated groups
// =========================================================================

TEST(KMeans, RecoversSeparatedGroups) {
    auto r = kmeans(three_groups(), 3);
    ASSERT_EQ(r.k, 3u);
    ASSERT_EQ(r.labels.size(), 9u);
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(r.sizes, (std::vector<std::size_t>{3, 3, 3}));
    EXPECT_LT(r.total_within_ss, 0.1);

    // Label 0 = lowest centroid x.
    EXPECT_EQ(r.labels, (std::vector<std::size_t>{2, 1, 0, 2, 1, 0, 2, 1, 0}));
    EXPECT_NEAR(r.centroids[0].x, 0.1 / 3.0, 1e-12);
    EXPECT_NEAR(r.centroids[1].y, 5.0 + 0.1 / 3.0, 1e-12);
    EXPECT_NEAR(r.centroids[2].x, 10.0 + 0.1 / 3.0, 1e-12);
}

// =========================================================================
// 2. Determinism
// =========================================================================

TEST(KMeans, SameSeedSameResult) {
    std::vector<point2> pts{{0.2, 0.9}, {0.4, 0.1}, {0.5, 0.5}, {0.9, 0.3},
                            {0.1, 0.4}, {0.7, 0.8}, {0.3, 0.6}, {0.8, 0.2}};
    auto a = kmeans(pts, 3, 5, 100, 7);
    auto b = kmeans(pts, 3, 5, 100, 7);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.centroids, b.centroids);
    EXPECT_DOUBLE_EQ(a.total_within_ss, b.total_within_ss);
}

TEST(KMeans, CentroidsAscending) {
    std::vector<point2> pts{{0.2, 0.9}, {0.4, 0.1}, {0.5, 0.5}, {0.9, 0.3},
                            {0.1, 0.4}, {0.7, 0.8}, {0.3, 0.6}, {0.8, 0.2}};
    auto r = kmeans(pts, 4);
    for (std::size_t c = 1; c < r.k; ++c)
        EXPECT_LE(r.centroids[c - 1].x, r.centroids[c].x);
}

// =========================================================================
// 3. k clamp
// =========================================================================

TEST(KMeans, KClampedToPointCount) {
    auto r = kmeans({{0.0, 0.0}, {1.0, 1.0}}, 5);
    EXPECT_EQ(r.k, 2u);
    EXPECT_EQ(r.labels, (std::vector<std::size_t>{0, 1}));
    EXPECT_DOUBLE_EQ(r.total_within_ss, 0.0);
}

TEST(KMeans, SinglePoint) {
    auto r = kmeans({{0.3, 0.7}}, 1);
    EXPECT_EQ(r.centroids, (std::vector<point2>{{0.3, 0.7}}));
    EXPECT_TRUE(r.converged);
}

// =========================================================================
// 4. Invalid arguments
// =========================================================================

TEST(KMeans, InvalidArgumentsThrow) {
    std::vector<point2> pts{{0.0, 0.0}};
    EXPECT_THROW((void)kmeans(pts, 0), std::invalid_argument);
    EXPECT_THROW((void)kmeans(pts, 1, 0), std::invalid_argument);
    EXPECT_THROW((void)kmeans({}, 1), std::invalid_argument);
}

// =========================================================================
// 5. Elbow
// =========================================================================

TEST(ElbowK, KnownCurve) {
    // Distances to the chord (1,100)-(5,10) peak at k = 2.
    EXPECT_EQ(elbow_k({100.0, 20.0, 15.0, 12.0, 10.0}), 2u);
    EXPECT_EQ(elbow_k({100.0, 90.0, 20.0, 15.0, 10.0}), 3u);
}

TEST(ElbowK, ShortCurves) {
    EXPECT_EQ(elbow_k({}), 0u);
    EXPECT_EQ(elbow_k({5.0}), 1u);
    EXPECT_EQ(elbow_k({5.0, 3.0}), 2u);
}

TEST(WssCurve, NonIncreasingAndClamped) {
    auto wss = wss_curve(three_groups(), 20);
    ASSERT_EQ(wss.size(), 9u);
    EXPECT_GT(wss[0], wss[2]);
    EXPECT_NEAR(wss.back(), 0.0, 1e-12);
}

// =========================================================================
// 6. cluster_candidates
// =========================================================================

TEST(ClusterCandidates, EmptyInput) {
    auto r = cluster_candidates({});
    EXPECT_TRUE(r.assignments.empty());
    EXPECT_EQ(r.model.k, 0u);
    EXPECT_TRUE(r.wss.empty());
}

TEST(ClusterCandidates, FixedK) {
    auto r = cluster_candidates(three_group_candidates());
    ASSERT_EQ(r.assignments.size(), 9u);
    EXPECT_TRUE(r.wss.empty());
    EXPECT_EQ(r.assignments[0].name, "a");
    EXPECT_DOUBLE_EQ(r.assignments[0].personal_value, 10.0);
    EXPECT_EQ(r.assignments[0].cluster, 2u);
    EXPECT_EQ(r.assignments[2].cluster, 0u);
}

TEST(ClusterCandidates, ElbowChoosesThree) {
    clustering_params p;
    p.k = 1;
    p.choose_k_by_elbow = true;
    p.elbow_max_k = 5;
    auto r = cluster_candidates(three_group_candidates(), p);
    EXPECT_EQ(r.wss.size(), 5u);
    EXPECT_EQ(r.model.k, 3u);
    EXPECT_EQ(r.assignments[1].cluster, 1u);
}
