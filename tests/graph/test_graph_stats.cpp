// tests/graph/test_graph_stats.cpp
// Tests for connected components and network summary statistics.
//
// Validates:
//   1. Components on islands and a connected graph
//   2. describe(): counts, density, isolated nodes
//   3. top_by_degree ordering and truncation
//   4. PageRank: closed form on a star, mass conserved with isolated coaches
//   5. Eigenvector centrality: star, edgeless graph
//   6. Diameter length and coach path

#include "staffnet/graph/connected_components.h"
#include "staffnet/graph/graph_stats.h"
#include "staffnet/graph/runtime_graph.h"
#include "support/staff_fixtures.h"
#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

using namespace staffnet;
using namespace staffnet::fixtures;

namespace {

// Star centred on 1 (1-2, 1-3, 1-4), pair 5-6, isolated 7.
costaff_graph make_star_pair_isolated() {
    std::vector<coach_record> roster;
    for (std::uint32_t id = 1; id <= 7; ++id) {
        roster.push_back(coach(id, "C" + std::to_string(id), pc_off()));
    }
    return costaff_graph::build(std::move(roster),
                                {edge(1, 2, 1), edge(1, 3, 1), edge(1, 4, 2), edge(5, 6, 1)});
}

// Star centred on 1 with leaves 2, 3, 4.
costaff_graph make_star() {
    std::vector<coach_record> roster;
    for (std::uint32_t id = 1; id <= 4; ++id) {
        roster.push_back(coach(id, "C" + std::to_string(id), pc_off()));
    }
    return costaff_graph::build(std::move(roster), {edge(1, 2, 1), edge(1, 3, 1), edge(1, 4, 1)});
}

// Path 10 - 20 - 30 - 40 - 50.
costaff_graph make_path() {
    std::vector<coach_record> roster;
    for (std::uint32_t id = 10; id <= 50; id += 10) {
        roster.push_back(coach(id, "C" + std::to_string(id), pc_off()));
    }
    return costaff_graph::build(std::move(roster), {edge(10, 20, 1), edge(20, 30, 1),
                                                    edge(30, 40, 1), edge(40, 50, 1)});
}

double total(centrality_result const& r) {
    return std::accumulate(r.scores.begin(), r.scores.end(), 0.0,
                           [](double acc, coach_score const& s) { return acc + s.score; });
}

} // namespace

// =========================================================================
// 1. Connected components
// =========================================================================

TEST(ConnectedComponents, TwoIslands) {
    graph::runtime_graph_builder b;
    (void)b.add_nodes(4);
    b.add_edge(graph::node_id{0}, graph::node_id{1});
    b.add_edge(graph::node_id{2}, graph::node_id{3});
    auto cc = graph::connected_components(b.finalise());

    EXPECT_EQ(cc.component_count, 2u);
    EXPECT_EQ(cc.component_of[0], cc.component_of[1]);
    EXPECT_NE(cc.component_of[1], cc.component_of[2]);
    EXPECT_EQ(cc.component_of[0], 0u);
    EXPECT_EQ(cc.largest_component(), 2u);
}

TEST(ConnectedComponents, EmptyGraph) {
    graph::runtime_graph g;
    auto cc = graph::connected_components(g);
    EXPECT_EQ(cc.component_count, 0u);
    EXPECT_EQ(cc.largest_component(), 0u);
}

// =========================================================================
// 2. describe()
// =========================================================================

TEST(NetworkStats, Describe) {
    auto s = describe(make_star_pair_isolated());
    EXPECT_EQ(s.node_count, 7u);
    EXPECT_EQ(s.edge_count, 4u);
    EXPECT_DOUBLE_EQ(s.density, 8.0 / 42.0);
    EXPECT_EQ(s.component_count, 3u);
    EXPECT_EQ(s.largest_component, 4u);
    EXPECT_EQ(s.isolated_count, 1u);
    EXPECT_EQ(s.max_degree, 3u);
}

TEST(NetworkStats, SingleNodeHasZeroDensity) {
    auto g = costaff_graph::build({coach(1, "Solo", hc())}, {});
    auto s = describe(g);
    EXPECT_EQ(s.node_count, 1u);
    EXPECT_DOUBLE_EQ(s.density, 0.0);
    EXPECT_EQ(s.isolated_count, 1u);
}

// =========================================================================
// 3. top_by_degree
// =========================================================================

TEST(NetworkStats, TopByDegree) {
    auto g = make_star_pair_isolated();
    auto top = top_by_degree(g, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].id, coach_id{1});
    EXPECT_EQ(top[0].degree, 3u);
    // Remaining degree-1 coaches tie; lower id first.
    EXPECT_EQ(top[1].id, coach_id{2});
    EXPECT_EQ(top[2].id, coach_id{3});
}

TEST(NetworkStats, TopByDegreeShorterThanRequest) {
    auto g = make_star_pair_isolated();
    EXPECT_EQ(top_by_degree(g, 100).size(), 7u);
    EXPECT_TRUE(top_by_degree(g, 0).empty());
}

// =========================================================================
// 4. PageRank
// =========================================================================

TEST(PageRank, StarClosedForm) {
    auto r = pagerank(make_star());
    ASSERT_TRUE(r.converged);
    ASSERT_EQ(r.scores.size(), 4u);

    // centre = a (1 + 3d) / (1 - d^2), leaf = (1 - centre) / 3, a = (1 - d) / 4
    double const d = 0.85;
    double const a = (1.0 - d) / 4.0;
    double const centre = a * (1.0 + 3.0 * d) / (1.0 - d * d);
    EXPECT_EQ(r.scores[0].id, coach_id{1});
    EXPECT_NEAR(r.scores[0].score, centre, 1e-9);
    for (std::size_t i = 1; i < 4; ++i) {
        EXPECT_NEAR(r.scores[i].score, (1.0 - centre) / 3.0, 1e-9);
    }
    EXPECT_NEAR(total(r), 1.0, 1e-12);
}

TEST(PageRank, IsolatedCoachesKeepMassConserved) {
    auto r = pagerank(make_star_pair_isolated());
    ASSERT_TRUE(r.converged);
    EXPECT_NEAR(total(r), 1.0, 1e-12);

    auto top = r.top(7);
    EXPECT_EQ(top.front().id, coach_id{1});
    EXPECT_EQ(top.back().id, coach_id{7});
    // The pair is symmetric.
    EXPECT_NEAR(r.scores[4].score, r.scores[5].score, 1e-12);
}

TEST(PageRank, EmptyGraphAndBadDamping) {
    auto r = pagerank(costaff_graph{});
    EXPECT_TRUE(r.scores.empty());

    centrality_params p;
    p.damping = 1.0;
    EXPECT_THROW((void)pagerank(make_star(), p), std::invalid_argument);
}

// =========================================================================
// 5. Eigenvector centrality
// =========================================================================

TEST(EigenvectorCentrality, StarCentreIsOne) {
    auto r = eigenvector_centrality(make_star());
    ASSERT_TRUE(r.converged);
    EXPECT_NEAR(r.scores[0].score, 1.0, 1e-9);
    for (std::size_t i = 1; i < 4; ++i) {
        EXPECT_NEAR(r.scores[i].score, 1.0 / std::sqrt(3.0), 1e-9);
    }
}

TEST(EigenvectorCentrality, DominantComponentOnly) {
    auto r = eigenvector_centrality(make_star_pair_isolated());
    ASSERT_TRUE(r.converged);
    EXPECT_NEAR(r.scores[0].score, 1.0, 1e-9);
    EXPECT_NEAR(r.scores[4].score, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(r.scores[6].score, 0.0);
}

TEST(EigenvectorCentrality, EdgelessScoresOne) {
    auto g = costaff_graph::build({coach(1, "A", hc()), coach(2, "B", oc())}, {});
    auto r = eigenvector_centrality(g);
    ASSERT_EQ(r.scores.size(), 2u);
    EXPECT_DOUBLE_EQ(r.scores[0].score, 1.0);
    EXPECT_DOUBLE_EQ(r.scores[1].score, 1.0);
}

// =========================================================================
// 6. Diameter
// =========================================================================

TEST(Diameter, PathGraph) {
    auto d = diameter(make_path());
    EXPECT_EQ(d.length, 4u);
    EXPECT_EQ(d.path, (std::vector<coach_id>{coach_id{10}, coach_id{20}, coach_id{30},
                                             coach_id{40}, coach_id{50}}));
}

TEST(Diameter, IgnoresUnreachablePairs) {
    auto d = diameter(make_star_pair_isolated());
    EXPECT_EQ(d.length, 2u);
    // First longest pair: from leaf 2 through the centre to leaf 3.
    EXPECT_EQ(d.path, (std::vector<coach_id>{coach_id{2}, coach_id{1}, coach_id{3}}));
}

TEST(Diameter, NoEdges) {
    auto d = diameter(costaff_graph::build({coach(5, "Solo", hc())}, {}));
    EXPECT_EQ(d.length, 0u);
    EXPECT_EQ(d.path, (std::vector<coach_id>{coach_id{5}}));
    EXPECT_TRUE(diameter(costaff_graph{}).path.empty());
}
