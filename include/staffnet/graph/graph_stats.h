// graph/graph_stats.h - Descriptive statistics of the co-staff network
// Part of the staff network library (C++20)
//
// Size, density, components and the best-connected coaches.  Used for
// sanity-checking a freshly built network before running assembly
// over many head coaches.
//
// Centrality (PageRank, eigenvector) is computed by power iteration
// over the undirected topology; every co-staff edge counts once in
// each direction.  The diameter is the longest shortest path over all
// reachable pairs, found by one BFS per coach: O(V (V + E)).

#ifndef STAFFNET_GRAPH_GRAPH_STATS_H
#define STAFFNET_GRAPH_GRAPH_STATS_H

#include "../core/defaults.h"
#include "connected_components.h"
#include "costaff_graph.h"
#include "hop_distance.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace staffnet {

/// Coach and its number of direct co-staff connections.
struct coach_degree {
    coach_id id{};
    std::size_t degree = 0;
};

struct network_stats {
    std::size_t node_count = 0;
    std::size_t edge_count = 0;
    /// 2E / (V (V - 1)); 0 for fewer than two nodes.
    double density = 0.0;
    std::size_t component_count = 0;
    std::size_t largest_component = 0;
    /// Nodes with no co-staff edge.
    std::size_t isolated_count = 0;
    std::size_t max_degree = 0;
};

[[nodiscard]] inline network_stats describe(costaff_graph const& g) {
    network_stats s;
    auto const& topo = g.topology();
    s.node_count = topo.node_count();
    s.edge_count = topo.edge_count();
    if (s.node_count >= 2) {
        auto const v = static_cast<double>(s.node_count);
        s.density = 2.0 * static_cast<double>(s.edge_count) / (v * (v - 1.0));
    }

    auto cc = graph::connected_components(topo);
    s.component_count = cc.component_count;
    s.largest_component = cc.largest_component();

    for (std::size_t u = 0; u < s.node_count; ++u) {
        auto const d = topo.degree(graph::node_id{static_cast<std::uint32_t>(u)});
        if (d == 0) ++s.isolated_count;
        if (d > s.max_degree) s.max_degree = d;
    }
    return s;
}

/// The n coaches with the most direct connections, ties by lower id.
[[nodiscard]] inline std::vector<coach_degree>
top_by_degree(costaff_graph const& g, std::size_t n) {
    std::vector<coach_degree> all;
    all.reserve(g.node_count());
    for (std::size_t u = 0; u < g.node_count(); ++u) {
        auto const nid = graph::node_id{static_cast<std::uint32_t>(u)};
        all.push_back(coach_degree{g.coach_at(nid), g.topology().degree(nid)});
    }
    std::sort(all.begin(), all.end(), [](coach_degree const& a, coach_degree const& b) {
        if (a.degree != b.degree) return a.degree > b.degree;
        return a.id < b.id;
    });
    if (all.size() > n) all.resize(n);
    return all;
}

// =========================================================================
// Centrality
// =========================================================================

/// Coach and a centrality score.
struct coach_score {
    coach_id id{};
    double score = 0.0;
};

struct centrality_params {
    double damping = defaults::pagerank_damping;
    double tolerance = defaults::centrality_tolerance;
    std::size_t max_iterations = defaults::centrality_max_iterations;
};

/// Scores in roster (coach_id) order.
struct centrality_result {
    std::vector<coach_score> scores;
    std::size_t iterations = 0;
    bool converged = false;

    /// The n highest scores, ties by lower id.
    [[nodiscard]] std::vector<coach_score> top(std::size_t n) const {
        auto out = scores;
        std::sort(out.begin(), out.end(), [](coach_score const& a, coach_score const& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.id < b.id;
        });
        if (out.size() > n) out.resize(n);
        return out;
    }
};

namespace detail {

inline centrality_result make_centrality(costaff_graph const& g, std::vector<double> const& x,
                                         std::size_t iterations, bool converged) {
    centrality_result r;
    r.iterations = iterations;
    r.converged = converged;
    r.scores.reserve(x.size());
    for (std::size_t u = 0; u < x.size(); ++u) {
        r.scores.push_back(
            coach_score{g.coach_at(graph::node_id{static_cast<std::uint32_t>(u)}), x[u]});
    }
    return r;
}

} // namespace detail

/// PageRank with uniform teleport.  Coaches with no edge spread their
/// mass uniformly.  Scores sum to 1.
///
/// Throws std::invalid_argument unless 0 <= damping < 1.
[[nodiscard]] inline centrality_result
pagerank(costaff_graph const& g, centrality_params const& params = {}) {
    if (!(params.damping >= 0.0 && params.damping < 1.0))
        throw std::invalid_argument("pagerank: damping must be in [0, 1)");

    auto const& topo = g.topology();
    auto const V = topo.node_count();
    if (V == 0) return {{}, 0, true};

    auto const n = static_cast<double>(V);
    auto const d = params.damping;
    std::vector<double> x(V, 1.0 / n);
    std::vector<double> next(V);

    std::size_t it = 0;
    bool converged = false;
    while (it < params.max_iterations && !converged) {
        ++it;
        double dangling = 0.0;
        for (std::size_t u = 0; u < V; ++u) {
            if (topo.degree(graph::node_id{static_cast<std::uint32_t>(u)}) == 0)
                dangling += x[u];
        }
        std::fill(next.begin(), next.end(), (1.0 - d) / n + d * dangling / n);
        for (std::size_t u = 0; u < V; ++u) {
            auto const nu = graph::node_id{static_cast<std::uint32_t>(u)};
            auto const deg = topo.degree(nu);
            if (deg == 0) continue;
            auto const share = d * x[u] / static_cast<double>(deg);
            for (auto v : topo.out_neighbors(nu)) next[graph::to_index(v)] += share;
        }
        double delta = 0.0;
        for (std::size_t u = 0; u < V; ++u) delta += std::abs(next[u] - x[u]);
        x.swap(next);
        converged = delta < params.tolerance;
    }
    return detail::make_centrality(g, x, it, converged);
}

/// Eigenvector centrality scaled so the largest score is 1.
///
/// Iterates x <- (A + I) x, which has A's leading eigenvector but does
/// not oscillate on bipartite graphs.  A graph with no edge scores 1
/// everywhere.  Outside the dominant component scores tend to 0.
[[nodiscard]] inline centrality_result
eigenvector_centrality(costaff_graph const& g, centrality_params const& params = {}) {
    auto const& topo = g.topology();
    auto const V = topo.node_count();
    if (V == 0) return {{}, 0, true};
    if (topo.edge_count() == 0)
        return detail::make_centrality(g, std::vector<double>(V, 1.0), 0, true);

    std::vector<double> x(V);
    for (std::size_t u = 0; u < V; ++u)
        x[u] = static_cast<double>(topo.degree(graph::node_id{static_cast<std::uint32_t>(u)}));
    auto const start_peak = static_cast<double>(topo.max_degree());
    for (auto& v : x) v /= start_peak;
    std::vector<double> next(V);

    std::size_t it = 0;
    bool converged = false;
    while (it < params.max_iterations && !converged) {
        ++it;
        for (std::size_t u = 0; u < V; ++u) {
            auto const nu = graph::node_id{static_cast<std::uint32_t>(u)};
            double sum = x[u];
            for (auto v : topo.out_neighbors(nu)) sum += x[graph::to_index(v)];
            next[u] = sum;
        }
        auto const peak = *std::max_element(next.begin(), next.end());
        double delta = 0.0;
        for (std::size_t u = 0; u < V; ++u) {
            next[u] /= peak;
            delta += std::abs(next[u] - x[u]);
        }
        x.swap(next);
        converged = delta < params.tolerance;
    }
    return detail::make_centrality(g, x, it, converged);
}

// =========================================================================
// Diameter
// =========================================================================

/// Longest shortest path in the network.
///
/// - length: edge count of the path (0 for a graph without edges)
/// - path:   coaches from one end to the other, length + 1 of them;
///           empty only for an empty graph
struct network_diameter {
    std::size_t length = 0;
    std::vector<coach_id> path;
};

/// Diameter over reachable pairs; unreachable pairs are ignored.  Ties
/// keep the first pair found scanning sources and then targets in
/// coach_id order.
[[nodiscard]] inline network_diameter diameter(costaff_graph const& g) {
    network_diameter out;
    auto const& topo = g.topology();
    auto const V = topo.node_count();
    if (V == 0) return out;

    graph::node_id best_src{0};
    graph::node_id best_dst{0};
    graph::hop_distance_result best_bfs;
    for (std::size_t u = 0; u < V; ++u) {
        auto const src = graph::node_id{static_cast<std::uint32_t>(u)};
        auto bfs = graph::hop_distances(topo, src);
        bool improved = false;
        for (std::size_t v = 0; v < V; ++v) {
            auto const h = bfs.hops[v];
            if (h == graph::hop_unreachable || h <= out.length) continue;
            out.length = h;
            best_src = src;
            best_dst = graph::node_id{static_cast<std::uint32_t>(v)};
            improved = true;
        }
        if (improved) best_bfs = std::move(bfs);
    }

    if (out.length == 0) {
        out.path.push_back(g.coach_at(best_src));
        return out;
    }
    for (auto n = best_dst; n != graph::invalid_node; n = best_bfs.pred[graph::to_index(n)]) {
        out.path.push_back(g.coach_at(n));
        if (n == best_src) break;
    }
    std::reverse(out.path.begin(), out.path.end());
    return out;
}

} // namespace staffnet

#endif // STAFFNET_GRAPH_GRAPH_STATS_H
