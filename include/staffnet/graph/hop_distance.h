// graph/hop_distance.h - Unweighted single-source shortest paths (BFS)
// Part of the staff network library (C++20)
//
// ALGORITHM: Breadth-first search from one source.
// Complexity: O(V + E), or O(visited + their edges) with a hop limit.
//
// DESIGN RATIONALE:
// Network distance between coaches is an edge count.  Tenure and
// performance are edge attributes used for scoring only, never path
// cost, so Dijkstra would buy nothing over a FIFO frontier.
//
// A hop limit stops expansion once the frontier passes max_hops.  Nodes
// beyond the limit keep hop_unreachable, exactly as if they were in
// another component.  Candidate search never needs more than a few hops.
//
// The result carries a verified flag, set by an O(E) check of the BFS
// layering invariant (adjacent reached nodes differ by at most one hop).

#ifndef STAFFNET_GRAPH_HOP_DISTANCE_H
#define STAFFNET_GRAPH_HOP_DISTANCE_H

#include "graph_concepts.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace staffnet::graph {

/// Distance reported for nodes not reached from the source.
inline constexpr std::size_t hop_unreachable = std::numeric_limits<std::size_t>::max();

/// No hop limit.
inline constexpr std::size_t hop_unlimited = std::numeric_limits<std::size_t>::max();

// =========================================================================
// Result type
// =========================================================================

/// Result of a BFS hop-distance computation.
///
/// - hops[n]:  edge count from source to n (hop_unreachable if not reached)
/// - pred[n]:  BFS-tree parent of n (invalid_node for source / unreached)
/// - order:    nodes in visitation order (source first)
/// - max_hops: limit the search was run with
/// - verified: true if verify_hop_distances has confirmed the layering
struct hop_distance_result {
    std::vector<std::size_t> hops;
    std::vector<node_id> pred;
    std::vector<node_id> order;
    node_id source = invalid_node;
    std::size_t max_hops = hop_unlimited;
    bool verified = false;

    [[nodiscard]] bool reached(node_id n) const noexcept {
        return to_index(n) < hops.size() && hops[to_index(n)] != hop_unreachable;
    }
};

// =========================================================================
// Verification
// =========================================================================

/// O(E) verification of BFS layering.
///
/// For every edge u-v with u reached:
/// - if hops[u] < max_hops, v is reached and hops[v] <= hops[u] + 1
/// Also checks hops[source] == 0 and that pred[v] is a neighbor one
/// layer closer to the source.
template<graph_queryable G>
[[nodiscard]] bool verify_hop_distances(G const& g, hop_distance_result& result) {
    auto const V = g.node_count();
    auto const src = to_index(result.source);

    if (src >= V || result.hops[src] != 0) {
        result.verified = false;
        return false;
    }

    for (std::size_t u = 0; u < V; ++u) {
        auto const hu = result.hops[u];
        if (hu == hop_unreachable) continue;

        auto const uid = node_id{static_cast<std::uint32_t>(u)};
        for (auto v : g.out_neighbors(uid)) {
            auto const hv = result.hops[to_index(v)];
            if (hu < result.max_hops) {
                if (hv == hop_unreachable || hv > hu + 1) {
                    result.verified = false;
                    return false;
                }
            }
        }

        if (u == src) continue;
        auto const p = result.pred[u];
        if (p == invalid_node || result.hops[to_index(p)] + 1 != hu) {
            result.verified = false;
            return false;
        }
    }

    result.verified = true;
    return true;
}

// =========================================================================
// Breadth-first search
// =========================================================================

/// Hop distances from source to every node reachable within max_hops.
///
/// Preconditions:
/// - source is a valid node in g (throws std::out_of_range otherwise)
///
/// Example:
/// ```cpp
/// auto r = hop_distances(g, node_id{0}, 2);
/// if (r.reached(node_id{5})) { /* r.hops[5] is 1 or 2 */ }
/// ```
template<graph_queryable G>
[[nodiscard]] hop_distance_result
hop_distances(G const& g, node_id source, std::size_t max_hops = hop_unlimited) {
    auto const V = g.node_count();
    if (to_index(source) >= V)
        throw std::out_of_range("hop_distances: source not in graph");

    hop_distance_result result;
    result.hops.assign(V, hop_unreachable);
    result.pred.assign(V, invalid_node);
    result.order.reserve(V);
    result.source = source;
    result.max_hops = max_hops;

    result.hops[to_index(source)] = 0;
    result.order.push_back(source);

    // result.order doubles as the FIFO queue.
    std::size_t head = 0;
    while (head < result.order.size()) {
        auto const u = result.order[head++];
        auto const hu = result.hops[to_index(u)];
        if (hu >= max_hops) continue;

        for (auto v : g.out_neighbors(u)) {
            auto& hv = result.hops[to_index(v)];
            if (hv != hop_unreachable) continue;
            hv = hu + 1;
            result.pred[to_index(v)] = u;
            result.order.push_back(v);
        }
    }

    (void)verify_hop_distances(g, result);
    return result;
}

} // namespace staffnet::graph

#endif // STAFFNET_GRAPH_HOP_DISTANCE_H
