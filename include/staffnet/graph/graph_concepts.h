// graph/graph_concepts.h - Descriptor types and graph concepts
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// node_id is an opaque dense index into CSR storage.  All semantics
// (which coach, which role) live in external tables keyed by node_id,
// BGL-style.  Algorithms constrain on graph_queryable and never see
// coach identifiers.
//
// DESIGN LIMIT: uint32_t node indices.  A full NFL staff history is a
// few thousand coaches, far below this.

#ifndef STAFFNET_GRAPH_CONCEPTS_H
#define STAFFNET_GRAPH_CONCEPTS_H

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace staffnet::graph {

// =============================================================================
// Descriptor Type
// =============================================================================

/// Opaque node identifier.
///
/// Valid only for the graph instance that produced it.
struct node_id {
    std::uint32_t value{};

    friend constexpr bool operator==(node_id, node_id) = default;
    friend constexpr auto operator<=>(node_id, node_id) = default;
};

/// Convert node_id to index for array access.
[[nodiscard]] constexpr std::size_t to_index(node_id n) noexcept {
    return static_cast<std::size_t>(n.value);
}

/// Sentinel value for invalid/unassigned node references.
inline constexpr node_id invalid_node{std::uint32_t{0xFFFFFFFF}};

// =============================================================================
// Graph Concepts
// =============================================================================

/// A graph_queryable provides immutable adjacency queries.
///
/// Requirements:
/// - node_count(): number of nodes in the graph
/// - out_neighbors(u): returns range-like of node_id
template<typename G>
concept graph_queryable =
    requires(G const& g, node_id u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) };
    };

/// A sized_graph additionally reports its edge count.
///
/// For undirected graphs edge_count() counts each unordered pair once.
template<typename G>
concept sized_graph =
    graph_queryable<G> &&
    requires(G const& g) {
        { g.edge_count() } -> std::convertible_to<std::size_t>;
    };

} // namespace staffnet::graph

#endif // STAFFNET_GRAPH_CONCEPTS_H
