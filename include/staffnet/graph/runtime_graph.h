// graph/runtime_graph.h - Runtime-constructed undirected CSR graph
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// The co-staff network is built once per analysis run from tabular
// data and never mutated afterwards.  A compressed sparse row layout
// gives contiguous neighbor ranges for BFS and is trivially shareable
// across independent assembly runs.
//
// Internal storage uses std::vector for CSR offsets and neighbors; node
// and edge counts are only known at runtime.
//
// CONSTRUCTION:
//   runtime_graph_builder builds the graph incrementally, then
//   finalise() produces an immutable runtime_graph.
//   Canonicalisation rules: sort, dedup, no self-edges.  Every accepted
//   edge is stored in both directions.

#ifndef STAFFNET_GRAPH_RUNTIME_GRAPH_H
#define STAFFNET_GRAPH_RUNTIME_GRAPH_H

#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace staffnet::graph {

// Forward declaration for friend access.
class runtime_graph_builder;

// =============================================================================
// runtime_graph
// =============================================================================

/// Runtime-constructed, immutable, CSR-format undirected graph.
///
/// Constructed via runtime_graph_builder::finalise().
///
/// Example:
/// ```cpp
/// runtime_graph_builder b;
/// auto n0 = b.add_node(); auto n1 = b.add_node(); auto n2 = b.add_node();
/// b.add_edge(n0, n1);
/// b.add_edge(n1, n2);
/// auto g = b.finalise();
/// auto hops = hop_distances(g, n0);   // hops.hops[2] == 2
/// ```
class runtime_graph {
public:
    using size_type = std::uint32_t;

    runtime_graph() = default;

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return V_; }

    /// Number of undirected edges (each unordered pair counted once).
    [[nodiscard]] std::size_t edge_count() const noexcept { return E_; }

    [[nodiscard]] bool empty() const noexcept { return V_ == 0; }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    struct adjacency_range {
        node_id const* begin_;
        node_id const* end_;

        [[nodiscard]] node_id const* begin() const noexcept { return begin_; }
        [[nodiscard]] node_id const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    /// Neighbors of u in ascending node order.
    [[nodiscard]] adjacency_range
    out_neighbors(node_id u) const noexcept {
        auto const idx = to_index(u);
        auto const b = static_cast<std::size_t>(offsets_[idx]);
        auto const e = static_cast<std::size_t>(offsets_[idx + 1]);
        return {neighbors_.data() + b, neighbors_.data() + e};
    }

    [[nodiscard]] std::size_t
    degree(node_id u) const noexcept {
        auto const idx = to_index(u);
        return static_cast<std::size_t>(offsets_[idx + 1]) -
               static_cast<std::size_t>(offsets_[idx]);
    }

    [[nodiscard]] std::size_t max_degree() const noexcept {
        std::size_t max_deg = 0;
        for (std::size_t v = 0; v < V_; ++v) {
            auto const deg = static_cast<std::size_t>(offsets_[v + 1]) -
                             static_cast<std::size_t>(offsets_[v]);
            if (deg > max_deg) max_deg = deg;
        }
        return max_deg;
    }

    [[nodiscard]] bool has_node(node_id u) const noexcept {
        return to_index(u) < V_;
    }

    /// O(log d) adjacency test via binary search in u's sorted range.
    [[nodiscard]] bool has_edge(node_id u, node_id v) const noexcept {
        if (!has_node(u) || !has_node(v)) return false;
        auto const nbrs = out_neighbors(u);
        return std::binary_search(nbrs.begin(), nbrs.end(), v);
    }

private:
    std::size_t V_ = 0;
    std::size_t E_ = 0;
    std::vector<size_type> offsets_;
    std::vector<node_id> neighbors_;

    friend class runtime_graph_builder;
};

static_assert(graph_queryable<runtime_graph>);
static_assert(sized_graph<runtime_graph>);

// =============================================================================
// runtime_graph_builder
// =============================================================================

/// Builder for undirected runtime_graph.
///
/// Canonicalisation:
/// 1. add_edge(u, v) records both u->v and v->u
/// 2. Arcs sorted by (src, dst)
/// 3. Duplicates removed
/// 4. Self-edges removed
class runtime_graph_builder {
public:
    struct arc {
        std::uint32_t src;
        std::uint32_t dst;

        bool operator==(arc const&) const = default;
        bool operator<(arc const& o) const {
            if (src != o.src) return src < o.src;
            return dst < o.dst;
        }
    };

    [[nodiscard]] node_id add_node() {
        if (V_ >= invalid_node.value)
            throw std::length_error("runtime_graph_builder: node count exceeds index range");
        auto const id = static_cast<std::uint32_t>(V_);
        ++V_;
        return node_id{id};
    }

    [[nodiscard]] node_id add_nodes(std::size_t count) {
        if (V_ + count >= invalid_node.value)
            throw std::length_error("runtime_graph_builder: would exceed index range");
        auto const first = static_cast<std::uint32_t>(V_);
        V_ += count;
        return node_id{first};
    }

    void add_edge(node_id u, node_id v) {
        if (V_ == 0)
            throw std::logic_error("runtime_graph_builder: no nodes");
        if (to_index(u) >= V_)
            throw std::out_of_range("runtime_graph_builder: source not in graph");
        if (to_index(v) >= V_)
            throw std::out_of_range("runtime_graph_builder: target not in graph");
        if (u == v) return;
        arcs_.push_back(arc{u.value, v.value});
        arcs_.push_back(arc{v.value, u.value});
    }

    [[nodiscard]] std::size_t node_count() const noexcept { return V_; }

    /// Build the immutable runtime_graph.
    [[nodiscard]] runtime_graph finalise() const {
        runtime_graph g;
        g.V_ = V_;

        if (arcs_.empty()) {
            g.offsets_.assign(V_ + 1, 0);
            g.E_ = 0;
            return g;
        }

        auto sorted = arcs_;
        std::sort(sorted.begin(), sorted.end());
        sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

        g.E_ = sorted.size() / 2;

        // Build CSR.
        g.offsets_.assign(V_ + 1, 0);
        for (auto const& a : sorted) {
            g.offsets_[a.src + 1]++;
        }
        for (std::size_t i = 1; i <= V_; ++i) {
            g.offsets_[i] += g.offsets_[i - 1];
        }

        g.neighbors_.resize(sorted.size());
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            g.neighbors_[i] = node_id{sorted[i].dst};
        }

        return g;
    }

private:
    std::size_t V_ = 0;
    std::vector<arc> arcs_;
};

} // namespace staffnet::graph

#endif // STAFFNET_GRAPH_RUNTIME_GRAPH_H
