// graph/costaff_graph.h - Co-staff relationship network
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// Topology and semantics are kept apart.  The runtime_graph holds only
// dense node indices; coach records and relationship edges live in
// sorted side tables.  Queries take coach_id and translate at the
// boundary, so algorithms stay coach-agnostic.
//
// Relationship edges are canonical: coach_1 < coach_2, one per pair.
// Edges whose endpoints are not both roster coaches are dropped at
// construction (the roster already applied the recency cutoff).
//
// The graph is immutable after build() and safe to share by const
// reference across concurrent assembly runs.

#ifndef STAFFNET_GRAPH_COSTAFF_GRAPH_H
#define STAFFNET_GRAPH_COSTAFF_GRAPH_H

#include "../core/coach_types.h"
#include "graph_concepts.h"
#include "hop_distance.h"
#include "runtime_graph.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace staffnet {

/// One unordered coach pair that shared at least one (year, team).
///
/// Invariant: coach_1 < coach_2.
struct relationship_edge {
    coach_id coach_1{};
    coach_id coach_2{};
    int years_together = 0;
    std::optional<double> avg_value_1;
    std::optional<double> avg_value_2;

    /// Average value of `who` over co-occurring rows, or empty.
    [[nodiscard]] std::optional<double> value_of(coach_id who) const noexcept {
        if (who == coach_1) return avg_value_1;
        if (who == coach_2) return avg_value_2;
        return std::nullopt;
    }
};

/// A coach reached from a search origin, with its network distance.
struct reachable_coach {
    coach_id id{};
    std::size_t degree = 0;

    friend bool operator==(reachable_coach const&, reachable_coach const&) = default;
};

/// Undirected co-staff graph over coach identities.
class costaff_graph {
public:
    costaff_graph() = default;

    /// Build from a roster and relationship edges.
    ///
    /// Throws std::invalid_argument on a duplicate coach id, a
    /// non-canonical edge (coach_1 >= coach_2) or a duplicate pair.
    [[nodiscard]] static costaff_graph
    build(std::vector<coach_record> roster, std::vector<relationship_edge> edges) {
        costaff_graph cg;

        std::sort(roster.begin(), roster.end(),
            [](coach_record const& a, coach_record const& b) { return a.id < b.id; });
        for (std::size_t i = 1; i < roster.size(); ++i) {
            if (roster[i].id == roster[i - 1].id)
                throw std::invalid_argument(
                    "costaff_graph: duplicate coach id " +
                    std::to_string(roster[i].id.value));
        }

        graph::runtime_graph_builder b;
        cg.index_.reserve(roster.size());
        for (auto const& c : roster) {
            cg.index_.emplace(c.id.value, b.add_node());
        }
        cg.coaches_ = std::move(roster);

        std::sort(edges.begin(), edges.end(), edge_less);
        for (std::size_t i = 0; i < edges.size(); ++i) {
            auto const& e = edges[i];
            if (!(e.coach_1 < e.coach_2))
                throw std::invalid_argument(
                    "costaff_graph: edge not canonical (coach_1 must be < coach_2)");
            if (i > 0 && edges[i - 1].coach_1 == e.coach_1 &&
                edges[i - 1].coach_2 == e.coach_2)
                throw std::invalid_argument("costaff_graph: duplicate relationship edge");
        }

        for (auto& e : edges) {
            auto a = cg.node_of(e.coach_1);
            auto b2 = cg.node_of(e.coach_2);
            if (a == graph::invalid_node || b2 == graph::invalid_node) continue;
            b.add_edge(a, b2);
            cg.edges_.push_back(std::move(e));
        }

        cg.topology_ = b.finalise();
        return cg;
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return topology_.node_count(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return topology_.edge_count(); }
    [[nodiscard]] bool empty() const noexcept { return topology_.empty(); }

    [[nodiscard]] graph::runtime_graph const& topology() const noexcept { return topology_; }
    [[nodiscard]] std::vector<coach_record> const& coaches() const noexcept { return coaches_; }
    [[nodiscard]] std::vector<relationship_edge> const& edges() const noexcept { return edges_; }

    // =========================================================================
    // Coach lookup
    // =========================================================================

    [[nodiscard]] bool contains(coach_id id) const noexcept {
        return index_.find(id.value) != index_.end();
    }

    /// Throws std::out_of_range if id is not a graph node.
    [[nodiscard]] coach_record const& coach(coach_id id) const {
        auto n = node_of(id);
        if (n == graph::invalid_node)
            throw std::out_of_range(
                "costaff_graph: coach " + std::to_string(id.value) + " not in graph");
        return coaches_[graph::to_index(n)];
    }

    /// First coach (lowest id) with this exact name.
    [[nodiscard]] std::optional<coach_id> find_by_name(std::string_view name) const {
        for (auto const& c : coaches_) {
            if (c.name == name) return c.id;
        }
        return std::nullopt;
    }

    /// Dense node index for id, or invalid_node.
    [[nodiscard]] graph::node_id node_of(coach_id id) const noexcept {
        auto it = index_.find(id.value);
        if (it == index_.end()) return graph::invalid_node;
        return it->second;
    }

    [[nodiscard]] coach_id coach_at(graph::node_id n) const {
        return coaches_.at(graph::to_index(n)).id;
    }

    // =========================================================================
    // Edge lookup
    // =========================================================================

    /// Relationship edge between a and b in either order, or nullptr.
    [[nodiscard]] relationship_edge const* find_edge(coach_id a, coach_id b) const noexcept {
        if (a == b) return nullptr;
        if (b < a) std::swap(a, b);
        relationship_edge key;
        key.coach_1 = a;
        key.coach_2 = b;
        auto it = std::lower_bound(edges_.begin(), edges_.end(), key, edge_less);
        if (it == edges_.end() || it->coach_1 != a || it->coach_2 != b) return nullptr;
        return &*it;
    }

    /// Distinct seasons a and b shared a staff; 0 when never together.
    [[nodiscard]] int years_together(coach_id a, coach_id b) const noexcept {
        auto const* e = find_edge(a, b);
        return e ? e->years_together : 0;
    }

    // =========================================================================
    // Distance queries
    // =========================================================================

    /// Unweighted shortest-path edge count, graph::hop_unreachable if
    /// unreachable or either coach is absent.
    [[nodiscard]] std::size_t distance(coach_id a, coach_id b) const {
        auto na = node_of(a);
        auto nb = node_of(b);
        if (na == graph::invalid_node || nb == graph::invalid_node)
            return graph::hop_unreachable;
        if (na == nb) return 0;
        auto r = graph::hop_distances(topology_, na);
        return r.hops[graph::to_index(nb)];
    }

    /// Coaches with 0 < distance(target, c) <= k, sorted by (degree, id).
    ///
    /// Throws std::out_of_range if target is not in the graph.
    [[nodiscard]] std::vector<reachable_coach>
    neighbors_within(coach_id target, std::size_t k) const {
        auto n = node_of(target);
        if (n == graph::invalid_node)
            throw std::out_of_range(
                "costaff_graph: coach " + std::to_string(target.value) + " not in graph");

        auto r = graph::hop_distances(topology_, n, k);
        std::vector<reachable_coach> out;
        for (auto v : r.order) {
            auto const h = r.hops[graph::to_index(v)];
            if (h == 0 || h > k) continue;
            out.push_back(reachable_coach{coaches_[graph::to_index(v)].id, h});
        }
        std::sort(out.begin(), out.end(),
            [](reachable_coach const& x, reachable_coach const& y) {
                return std::tie(x.degree, x.id) < std::tie(y.degree, y.id);
            });
        return out;
    }

private:
    static bool edge_less(relationship_edge const& x, relationship_edge const& y) noexcept {
        return std::tie(x.coach_1, x.coach_2) < std::tie(y.coach_1, y.coach_2);
    }

    graph::runtime_graph topology_;
    std::vector<coach_record> coaches_;
    std::vector<relationship_edge> edges_;
    std::unordered_map<std::uint32_t, graph::node_id> index_;
};

} // namespace staffnet

#endif // STAFFNET_GRAPH_COSTAFF_GRAPH_H
