// core/defaults.h - Tunable constants for staff analysis
// Part of the staff network library (C++20)
//
// DESIGN RATIONALE:
// Every tunable constant has exactly one home.  Runtime parameter
// structs (assembly_params, clustering_params, composite_params)
// default their fields to these values, so a caller overrides per call:
//
//   assembly_params p;                 // max_degree = defaults::max_degree
//   p.max_degree = 3;                  // widen the search for one run
//   staff_assembler a(graph, mapper, p);
//
// Changing a value here changes the documented behaviour of every
// consumer.  Downstream rankings were tuned against these numbers.

#ifndef STAFFNET_CORE_DEFAULTS_H
#define STAFFNET_CORE_DEFAULTS_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace staffnet {

/// Default parameters for network construction, assembly and ranking.
namespace defaults {

// =============================================================================
// Network construction
// =============================================================================

/// Coaches whose most recent season is older than this are not graph
/// nodes.  Their full history still counts toward years together.
inline constexpr int recency_cutoff = 2024;

// =============================================================================
// Network centrality
// =============================================================================

/// PageRank damping factor.
inline constexpr double pagerank_damping = 0.85;

/// Power iteration stops once the L1 change falls below this.
inline constexpr double centrality_tolerance = 1e-12;

/// Power iteration cap for PageRank and eigenvector centrality.
inline constexpr std::size_t centrality_max_iterations = 1000;

// =============================================================================
// Candidate search
// =============================================================================

/// Maximum network distance searched from the target head coach.
/// 2 = friends of friends.
inline constexpr std::size_t max_degree = 2;

/// Candidates recorded per open position.
inline constexpr std::size_t top_n = 5;

/// Largest closeness step a coach may climb in one move.
inline constexpr double promotion_step = 0.4;

/// Performance weight used when a coach has no recorded value.
/// Deliberately not zero: unknown is not the same as bad.
inline constexpr double missing_value_floor = 0.3;

// =============================================================================
// Ranking
// =============================================================================

/// Connection score at or above which a top candidate is "quality".
inline constexpr double quality_threshold = 0.5;

/// Role substring identifying coordinator positions.
inline constexpr std::string_view coordinator_marker = "Coordinator";

/// Number of top positions averaged into top3_avg_score.
inline constexpr std::size_t top_positions = 3;

// =============================================================================
// Clustering
// =============================================================================

/// Cluster count used when the elbow is not requested.
inline constexpr std::size_t cluster_count = 3;

/// Largest k evaluated on the elbow curve.
inline constexpr std::size_t elbow_max_k = 10;

/// Independent k-means restarts; the lowest within-cluster SS wins.
inline constexpr std::size_t kmeans_restarts = 25;

/// Lloyd iteration cap per restart.
inline constexpr std::size_t kmeans_max_iterations = 100;

/// Fixed seed so clustering is reproducible run to run.
inline constexpr std::uint64_t kmeans_seed = 42;

// =============================================================================
// Candidate composite value
// =============================================================================

/// Season the exponential decay is anchored at.
inline constexpr int decay_anchor_year = 2025;

/// Exponential decay rate per season.
inline constexpr double decay_rate = 0.05;

/// Closeness used for a head coach's own network term.
inline constexpr double head_coach_self_closeness = 0.8;

/// Minimum co-staff records for a coach to be a candidate.
inline constexpr std::size_t min_candidate_records = 15;

} // namespace defaults

} // namespace staffnet

#endif // STAFFNET_CORE_DEFAULTS_H
