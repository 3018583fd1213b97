// ranking/candidate_clustering.h - k-means over head-coach candidates
// Part of the staff network library (C++20)
//
// Candidates are points in (personal value, expected staff value).
// Clusters separate, for example, strong individuals with thin networks
// from average coaches who would bring a strong staff.
//
// ALGORITHM: Lloyd's k-means with k-means++ seeding, best of several
// restarts by total within-cluster sum of squares.
//
// Determinism: one std::mt19937_64 seeded from clustering_params::seed
// drives every restart.  Cluster labels are renumbered by ascending
// centroid (personal, then staff), so label 0 is always the
// lowest-valued group regardless of seeding.
//
// Presentation only: nothing here feeds back into assembly or ranking.

#ifndef STAFFNET_RANKING_CANDIDATE_CLUSTERING_H
#define STAFFNET_RANKING_CANDIDATE_CLUSTERING_H

#include "../core/defaults.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace staffnet {

// =============================================================================
// Types
// =============================================================================

struct point2 {
    double x = 0.0;
    double y = 0.0;

    friend bool operator==(point2 const&, point2 const&) = default;
};

/// One head-coach candidate: personal value vs expected staff value.
struct candidate_point {
    std::string name;
    double personal_value = 0.0;
    double staff_value = 0.0;
};

struct clustering_params {
    std::size_t k = defaults::cluster_count;
    /// Pick k from the elbow of the WSS curve instead of using k.
    bool choose_k_by_elbow = false;
    std::size_t elbow_max_k = defaults::elbow_max_k;
    std::size_t restarts = defaults::kmeans_restarts;
    std::size_t max_iterations = defaults::kmeans_max_iterations;
    std::uint64_t seed = defaults::kmeans_seed;
};

struct kmeans_result {
    std::size_t k = 0;
    std::vector<std::size_t> labels;
    std::vector<point2> centroids;
    std::vector<std::size_t> sizes;
    double total_within_ss = 0.0;
    std::size_t iterations = 0;
    bool converged = false;
};

struct cluster_assignment {
    std::string name;
    double personal_value = 0.0;
    double staff_value = 0.0;
    std::size_t cluster = 0;
};

struct clustering_result {
    kmeans_result model;
    std::vector<cluster_assignment> assignments;
    /// WSS for k = 1..elbow_max_k, filled only when the elbow chose k.
    std::vector<double> wss;
};

// =============================================================================
// k-means
// =============================================================================

namespace detail {

inline double sq_dist(point2 a, point2 b) noexcept {
    double const dx = a.x - b.x;
    double const dy = a.y - b.y;
    return dx * dx + dy * dy;
}

inline std::size_t nearest(point2 p, std::vector<point2> const& centroids) noexcept {
    std::size_t best = 0;
    double best_d = std::numeric_limits<double>::infinity();
    for (std::size_t c = 0; c < centroids.size(); ++c) {
        auto const d = sq_dist(p, centroids[c]);
        if (d < best_d) {
            best_d = d;
            best = c;
        }
    }
    return best;
}

/// k-means++ seeding: first centre uniform, then proportional to D^2.
inline std::vector<point2>
seed_plus_plus(std::vector<point2> const& pts, std::size_t k, std::mt19937_64& rng) {
    std::vector<point2> centres;
    centres.reserve(k);
    std::uniform_int_distribution<std::size_t> pick(0, pts.size() - 1);
    centres.push_back(pts[pick(rng)]);

    std::vector<double> d2(pts.size());
    while (centres.size() < k) {
        double total = 0.0;
        for (std::size_t i = 0; i < pts.size(); ++i) {
            d2[i] = sq_dist(pts[i], centres[nearest(pts[i], centres)]);
            total += d2[i];
        }
        if (total <= 0.0) {
            centres.push_back(pts[pick(rng)]);
            continue;
        }
        std::uniform_real_distribution<double> u(0.0, total);
        double target = u(rng);
        std::size_t chosen = pts.size() - 1;
        for (std::size_t i = 0; i < pts.size(); ++i) {
            if (target < d2[i]) {
                chosen = i;
                break;
            }
            target -= d2[i];
        }
        centres.push_back(pts[chosen]);
    }
    return centres;
}

inline kmeans_result
lloyd(std::vector<point2> const& pts, std::vector<point2> centroids,
      std::size_t max_iterations) {
    kmeans_result r;
    r.k = centroids.size();
    r.labels.assign(pts.size(), 0);
    for (std::size_t i = 0; i < pts.size(); ++i) r.labels[i] = nearest(pts[i], centroids);

    for (std::size_t it = 0; it < max_iterations; ++it) {
        ++r.iterations;

        std::vector<point2> sum(r.k);
        std::vector<std::size_t> count(r.k, 0);
        for (std::size_t i = 0; i < pts.size(); ++i) {
            sum[r.labels[i]].x += pts[i].x;
            sum[r.labels[i]].y += pts[i].y;
            ++count[r.labels[i]];
        }
        for (std::size_t c = 0; c < r.k; ++c) {
            // An empty cluster keeps its previous centroid.
            if (count[c] == 0) continue;
            centroids[c] = point2{sum[c].x / static_cast<double>(count[c]),
                                  sum[c].y / static_cast<double>(count[c])};
        }

        bool changed = false;
        for (std::size_t i = 0; i < pts.size(); ++i) {
            auto const l = nearest(pts[i], centroids);
            if (l != r.labels[i]) {
                r.labels[i] = l;
                changed = true;
            }
        }
        if (!changed) {
            r.converged = true;
            break;
        }
    }

    r.centroids = std::move(centroids);
    r.sizes.assign(r.k, 0);
    r.total_within_ss = 0.0;
    for (std::size_t i = 0; i < pts.size(); ++i) {
        ++r.sizes[r.labels[i]];
        r.total_within_ss += sq_dist(pts[i], r.centroids[r.labels[i]]);
    }
    return r;
}

/// Renumber clusters by ascending centroid (x, then y).
inline void relabel_by_centroid(kmeans_result& r) {
    std::vector<std::size_t> order(r.k);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (r.centroids[a].x != r.centroids[b].x) return r.centroids[a].x < r.centroids[b].x;
        return r.centroids[a].y < r.centroids[b].y;
    });
    std::vector<std::size_t> new_label(r.k);
    for (std::size_t i = 0; i < r.k; ++i) new_label[order[i]] = i;

    std::vector<point2> centroids(r.k);
    std::vector<std::size_t> sizes(r.k);
    for (std::size_t c = 0; c < r.k; ++c) {
        centroids[new_label[c]] = r.centroids[c];
        sizes[new_label[c]] = r.sizes[c];
    }
    for (auto& l : r.labels) l = new_label[l];
    r.centroids = std::move(centroids);
    r.sizes = std::move(sizes);
}

} // namespace detail

/// Best-of-restarts k-means.  k is clamped to the number of points.
///
/// Throws std::invalid_argument if k or restarts is 0 or pts is empty.
[[nodiscard]] inline kmeans_result
kmeans(std::vector<point2> const& pts, std::size_t k,
       std::size_t restarts = defaults::kmeans_restarts,
       std::size_t max_iterations = defaults::kmeans_max_iterations,
       std::uint64_t seed = defaults::kmeans_seed) {
    if (k == 0) throw std::invalid_argument("kmeans: k must be >= 1");
    if (restarts == 0) throw std::invalid_argument("kmeans: restarts must be >= 1");
    if (pts.empty()) throw std::invalid_argument("kmeans: no points");
    k = std::min(k, pts.size());

    std::mt19937_64 rng(seed);
    kmeans_result best;
    bool have_best = false;
    for (std::size_t run = 0; run < restarts; ++run) {
        auto r = detail::lloyd(pts, detail::seed_plus_plus(pts, k, rng), max_iterations);
        if (!have_best || r.total_within_ss < best.total_within_ss) {
            best = std::move(r);
            have_best = true;
        }
    }
    detail::relabel_by_centroid(best);
    return best;
}

/// Total within-cluster SS for k = 1..max_k (clamped to the point count).
[[nodiscard]] inline std::vector<double>
wss_curve(std::vector<point2> const& pts, std::size_t max_k,
          std::size_t restarts = defaults::kmeans_restarts,
          std::uint64_t seed = defaults::kmeans_seed) {
    std::vector<double> out;
    auto const top = std::min(max_k, pts.size());
    for (std::size_t k = 1; k <= top; ++k) {
        out.push_back(kmeans(pts, k, restarts, defaults::kmeans_max_iterations, seed)
                          .total_within_ss);
    }
    return out;
}

/// Elbow of a WSS curve (wss[i] is the value at k = i + 1): the k whose
/// point lies farthest from the chord joining the first and last points.
/// Ties pick the smaller k.  Returns wss.size() for curves shorter than 3.
[[nodiscard]] inline std::size_t elbow_k(std::vector<double> const& wss) {
    if (wss.size() < 3) return wss.size();

    double const x1 = 1.0;
    double const y1 = wss.front();
    double const x2 = static_cast<double>(wss.size());
    double const y2 = wss.back();
    double const norm = std::hypot(y2 - y1, x2 - x1);

    std::size_t best_k = 1;
    double best_d = -1.0;
    for (std::size_t i = 0; i < wss.size(); ++i) {
        double const x = static_cast<double>(i + 1);
        double const d = std::abs((y2 - y1) * x - (x2 - x1) * wss[i] + x2 * y1 - y2 * x1) / norm;
        if (d > best_d) {
            best_d = d;
            best_k = i + 1;
        }
    }
    return best_k;
}

/// Cluster candidates on (personal_value, staff_value).  Empty input
/// yields an empty result.
[[nodiscard]] inline clustering_result
cluster_candidates(std::vector<candidate_point> const& candidates,
                   clustering_params const& params = {}) {
    clustering_result out;
    if (candidates.empty()) return out;

    std::vector<point2> pts;
    pts.reserve(candidates.size());
    for (auto const& c : candidates) pts.push_back(point2{c.personal_value, c.staff_value});

    auto k = params.k;
    if (params.choose_k_by_elbow) {
        out.wss = wss_curve(pts, params.elbow_max_k, params.restarts, params.seed);
        k = elbow_k(out.wss);
    }

    out.model = kmeans(pts, k, params.restarts, params.max_iterations, params.seed);
    out.assignments.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        out.assignments.push_back(cluster_assignment{
            candidates[i].name, candidates[i].personal_value,
            candidates[i].staff_value, out.model.labels[i]});
    }
    return out;
}

} // namespace staffnet

#endif // STAFFNET_RANKING_CANDIDATE_CLUSTERING_H
