// graph/weighted_assignment.h - Maximum-weight bipartite assignment
// Part of the staff network library (C++20)
//
// ALGORITHM: Hungarian method (Kuhn-Munkres, O(N^3) potentials form)
// on a square cost matrix padded with zero-cost dummy rows/columns.
//
// Complexity: O(N^3), N = max(rows, cols).
//
// GUARANTEES:
// - Maximum coverage first: no other assignment uses more allowed pairs
// - Among maximum-coverage assignments, total weight is maximal
// - Deterministic: same matrix -> same assignment
// - Correct: verify_assignment() checks that every pair is allowed and
//   no row or column appears twice
//
// DESIGN RATIONALE:
// Coverage is lexicographically ahead of weight.  Each allowed pair is
// lifted by a constant larger than any achievable difference in total
// weight, so one more assigned pair always outweighs any re-shuffle of
// scores.  Disallowed pairs cost the same as a dummy, and a solution
// that lands on one simply leaves that row unassigned.

#ifndef STAFFNET_GRAPH_WEIGHTED_ASSIGNMENT_H
#define STAFFNET_GRAPH_WEIGHTED_ASSIGNMENT_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

namespace staffnet::graph {

// =========================================================================
// Input
// =========================================================================

/// Dense rows x cols weight matrix with an allowed mask.
class weight_matrix {
public:
    weight_matrix() = default;
    weight_matrix(std::size_t rows, std::size_t cols)
        : rows_(rows), cols_(cols), w_(rows * cols, 0.0), allowed_(rows * cols, false) {}

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }

    /// Mark (r, c) allowed with weight w.  Throws std::out_of_range.
    void set(std::size_t r, std::size_t c, double w) {
        check(r, c);
        if (!std::isfinite(w))
            throw std::invalid_argument("weight_matrix: weight must be finite");
        w_[r * cols_ + c] = w;
        allowed_[r * cols_ + c] = true;
    }

    [[nodiscard]] bool allowed(std::size_t r, std::size_t c) const {
        check(r, c);
        return allowed_[r * cols_ + c];
    }

    [[nodiscard]] double weight(std::size_t r, std::size_t c) const {
        check(r, c);
        return w_[r * cols_ + c];
    }

private:
    void check(std::size_t r, std::size_t c) const {
        if (r >= rows_ || c >= cols_)
            throw std::out_of_range("weight_matrix: index out of range");
    }

    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<double> w_;
    std::vector<bool> allowed_;
};

// =========================================================================
// Result type
// =========================================================================

/// Result of a weighted assignment.
///
/// - row_to_col[r]: column assigned to row r, or NIL
/// - col_to_row[c]: row assigned to column c, or NIL
/// - assigned_count: number of assigned (allowed) pairs
/// - total_weight:   sum of weights over assigned pairs
/// - verified:       true if verify_assignment() has confirmed validity
struct assignment_result {
    static constexpr std::size_t NIL = ~std::size_t{0};

    std::vector<std::size_t> row_to_col;
    std::vector<std::size_t> col_to_row;
    std::size_t assigned_count = 0;
    double total_weight = 0.0;
    bool verified = false;

    [[nodiscard]] bool row_assigned(std::size_t r) const {
        return r < row_to_col.size() && row_to_col[r] != NIL;
    }
};

// =========================================================================
// Verification
// =========================================================================

/// O(rows + cols) check: assigned pairs are allowed, the two maps agree,
/// and assigned_count / total_weight match the pairs.
[[nodiscard]] inline bool
verify_assignment(weight_matrix const& m, assignment_result& result) {
    result.verified = false;
    if (result.row_to_col.size() != m.rows() || result.col_to_row.size() != m.cols())
        return false;

    std::size_t count = 0;
    double total = 0.0;
    for (std::size_t r = 0; r < m.rows(); ++r) {
        auto const c = result.row_to_col[r];
        if (c == assignment_result::NIL) continue;
        if (c >= m.cols() || !m.allowed(r, c)) return false;
        if (result.col_to_row[c] != r) return false;
        ++count;
        total += m.weight(r, c);
    }
    for (std::size_t c = 0; c < m.cols(); ++c) {
        auto const r = result.col_to_row[c];
        if (r == assignment_result::NIL) continue;
        if (r >= m.rows() || result.row_to_col[r] != c) return false;
    }
    if (count != result.assigned_count) return false;
    if (std::abs(total - result.total_weight) > 1e-9 * (1.0 + std::abs(total))) return false;

    result.verified = true;
    return true;
}

// =========================================================================
// Hungarian method
// =========================================================================

namespace detail {

/// Minimum-cost perfect assignment on a square matrix (row-major N x N).
/// Returns the column of each row.
inline std::vector<std::size_t>
hungarian_min_cost(std::vector<double> const& cost, std::size_t N) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    std::vector<double> u(N + 1, 0.0), v(N + 1, 0.0);
    std::vector<std::size_t> p(N + 1, 0), way(N + 1, 0);

    for (std::size_t i = 1; i <= N; ++i) {
        p[0] = i;
        std::size_t j0 = 0;
        std::vector<double> minv(N + 1, inf);
        std::vector<bool> used(N + 1, false);
        do {
            used[j0] = true;
            auto const i0 = p[j0];
            std::size_t j1 = 0;
            double delta = inf;
            for (std::size_t j = 1; j <= N; ++j) {
                if (used[j]) continue;
                double const cur = cost[(i0 - 1) * N + (j - 1)] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (std::size_t j = 0; j <= N; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);
        do {
            auto const j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<std::size_t> col_of_row(N, 0);
    for (std::size_t j = 1; j <= N; ++j) {
        if (p[j] > 0) col_of_row[p[j] - 1] = j - 1;
    }
    return col_of_row;
}

} // namespace detail

/// Maximum-coverage, then maximum-weight, assignment of rows to columns.
///
/// Example:
/// ```cpp
/// weight_matrix m(2, 3);
/// m.set(0, 0, 1.0); m.set(0, 1, 3.0); m.set(1, 1, 2.0);
/// auto r = max_weight_assignment(m);
/// // r.row_to_col == {0, 1}: covering both rows beats taking the 3.0
/// ```
[[nodiscard]] inline assignment_result
max_weight_assignment(weight_matrix const& m) {
    assignment_result result;
    result.row_to_col.assign(m.rows(), assignment_result::NIL);
    result.col_to_row.assign(m.cols(), assignment_result::NIL);

    auto const N = std::max(m.rows(), m.cols());
    if (N == 0 || m.rows() == 0 || m.cols() == 0) {
        (void)verify_assignment(m, result);
        return result;
    }

    double max_abs = 0.0;
    for (std::size_t r = 0; r < m.rows(); ++r)
        for (std::size_t c = 0; c < m.cols(); ++c)
            if (m.allowed(r, c)) max_abs = std::max(max_abs, std::abs(m.weight(r, c)));

    // Larger than any difference in total weight between two assignments.
    double const lift =
        1.0 + 2.0 * max_abs * static_cast<double>(std::min(m.rows(), m.cols()));

    std::vector<double> cost(N * N, 0.0);
    for (std::size_t r = 0; r < m.rows(); ++r)
        for (std::size_t c = 0; c < m.cols(); ++c)
            if (m.allowed(r, c)) cost[r * N + c] = -(lift + m.weight(r, c));

    auto const col_of_row = detail::hungarian_min_cost(cost, N);

    for (std::size_t r = 0; r < m.rows(); ++r) {
        auto const c = col_of_row[r];
        if (c >= m.cols() || !m.allowed(r, c)) continue;
        result.row_to_col[r] = c;
        result.col_to_row[c] = r;
        ++result.assigned_count;
        result.total_weight += m.weight(r, c);
    }

    (void)verify_assignment(m, result);
    return result;
}

} // namespace staffnet::graph

#endif // STAFFNET_GRAPH_WEIGHTED_ASSIGNMENT_H
