// staff/staff_assembler.h - Staff recommendation for one head coach
// Part of the staff network library (C++20)
//
// ALGORITHM (greedy, default):
//   pool      = coaches within max_degree of the target head coach
//   for each open position, in catalog order:
//     eligible = unassigned pool members whose current role can be
//                promoted into the position
//     rank eligible by connection score (desc), then coach id (asc)
//     assign the first, record the first top_n
//
// ALGORITHM (optimal):
//   One maximum-coverage, maximum-total-score assignment of positions to
//   pool members (graph/weighted_assignment.h).  Each position lists its
//   assigned coach first, then the best eligible coaches not assigned
//   elsewhere.
//
// GUARANTEES:
// - No coach is assigned to two positions in one run
// - A position with no eligible candidate produces no entry
// - Deterministic: same graph, mapper and params -> same result
//
// The assembler holds references to an immutable graph and mapper;
// assemble() is const and keeps all per-run state local, so one
// assembler may serve many head coaches.

#ifndef STAFFNET_STAFF_STAFF_ASSEMBLER_H
#define STAFFNET_STAFF_STAFF_ASSEMBLER_H

#include "../core/coach_types.h"
#include "../core/defaults.h"
#include "../core/run_stats.h"
#include "../graph/costaff_graph.h"
#include "../graph/weighted_assignment.h"
#include "connection_score.h"
#include "promotion.h"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace staffnet {

// =============================================================================
// Result types
// =============================================================================

/// One candidate for one open position of one head coach.
struct candidate_record {
    coach_id id{};
    std::string name;
    role_side current;
    role_side target;
    std::size_t degree = 0;
    int years_together = 0;
    std::optional<double> value;
    double score = 0.0;
    bool assigned = false;
};

/// Ranked candidates for one open position.  candidates.front() is the
/// assigned coach.
struct position_recommendation {
    role_side position;
    std::vector<candidate_record> candidates;

    [[nodiscard]] std::string key() const { return position.position_key(); }

    /// Throws std::logic_error on an empty entry.
    [[nodiscard]] candidate_record const& top() const {
        if (candidates.empty())
            throw std::logic_error("position_recommendation: no candidates");
        return candidates.front();
    }
};

/// Recommended staff for one head coach.
struct staff_recommendation {
    coach_id head_coach{};
    std::string head_coach_name;
    std::vector<position_recommendation> positions;
    assembly_stats stats;

    [[nodiscard]] bool empty() const noexcept { return positions.empty(); }

    /// All candidate rows, position by position.
    [[nodiscard]] std::vector<candidate_record> rows() const {
        std::vector<candidate_record> out;
        for (auto const& p : positions)
            out.insert(out.end(), p.candidates.begin(), p.candidates.end());
        return out;
    }

    /// The assigned coach of every filled position.
    [[nodiscard]] std::vector<candidate_record> assigned() const {
        std::vector<candidate_record> out;
        out.reserve(positions.size());
        for (auto const& p : positions) out.push_back(p.top());
        return out;
    }
};

// =============================================================================
// Parameters
// =============================================================================

enum class assignment_strategy {
    greedy,
    optimal,
};

struct assembly_params {
    std::size_t max_degree = defaults::max_degree;
    std::size_t top_n = defaults::top_n;
    double missing_value_floor = defaults::missing_value_floor;
    assignment_strategy strategy = assignment_strategy::greedy;
    bool verbose = false;
};

// =============================================================================
// Assembler
// =============================================================================

class staff_assembler {
public:
    /// Throws std::invalid_argument if max_degree or top_n is 0.
    staff_assembler(costaff_graph const& graph, promotion_mapper const& mapper,
                    assembly_params params = {})
        : graph_(graph), mapper_(mapper), params_(params) {
        if (params_.max_degree == 0)
            throw std::invalid_argument("staff_assembler: max_degree must be >= 1");
        if (params_.top_n == 0)
            throw std::invalid_argument("staff_assembler: top_n must be >= 1");
    }

    [[nodiscard]] assembly_params const& params() const noexcept { return params_; }

    /// Throws std::logic_error on an empty graph, std::out_of_range if
    /// target is not a graph node.
    [[nodiscard]] staff_recommendation assemble(coach_id target) const {
        if (graph_.empty())
            throw std::logic_error("staff_assembler: co-staff graph is empty");
        if (!graph_.contains(target))
            throw std::out_of_range(
                "staff_assembler: head coach " + std::to_string(target.value) +
                " not found in network");

        staff_recommendation rec;
        rec.head_coach = target;
        rec.head_coach_name = graph_.coach(target).name;

        auto const pool = build_pool(target);
        auto const positions = mapper_.open_positions();
        rec.stats.pool_size = pool.size();
        rec.stats.positions_total = positions.size();

        if (params_.verbose) {
            std::cerr << "[assembler] " << rec.head_coach_name << ": "
                      << pool.size() << " candidates within degree "
                      << params_.max_degree << ", "
                      << positions.size() << " open positions\n";
        }

        if (params_.strategy == assignment_strategy::optimal) {
            assemble_optimal(pool, positions, rec);
        } else {
            assemble_greedy(pool, positions, rec);
        }

        if (params_.verbose) {
            std::cerr << "[assembler] " << rec.head_coach_name << ": filled "
                      << rec.stats.positions_filled << "/" << rec.stats.positions_total
                      << " positions\n";
        }
        return rec;
    }

    /// Lookup by exact coach name (lowest id on duplicates).
    /// Throws std::out_of_range if no coach has that name.
    [[nodiscard]] staff_recommendation assemble(std::string_view name) const {
        if (graph_.empty())
            throw std::logic_error("staff_assembler: co-staff graph is empty");
        auto id = graph_.find_by_name(name);
        if (!id)
            throw std::out_of_range(
                "staff_assembler: head coach '" + std::string(name) +
                "' not found in network");
        return assemble(*id);
    }

private:
    struct pool_member {
        coach_record const* coach = nullptr;
        std::size_t degree = 0;
        int years_together = 0;
    };

    std::vector<pool_member> build_pool(coach_id target) const {
        std::vector<pool_member> pool;
        for (auto const& r : graph_.neighbors_within(target, params_.max_degree)) {
            pool.push_back(pool_member{
                &graph_.coach(r.id), r.degree, graph_.years_together(r.id, target)});
        }
        return pool;
    }

    candidate_record make_candidate(pool_member const& m, role_side const& position) const {
        candidate_record c;
        c.id = m.coach->id;
        c.name = m.coach->name;
        c.current = m.coach->current;
        c.target = position;
        c.degree = m.degree;
        c.years_together = m.years_together;
        c.value = m.coach->value;
        c.score = connection_score(c.value, c.years_together, c.degree,
                                   params_.missing_value_floor);
        return c;
    }

    static bool better(candidate_record const& a, candidate_record const& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    }

    void log_position(role_side const& position, candidate_record const* top) const {
        if (!params_.verbose) return;
        if (top) {
            std::cerr << "[assembler]   " << position.position_key() << ": "
                      << top->name << " (score " << top->score << ")\n";
        } else {
            std::cerr << "[assembler]   " << position.position_key()
                      << ": no eligible candidates\n";
        }
    }

    void assemble_greedy(std::vector<pool_member> const& pool,
                         std::vector<role_side> const& positions,
                         staff_recommendation& rec) const {
        std::vector<bool> taken(pool.size(), false);

        for (auto const& position : positions) {
            std::vector<candidate_record> eligible;
            std::vector<std::size_t> member_of;
            for (std::size_t i = 0; i < pool.size(); ++i) {
                ++rec.stats.candidates_total;
                if (taken[i] || !mapper_.can_fill(pool[i].coach->current, position)) {
                    ++rec.stats.candidates_pruned;
                    continue;
                }
                ++rec.stats.candidates_evaluated;
                eligible.push_back(make_candidate(pool[i], position));
                member_of.push_back(i);
            }

            if (eligible.empty()) {
                ++rec.stats.positions_skipped;
                log_position(position, nullptr);
                continue;
            }

            std::vector<std::size_t> order(eligible.size());
            for (std::size_t k = 0; k < order.size(); ++k) order[k] = k;
            std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return better(eligible[a], eligible[b]);
            });

            taken[member_of[order.front()]] = true;

            position_recommendation pr;
            pr.position = position;
            auto const n = std::min(params_.top_n, order.size());
            for (std::size_t k = 0; k < n; ++k) pr.candidates.push_back(eligible[order[k]]);
            pr.candidates.front().assigned = true;

            log_position(position, &pr.candidates.front());
            rec.positions.push_back(std::move(pr));
            ++rec.stats.positions_filled;
        }
    }

    void assemble_optimal(std::vector<pool_member> const& pool,
                          std::vector<role_side> const& positions,
                          staff_recommendation& rec) const {
        graph::weight_matrix m(positions.size(), pool.size());
        // (pool index, candidate) per position.
        std::vector<std::vector<std::pair<std::size_t, candidate_record>>> eligible(
            positions.size());

        for (std::size_t p = 0; p < positions.size(); ++p) {
            for (std::size_t i = 0; i < pool.size(); ++i) {
                ++rec.stats.candidates_total;
                if (!mapper_.can_fill(pool[i].coach->current, positions[p])) {
                    ++rec.stats.candidates_pruned;
                    continue;
                }
                ++rec.stats.candidates_evaluated;
                auto c = make_candidate(pool[i], positions[p]);
                m.set(p, i, c.score);
                eligible[p].emplace_back(i, std::move(c));
            }
        }

        auto const result = graph::max_weight_assignment(m);
        if (!result.verified)
            throw std::logic_error("staff_assembler: assignment failed verification");

        std::vector<bool> taken(pool.size(), false);
        for (std::size_t p = 0; p < positions.size(); ++p) {
            if (result.row_assigned(p)) taken[result.row_to_col[p]] = true;
        }

        for (std::size_t p = 0; p < positions.size(); ++p) {
            if (!result.row_assigned(p)) {
                ++rec.stats.positions_skipped;
                log_position(positions[p], nullptr);
                continue;
            }
            auto const chosen = result.row_to_col[p];

            position_recommendation pr;
            pr.position = positions[p];
            std::vector<candidate_record> others;
            for (auto const& [i, c] : eligible[p]) {
                if (i == chosen) {
                    pr.candidates.insert(pr.candidates.begin(), c);
                    pr.candidates.front().assigned = true;
                } else if (!taken[i]) {
                    others.push_back(c);
                }
            }
            std::sort(others.begin(), others.end(), better);
            for (auto& c : others) {
                if (pr.candidates.size() >= params_.top_n) break;
                pr.candidates.push_back(std::move(c));
            }

            log_position(pr.position, &pr.candidates.front());
            rec.positions.push_back(std::move(pr));
            ++rec.stats.positions_filled;
        }
    }

    costaff_graph const& graph_;
    promotion_mapper const& mapper_;
    assembly_params params_;
};

} // namespace staffnet

#endif // STAFFNET_STAFF_STAFF_ASSEMBLER_H
