// ranking/staff_aggregator.h - Compare recommended staffs across head coaches
// Part of the staff network library (C++20)
//
// Collects one set of recommendation rows per head coach, from memory
// or from per-coach CSV files, and derives rankings, per-position
// aggregates and a position x head-coach score matrix.
//
// Directory ingestion isolates failures: a file that cannot be read or
// parsed is recorded in the ingest_report and reported on std::cerr,
// and the batch continues with the next file.

#ifndef STAFFNET_RANKING_STAFF_AGGREGATOR_H
#define STAFFNET_RANKING_STAFF_AGGREGATOR_H

#include "../io/table_io.h"
#include "../staff/staff_assembler.h"
#include "staff_summary.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace staffnet {

// =============================================================================
// File naming
// =============================================================================

/// Head coach name from a recommendation file name:
/// "staff_recommendations_Sean_McVay.csv" -> "Sean McVay".
[[nodiscard]] inline std::string head_coach_from_filename(std::filesystem::path const& path) {
    auto name = path.filename().string();
    if (name.size() >= 4 && name.compare(name.size() - 4, 4, ".csv") == 0)
        name.erase(name.size() - 4);

    for (std::string_view affix : {"staff_recommendations_", "_staff_recommendations",
                                   "staff_recs_", "_staff_recs"}) {
        auto pos = name.find(affix);
        if (pos != std::string::npos) name.erase(pos, affix.size());
    }
    std::replace(name.begin(), name.end(), '_', ' ');

    auto const b = name.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    auto const e = name.find_last_not_of(" \t");
    return name.substr(b, e - b + 1);
}

// =============================================================================
// Reports
// =============================================================================

struct ingest_failure {
    std::string path;
    std::string message;
};

struct ingest_report {
    std::size_t files_seen = 0;
    std::size_t files_loaded = 0;
    std::vector<ingest_failure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

struct aggregate_overview {
    std::size_t head_coach_count = 0;
    std::size_t position_count = 0;
    std::size_t candidate_count = 0;
    double avg_staff_score = 0.0;
    double best_staff_score = 0.0;
    std::string best_head_coach;
    double worst_staff_score = 0.0;
};

// =============================================================================
// Aggregator
// =============================================================================

class staff_aggregator {
public:
    explicit staff_aggregator(ranking_params params = {}, bool verbose = false)
        : params_(std::move(params)), verbose_(verbose) {}

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Add one head coach's rows.  Throws std::invalid_argument if the
    /// head coach was already added.
    void add(std::string head_coach, std::vector<candidate_record> rows,
             std::string source = {}) {
        if (names_.count(head_coach) != 0)
            throw std::invalid_argument(
                "staff_aggregator: head coach '" + head_coach + "' already added");
        names_.insert(head_coach);
        entries_.push_back(entry{std::move(head_coach), std::move(source), std::move(rows)});
    }

    void add(staff_recommendation const& rec) {
        add(rec.head_coach_name, rec.rows());
    }

    /// Read one recommendation CSV; the head coach is named after the
    /// file.  Throws std::runtime_error on unreadable or malformed input.
    void ingest_file(std::filesystem::path const& path) {
        auto rows = io::read_recommendations(path);
        auto hc = head_coach_from_filename(path);
        if (hc.empty())
            throw std::runtime_error("cannot derive head coach name from '" +
                                     path.filename().string() + "'");
        auto const n = rows.size();
        add(hc, std::move(rows), path.filename().string());
        if (verbose_)
            std::cerr << "[aggregate] loaded " << hc << " (" << n << " candidates)\n";
    }

    /// Ingest every *.csv file in dir, in file-name order.
    ///
    /// Throws std::runtime_error if dir is not a directory or holds no
    /// CSV file.  Per-file errors are collected, not thrown.
    ingest_report ingest_directory(std::filesystem::path const& dir) {
        if (!std::filesystem::is_directory(dir))
            throw std::runtime_error(
                "staff_aggregator: '" + dir.string() + "' is not a directory");

        std::vector<std::filesystem::path> files;
        for (auto const& de : std::filesystem::directory_iterator(dir)) {
            if (de.is_regular_file() && de.path().extension() == ".csv")
                files.push_back(de.path());
        }
        std::sort(files.begin(), files.end());
        if (files.empty())
            throw std::runtime_error(
                "staff_aggregator: no CSV files found in '" + dir.string() + "'");

        if (verbose_)
            std::cerr << "[aggregate] found " << files.size() << " CSV files\n";

        ingest_report report;
        for (auto const& f : files) {
            ++report.files_seen;
            try {
                ingest_file(f);
                ++report.files_loaded;
            } catch (std::exception const& e) {
                report.failures.push_back(ingest_failure{f.string(), e.what()});
                std::cerr << "[aggregate] failed " << f.filename().string()
                          << ": " << e.what() << '\n';
            }
        }
        return report;
    }

    // =========================================================================
    // Results
    // =========================================================================

    [[nodiscard]] std::vector<staff_summary> summaries() const {
        std::vector<staff_summary> out;
        out.reserve(entries_.size());
        for (auto const& e : entries_) {
            auto s = summarize_staff(e.head_coach, e.rows, params_);
            s.source = e.source;
            out.push_back(std::move(s));
        }
        return out;
    }

    /// Every row of every staff, in insertion order.
    [[nodiscard]] std::vector<tagged_candidate> all_candidates() const {
        std::vector<tagged_candidate> out;
        for (auto const& e : entries_) {
            for (auto const& r : e.rows) out.push_back(tagged_candidate{e.head_coach, e.source, r});
        }
        return out;
    }

    [[nodiscard]] std::vector<staff_ranking> rankings() const {
        return rank_staffs(summaries());
    }

    /// One aggregate per (head coach, target role/side), sorted by both.
    [[nodiscard]] std::vector<position_aggregate> position_aggregates() const {
        std::map<std::pair<std::string, role_side>, std::vector<candidate_record const*>> groups;
        for (auto const& e : entries_) {
            for (auto const& r : e.rows)
                groups[{e.head_coach, r.target}].push_back(&r);
        }

        std::vector<position_aggregate> out;
        out.reserve(groups.size());
        for (auto const& [key, rows] : groups) {
            position_aggregate a;
            a.head_coach = key.first;
            a.position = key.second;
            a.position_key = a.position.position_key();
            a.candidate_count = rows.size();

            double score_sum = 0.0, years_sum = 0.0, value_sum = 0.0;
            std::size_t value_n = 0, direct = 0;
            a.max_score = rows.front()->score;
            for (auto const* r : rows) {
                score_sum += r->score;
                a.max_score = std::max(a.max_score, r->score);
                years_sum += static_cast<double>(r->years_together);
                if (r->value) {
                    value_sum += *r->value;
                    ++value_n;
                }
                if (r->degree == 1) ++direct;
            }
            auto const n = static_cast<double>(rows.size());
            a.avg_score = score_sum / n;
            a.avg_years_together = years_sum / n;
            if (value_n > 0) a.avg_coach_value = value_sum / static_cast<double>(value_n);
            a.pct_direct = detail::percent(direct, rows.size());
            out.push_back(std::move(a));
        }
        return out;
    }

    /// Best score per position (rows, sorted) and head coach (columns,
    /// sorted); 0 where a head coach has no candidate for a position.
    [[nodiscard]] position_score_matrix position_matrix() const {
        position_score_matrix m;
        std::set<std::string> positions;
        std::set<std::string> coaches;
        for (auto const& e : entries_) {
            coaches.insert(e.head_coach);
            for (auto const& r : e.rows) positions.insert(r.target.position_key());
        }
        m.positions.assign(positions.begin(), positions.end());
        m.head_coaches.assign(coaches.begin(), coaches.end());
        m.values.assign(m.positions.size(), std::vector<double>(m.head_coaches.size(), 0.0));

        for (auto const& a : position_aggregates()) {
            auto r = std::lower_bound(m.positions.begin(), m.positions.end(), a.position_key);
            auto c = std::lower_bound(m.head_coaches.begin(), m.head_coaches.end(), a.head_coach);
            m.values[static_cast<std::size_t>(r - m.positions.begin())]
                    [static_cast<std::size_t>(c - m.head_coaches.begin())] = a.max_score;
        }
        return m;
    }

    [[nodiscard]] aggregate_overview overview() const {
        aggregate_overview o;
        o.head_coach_count = entries_.size();

        std::set<std::string> positions;
        for (auto const& e : entries_) {
            o.candidate_count += e.rows.size();
            for (auto const& r : e.rows) positions.insert(r.target.position_key());
        }
        o.position_count = positions.size();

        auto const ranked = rankings();
        if (ranked.empty()) return o;

        double sum = 0.0;
        o.worst_staff_score = ranked.front().summary.avg_score;
        for (auto const& r : ranked) {
            sum += r.summary.avg_score;
            o.worst_staff_score = std::min(o.worst_staff_score, r.summary.avg_score);
        }
        o.avg_staff_score = sum / static_cast<double>(ranked.size());
        o.best_staff_score = ranked.front().summary.avg_score;
        o.best_head_coach = ranked.front().summary.head_coach;
        return o;
    }

private:
    struct entry {
        std::string head_coach;
        std::string source;
        std::vector<candidate_record> rows;
    };

    ranking_params params_;
    bool verbose_;
    std::vector<entry> entries_;
    std::set<std::string> names_;
};

} // namespace staffnet

#endif // STAFFNET_RANKING_STAFF_AGGREGATOR_H
