// io/table_io.h - CSV readers and writers for staff analysis tables
// Part of the staff network library (C++20)
//
// Header-addressed CSV: columns are located by name in the first line,
// so column order is free and extra columns are ignored.  A missing
// required column, a short record or an unparsable field throws
// std::runtime_error naming the reader and the 1-based line number.
//
// Uses <istream>, <ostream> and <fstream>, never <iostream>.
//
// TABLES:
//   staff rows       year,team,coach_id,coach_name,role,side_of_ball
//                    [,role_subcategory][,value]
//   closeness        role_from,side_from,role_to,side_to,closeness
//                    [,hierarchy_rank]
//   recommendations  position_key,coach_id,candidate_name,current_role,
//                    current_side,target_position,target_side,degree,
//                    years_together,coach_value,connection_score
//
// Empty and NA numeric fields read as missing where a column is
// optional-valued (value, coach_value).

#ifndef STAFFNET_IO_TABLE_IO_H
#define STAFFNET_IO_TABLE_IO_H

#include "../core/coach_types.h"
#include "../ranking/candidate_clustering.h"
#include "../ranking/composite_value.h"
#include "../ranking/staff_summary.h"
#include "../staff/staff_assembler.h"
#include "../table/closeness_table.h"
#include "csv_detail.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace staffnet::io {

namespace detail {

/// Column name -> index for one header line.
class header_map {
public:
    header_map(std::string_view reader, std::string const& header_line)
        : reader_(reader) {
        auto fields = split_record(header_line);
        for (std::size_t i = 0; i < fields.size(); ++i) {
            auto name = std::string(trim(fields[i]));
            // Strip a UTF-8 byte order mark on the first column.
            if (i == 0 && name.size() >= 3 && name.compare(0, 3, "\xEF\xBB\xBF") == 0)
                name.erase(0, 3);
            index_.emplace(std::move(name), i);
        }
    }

    /// Throws std::runtime_error if the column is absent.
    [[nodiscard]] std::size_t require(std::string const& name) const {
        auto it = index_.find(name);
        if (it == index_.end())
            throw std::runtime_error(
                std::string(reader_) + ": missing required column '" + name + "'");
        return it->second;
    }

    [[nodiscard]] std::optional<std::size_t> find(std::string const& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::string_view reader_;
    std::map<std::string, std::size_t> index_;
};

inline std::string_view field_at(std::vector<std::string> const& rec, std::size_t i) {
    if (i >= rec.size()) throw std::runtime_error("record has too few fields");
    return trim(rec[i]);
}

inline std::optional<double> optional_double(std::string_view f) {
    if (is_missing(f)) return std::nullopt;
    return field_to_double(f);
}

inline coach_id parse_coach_id(std::string_view f) {
    auto const v = field_to_int(f);
    if (v < 0 || v >= static_cast<long long>(invalid_coach.value))
        throw std::runtime_error("coach_id out of range");
    return coach_id{static_cast<std::uint32_t>(v)};
}

/// Read a CSV stream: resolve(header) once, then fn(record) per data
/// line, rethrowing any record failure with its line number.
template<typename Resolve, typename Fn>
void for_each_record(std::istream& is, std::string_view reader, Resolve resolve, Fn fn) {
    std::string line;
    if (!std::getline(is, line))
        throw std::runtime_error(std::string(reader) + ": empty input (no header)");
    resolve(header_map(reader, line));

    std::size_t line_no = 1;
    while (std::getline(is, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        try {
            fn(split_record(line));
        } catch (std::exception const& e) {
            throw std::runtime_error(std::string(reader) + ": line " +
                                     std::to_string(line_no) + ": " + e.what());
        }
    }
}

/// Restores stream precision on scope exit.
class precision_guard {
public:
    explicit precision_guard(std::ostream& os, std::streamsize p)
        : os_(os), old_(os.precision(p)) {}
    ~precision_guard() { os_.precision(old_); }
    precision_guard(precision_guard const&) = delete;
    precision_guard& operator=(precision_guard const&) = delete;

private:
    std::ostream& os_;
    std::streamsize old_;
};

inline void write_optional(std::ostream& os, std::optional<double> v) {
    if (v) os << *v;
    else os << "NA";
}

inline std::ifstream open_input(std::filesystem::path const& path) {
    std::ifstream is(path);
    if (!is) throw std::runtime_error("cannot open '" + path.string() + "' for reading");
    return is;
}

inline std::ofstream open_output(std::filesystem::path const& path) {
    std::ofstream os(path);
    if (!os) throw std::runtime_error("cannot open '" + path.string() + "' for writing");
    return os;
}

} // namespace detail

/// Non-negative whole-field count, as given to a command-line option.
/// Throws std::invalid_argument naming `what` on anything else.
[[nodiscard]] inline std::size_t parse_count(std::string_view what, std::string_view text) {
    try {
        auto const f = detail::trim(text);
        auto const [v, next] = detail::parse_uint(f, 0);
        if (next != f.size()) throw std::runtime_error("trailing characters");
        return v;
    } catch (std::runtime_error const& e) {
        throw std::invalid_argument(std::string(what) + ": expected a non-negative integer, got '" +
                                    std::string(text) + "' (" + e.what() + ")");
    }
}

// =============================================================================
// Staff rows
// =============================================================================

[[nodiscard]] inline std::vector<staff_row> read_staff_rows(std::istream& is) {
    std::vector<staff_row> rows;
    std::size_t c_year = 0, c_team = 0, c_id = 0, c_name = 0, c_role = 0, c_side = 0;
    std::optional<std::size_t> c_sub, c_value;

    detail::for_each_record(is, "read_staff_rows",
        [&](detail::header_map const& h) {
            c_year = h.require("year");
            c_team = h.require("team");
            c_id = h.require("coach_id");
            c_name = h.require("coach_name");
            c_role = h.require("role");
            c_side = h.require("side_of_ball");
            c_sub = h.find("role_subcategory");
            c_value = h.find("value");
        },
        [&](std::vector<std::string> const& rec) {
            staff_row r;
            r.year = static_cast<int>(detail::field_to_int(detail::field_at(rec, c_year)));
            r.team = std::string(detail::field_at(rec, c_team));
            r.coach = detail::parse_coach_id(detail::field_at(rec, c_id));
            r.coach_name = std::string(detail::field_at(rec, c_name));
            r.role.role = std::string(detail::field_at(rec, c_role));
            r.role.side = std::string(detail::field_at(rec, c_side));
            if (c_sub && *c_sub < rec.size()) r.subcategory = std::string(detail::trim(rec[*c_sub]));
            if (c_value && *c_value < rec.size()) r.value = detail::optional_double(rec[*c_value]);
            rows.push_back(std::move(r));
        });
    return rows;
}

[[nodiscard]] inline std::vector<staff_row>
read_staff_rows(std::filesystem::path const& path) {
    auto is = detail::open_input(path);
    return read_staff_rows(is);
}

// =============================================================================
// Closeness table
// =============================================================================

[[nodiscard]] inline closeness_table read_closeness_table(std::istream& is) {
    closeness_table table;
    std::size_t c_rf = 0, c_sf = 0, c_rt = 0, c_st = 0, c_cl = 0;
    std::optional<std::size_t> c_rank;

    detail::for_each_record(is, "read_closeness_table",
        [&](detail::header_map const& h) {
            c_rf = h.require("role_from");
            c_sf = h.require("side_from");
            c_rt = h.require("role_to");
            c_st = h.require("side_to");
            c_cl = h.require("closeness");
            c_rank = h.find("hierarchy_rank");
        },
        [&](std::vector<std::string> const& rec) {
            closeness_entry e;
            e.from = role_side{std::string(detail::field_at(rec, c_rf)),
                               std::string(detail::field_at(rec, c_sf))};
            e.to = role_side{std::string(detail::field_at(rec, c_rt)),
                             std::string(detail::field_at(rec, c_st))};
            e.closeness = detail::field_to_double(detail::field_at(rec, c_cl));
            e.hierarchy_rank = unknown_hierarchy_rank;
            if (c_rank && *c_rank < rec.size() && !detail::is_missing(rec[*c_rank]))
                e.hierarchy_rank = static_cast<int>(detail::field_to_int(rec[*c_rank]));
            table.add(std::move(e));
        });
    return table;
}

[[nodiscard]] inline closeness_table
read_closeness_table(std::filesystem::path const& path) {
    auto is = detail::open_input(path);
    return read_closeness_table(is);
}

// =============================================================================
// Recommendations
// =============================================================================

namespace detail {

inline constexpr char const* candidate_columns =
    "position_key,coach_id,candidate_name,current_role,current_side,"
    "target_position,target_side,degree,years_together,coach_value,"
    "connection_score\n";

inline void write_candidate(std::ostream& os, candidate_record const& c) {
    write_field(os, c.target.position_key());
    os << ',' << c.id.value << ',';
    write_field(os, c.name);
    os << ',';
    write_field(os, c.current.role);
    os << ',';
    write_field(os, c.current.side);
    os << ',';
    write_field(os, c.target.role);
    os << ',';
    write_field(os, c.target.side);
    os << ',' << c.degree << ',' << c.years_together << ',';
    write_optional(os, c.value);
    os << ',' << c.score << '\n';
}

} // namespace detail

inline void write_recommendations(std::ostream& os, std::vector<candidate_record> const& rows) {
    detail::precision_guard guard(os, 10);
    os << detail::candidate_columns;
    for (auto const& c : rows) detail::write_candidate(os, c);
}

/// Combined table of every staff's rows, led by head_coach and
/// source_file columns.
inline void write_all_candidates(std::ostream& os, std::vector<tagged_candidate> const& rows) {
    detail::precision_guard guard(os, 10);
    os << "head_coach,source_file," << detail::candidate_columns;
    for (auto const& t : rows) {
        detail::write_field(os, t.head_coach);
        os << ',';
        detail::write_field(os, t.source);
        os << ',';
        detail::write_candidate(os, t.candidate);
    }
}

inline void write_recommendations(std::ostream& os, staff_recommendation const& rec) {
    write_recommendations(os, rec.rows());
}

/// The assigned flag is not stored; every row reads as unassigned.
[[nodiscard]] inline std::vector<candidate_record> read_recommendations(std::istream& is) {
    std::vector<candidate_record> rows;
    std::size_t c_id = 0, c_name = 0, c_cr = 0, c_cs = 0, c_tp = 0, c_ts = 0;
    std::size_t c_deg = 0, c_years = 0, c_val = 0, c_score = 0;

    detail::for_each_record(is, "read_recommendations",
        [&](detail::header_map const& h) {
            c_id = h.require("coach_id");
            c_name = h.require("candidate_name");
            c_cr = h.require("current_role");
            c_cs = h.require("current_side");
            c_tp = h.require("target_position");
            c_ts = h.require("target_side");
            c_deg = h.require("degree");
            c_years = h.require("years_together");
            c_val = h.require("coach_value");
            c_score = h.require("connection_score");
        },
        [&](std::vector<std::string> const& rec) {
            candidate_record c;
            c.id = detail::parse_coach_id(detail::field_at(rec, c_id));
            c.name = std::string(detail::field_at(rec, c_name));
            c.current = role_side{std::string(detail::field_at(rec, c_cr)),
                                  std::string(detail::field_at(rec, c_cs))};
            c.target = role_side{std::string(detail::field_at(rec, c_tp)),
                                 std::string(detail::field_at(rec, c_ts))};
            auto const deg = detail::field_to_int(detail::field_at(rec, c_deg));
            if (deg < 0) throw std::runtime_error("negative degree");
            c.degree = static_cast<std::size_t>(deg);
            c.years_together =
                static_cast<int>(detail::field_to_int(detail::field_at(rec, c_years)));
            c.value = detail::optional_double(detail::field_at(rec, c_val));
            c.score = detail::field_to_double(detail::field_at(rec, c_score));
            rows.push_back(std::move(c));
        });
    return rows;
}

[[nodiscard]] inline std::vector<candidate_record>
read_recommendations(std::filesystem::path const& path) {
    auto is = detail::open_input(path);
    return read_recommendations(is);
}

// =============================================================================
// Ranking outputs
// =============================================================================

inline void write_rankings(std::ostream& os, std::vector<staff_ranking> const& rankings) {
    detail::precision_guard guard(os, 10);
    os << "target_hc,filename,total_positions,avg_connection_score,"
          "median_connection_score,avg_coach_value,avg_years_together,"
          "pct_direct_connections,pct_quality_candidates,total_years_experience,"
          "top_3_avg_score,coordinator_avg_score,overall_rank,coordinator_rank,"
          "experience_rank\n";
    for (auto const& r : rankings) {
        auto const& s = r.summary;
        detail::write_field(os, s.head_coach);
        os << ',';
        detail::write_field(os, s.source);
        os << ',' << s.total_positions << ',' << s.avg_score << ',' << s.median_score << ',';
        detail::write_optional(os, s.avg_coach_value);
        os << ',' << s.avg_years_together << ',' << s.pct_direct << ',' << s.pct_quality
           << ',' << s.total_years_experience << ',' << s.top3_avg << ',';
        detail::write_optional(os, s.coordinator_avg);
        os << ',' << r.overall_rank << ',' << r.coordinator_rank << ','
           << r.experience_rank << '\n';
    }
}

inline void write_position_aggregates(std::ostream& os,
                                      std::vector<position_aggregate> const& aggs) {
    detail::precision_guard guard(os, 10);
    os << "target_hc,position_key,avg_connection_score,max_connection_score,"
          "num_candidates,avg_coach_value,avg_years_together,pct_direct_connections,"
          "target_position,target_side\n";
    for (auto const& a : aggs) {
        detail::write_field(os, a.head_coach);
        os << ',';
        detail::write_field(os, a.position_key);
        os << ',' << a.avg_score << ',' << a.max_score << ',' << a.candidate_count << ',';
        detail::write_optional(os, a.avg_coach_value);
        os << ',' << a.avg_years_together << ',' << a.pct_direct << ',';
        detail::write_field(os, a.position.role);
        os << ',';
        detail::write_field(os, a.position.side);
        os << '\n';
    }
}

inline void write_position_matrix(std::ostream& os, position_score_matrix const& m) {
    detail::precision_guard guard(os, 10);
    os << "position_key";
    for (auto const& hc : m.head_coaches) {
        os << ',';
        detail::write_field(os, hc);
    }
    os << '\n';
    for (std::size_t r = 0; r < m.positions.size(); ++r) {
        detail::write_field(os, m.positions[r]);
        for (double v : m.values[r]) os << ',' << v;
        os << '\n';
    }
}

inline void write_clusters(std::ostream& os, std::vector<cluster_assignment> const& clusters) {
    detail::precision_guard guard(os, 10);
    os << "name,composite_value,avg_staff_value,cluster\n";
    for (auto const& c : clusters) {
        detail::write_field(os, c.name);
        os << ',' << c.personal_value << ',' << c.staff_value << ',' << c.cluster << '\n';
    }
}

inline void write_candidates(std::ostream& os, std::vector<composite_value> const& values) {
    detail::precision_guard guard(os, 10);
    os << "coach_id,name,record_count,last_team,last_year,last_role,last_subcategory,"
          "side_of_ball,personal_average,personal_best,network_average,"
          "network_pct_rank,composite_value\n";
    for (auto const& v : values) {
        os << v.id.value << ',';
        detail::write_field(os, v.name);
        os << ',' << v.record_count << ',';
        detail::write_field(os, v.last_team);
        os << ',' << v.last_year << ',';
        detail::write_field(os, v.last_role.role);
        os << ',';
        detail::write_field(os, v.last_subcategory);
        os << ',';
        detail::write_field(os, v.last_role.side);
        os << ',';
        detail::write_optional(os, v.personal_mean);
        os << ',';
        detail::write_optional(os, v.personal_best);
        os << ',';
        detail::write_optional(os, v.network_mean);
        os << ',' << v.network_pct_rank << ',';
        detail::write_optional(os, v.composite);
        os << '\n';
    }
}

} // namespace staffnet::io

#endif // STAFFNET_IO_TABLE_IO_H
