// examples/staff_compare.cpp - Compare recommended staffs across head coaches
//
// Loads every staff_recommendations_<Name>.csv in a directory (as written
// by staff_builder), ranks the staffs and writes the comparison tables.
// Given the staff history and closeness table as well, it also scores
// head-coach candidates and clusters them by personal value against
// expected staff value.
//
// Usage:
//   staff_compare <recommendations dir> [out dir]
//                 [--staff staff.csv --closeness closeness.csv]
//                 [--elbow] [--clusters K] [--verbose]
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o staff_compare examples/staff_compare.cpp
//
// Outputs (in out dir, default "."):
//   staff_rankings.csv, position_aggregates.csv, position_matrix.csv,
//   all_candidates.csv
//   head_coach_candidates.csv, candidate_clusters.csv   (with --staff)

#include <staffnet/staffnet.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace staffnet;

namespace fs = std::filesystem;

namespace {

void usage(char const* argv0) {
    std::fprintf(stderr,
        "usage: %s <recommendations dir> [out dir]\n"
        "          [--staff staff.csv --closeness closeness.csv]\n"
        "          [--elbow] [--clusters K] [--verbose]\n", argv0);
}

/// Run writer(os) on a fresh file in dir; throws if it cannot be opened.
template<typename Writer>
void write_table(fs::path const& dir, char const* file, Writer writer) {
    auto const path = dir / file;
    std::ofstream os(path);
    if (!os) throw std::runtime_error("cannot open '" + path.string() + "' for writing");
    writer(os);
    std::cerr << "[compare] wrote " << path.string() << "\n";
}

void print_rankings(std::vector<staff_ranking> const& ranked, aggregate_overview const& o) {
    std::cout << "Staff rankings (" << o.head_coach_count << " head coaches, "
              << o.position_count << " positions, " << o.candidate_count
              << " candidates)\n";
    std::cout << "=========================================\n";
    for (auto const& r : ranked) {
        auto const& s = r.summary;
        std::printf("  %2zu. %-24s avg %6.3f  top-3 %6.3f  direct %5.1f%%  coord #%zu\n",
                    r.overall_rank, s.head_coach.c_str(), s.avg_score, s.top3_avg,
                    s.pct_direct, r.coordinator_rank);
    }
    if (!ranked.empty()) {
        std::printf("\nBest: %s (%.3f)   mean %.3f   worst %.3f\n",
                    o.best_head_coach.c_str(), o.best_staff_score,
                    o.avg_staff_score, o.worst_staff_score);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::string staff_path, closeness_path;
    clustering_params cparams;
    bool verbose = false;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string const arg = argv[i];
            if (arg == "--staff" && i + 1 < argc) {
                staff_path = argv[++i];
            } else if (arg == "--closeness" && i + 1 < argc) {
                closeness_path = argv[++i];
            } else if (arg == "--elbow") {
                cparams.choose_k_by_elbow = true;
            } else if (arg == "--clusters" && i + 1 < argc) {
                cparams.k = io::parse_count(arg, argv[++i]);
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg.rfind("--", 0) == 0) {
                usage(argv[0]);
                return EXIT_FAILURE;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (std::invalid_argument const& e) {
        std::cerr << "[compare] " << e.what() << "\n";
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (positional.empty() || positional.size() > 2 ||
        staff_path.empty() != closeness_path.empty()) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    fs::path const out_dir = positional.size() == 2 ? positional[1] : ".";

    try {
        staff_aggregator agg({}, verbose);
        auto const report = agg.ingest_directory(positional[0]);
        std::cerr << "[compare] loaded " << report.files_loaded << " of "
                  << report.files_seen << " files\n";
        if (agg.empty()) {
            std::cerr << "[compare] no recommendation file could be loaded\n";
            return EXIT_FAILURE;
        }

        fs::create_directories(out_dir);
        auto const ranked = agg.rankings();
        print_rankings(ranked, agg.overview());

        write_table(out_dir, "staff_rankings.csv",
                    [&](std::ostream& os) { io::write_rankings(os, ranked); });
        write_table(out_dir, "position_aggregates.csv",
                    [&](std::ostream& os) { io::write_position_aggregates(os, agg.position_aggregates()); });
        write_table(out_dir, "position_matrix.csv",
                    [&](std::ostream& os) { io::write_position_matrix(os, agg.position_matrix()); });
        write_table(out_dir, "all_candidates.csv",
                    [&](std::ostream& os) { io::write_all_candidates(os, agg.all_candidates()); });

        if (!staff_path.empty()) {
            auto const closeness = io::read_closeness_table(closeness_path);
            auto const rows = primary_roles(io::read_staff_rows(staff_path), closeness);
            auto const candidates = filter_candidates(composite_values(rows, closeness));
            std::cerr << "[compare] " << candidates.size() << " head-coach candidates\n";

            auto const clusters = cluster_candidates(candidate_points(candidates, ranked), cparams);
            if (clusters.assignments.empty()) {
                std::cerr << "[compare] no candidate has both a composite and a staff value\n";
            } else {
                std::cout << "\nCandidate clusters (k = " << clusters.model.k << ")\n";
                for (std::size_t c = 0; c < clusters.model.k; ++c) {
                    std::printf("  cluster %zu: %zu candidates, centre (%.3f, %.3f)\n", c,
                                clusters.model.sizes[c], clusters.model.centroids[c].x,
                                clusters.model.centroids[c].y);
                }
            }

            write_table(out_dir, "head_coach_candidates.csv",
                        [&](std::ostream& os) { io::write_candidates(os, candidates); });
            write_table(out_dir, "candidate_clusters.csv",
                        [&](std::ostream& os) { io::write_clusters(os, clusters.assignments); });
        }

        return report.ok() ? EXIT_SUCCESS : 2;
    } catch (std::exception const& e) {
        std::cerr << "[compare] error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
