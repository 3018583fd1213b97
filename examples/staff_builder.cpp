// examples/staff_builder.cpp - Recommend a coaching staff for one head coach
//
// Reads the staff history and the role closeness table, builds the
// co-staff network and prints the recommended staff for the named head
// coach.  The full candidate table is written as CSV.
//
// Usage:
//   staff_builder <staff.csv> <closeness.csv> "<head coach>" [out.csv]
//                 [--optimal] [--verbose] [--degree N] [--top N]
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o staff_builder examples/staff_builder.cpp
//
// Output file defaults to staff_recommendations_<Head_Coach>.csv, the
// name staff_compare expects.

#include <staffnet/staffnet.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace staffnet;

namespace {

void usage(char const* argv0) {
    std::fprintf(stderr,
        "usage: %s <staff.csv> <closeness.csv> <head coach> [out.csv]\n"
        "          [--optimal] [--verbose] [--degree N] [--top N]\n", argv0);
}

std::string default_output(std::string name) {
    std::replace(name.begin(), name.end(), ' ', '_');
    return "staff_recommendations_" + name + ".csv";
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    assembly_params params;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string const arg = argv[i];
            if (arg == "--optimal") {
                params.strategy = assignment_strategy::optimal;
            } else if (arg == "--verbose") {
                params.verbose = true;
            } else if (arg == "--degree" && i + 1 < argc) {
                params.max_degree = io::parse_count(arg, argv[++i]);
            } else if (arg == "--top" && i + 1 < argc) {
                params.top_n = io::parse_count(arg, argv[++i]);
            } else if (arg.rfind("--", 0) == 0) {
                usage(argv[0]);
                return EXIT_FAILURE;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (std::invalid_argument const& e) {
        std::cerr << "[builder] " << e.what() << "\n";
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (positional.size() < 3 || positional.size() > 4) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto const closeness = io::read_closeness_table(positional[1]);
        auto const rows = primary_roles(io::read_staff_rows(positional[0]), closeness);
        auto const graph = build_costaff_graph(rows, closeness);

        auto const stats = describe(graph);
        std::cerr << "[builder] " << rows.size() << " staff rows, "
                  << stats.node_count << " coaches, " << stats.edge_count
                  << " relationships, " << stats.component_count << " components\n";

        promotion_mapper const mapper(closeness);
        staff_assembler const assembler(graph, mapper, params);
        auto const rec = assembler.assemble(positional[2]);

        std::cout << "Recommended staff for " << rec.head_coach_name << "\n";
        std::cout << "=========================================\n";
        for (auto const& p : rec.positions) {
            auto const& top = p.top();
            std::printf("  %-40s %-24s score %6.3f  degree %zu  years %d\n",
                        p.key().c_str(), top.name.c_str(), top.score,
                        top.degree, top.years_together);
        }
        std::printf("\nPositions filled: %zu / %zu (pool %zu, %.0f%%)\n",
                    rec.stats.positions_filled, rec.stats.positions_total,
                    rec.stats.pool_size, 100.0 * rec.stats.fill_rate());

        auto const out_path = positional.size() == 4 ? positional[3]
                                                     : default_output(rec.head_coach_name);
        std::ofstream os(out_path);
        if (!os) {
            std::cerr << "[builder] cannot open '" << out_path << "' for writing\n";
            return EXIT_FAILURE;
        }
        io::write_recommendations(os, rec);
        std::cerr << "[builder] wrote " << rec.rows().size() << " candidate rows to "
                  << out_path << "\n";
    } catch (std::exception const& e) {
        std::cerr << "[builder] error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
