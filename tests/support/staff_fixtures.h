// tests/support/staff_fixtures.h
// Small hand-built coaching datasets shared by the unit tests.
//
// Ladder (closeness to Head Coach, hierarchy rank):
//
//   Head Coach                 Both           1.0  10
//   Offensive Coordinator      Offense        0.8   8
//   Defensive Coordinator      Defense        0.8   8
//   Special Teams Coordinator  Special Teams  0.6   6
//   Position Coach             Offense        0.4   4
//   Position Coach             Defense        0.4   4
//   Assistant Coach            Both           0.2   2   (not a ladder rung)

#ifndef STAFFNET_TESTS_SUPPORT_STAFF_FIXTURES_H
#define STAFFNET_TESTS_SUPPORT_STAFF_FIXTURES_H

#include "staffnet/core/coach_types.h"
#include "staffnet/graph/costaff_graph.h"
#include "staffnet/table/closeness_table.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace staffnet::fixtures {

inline role_side hc() { return {"Head Coach", "Both"}; }
inline role_side oc() { return {"Offensive Coordinator", "Offense"}; }
inline role_side dc() { return {"Defensive Coordinator", "Defense"}; }
inline role_side stc() { return {"Special Teams Coordinator", "Special Teams"}; }
inline role_side pc_off() { return {"Position Coach", "Offense"}; }
inline role_side pc_def() { return {"Position Coach", "Defense"}; }
inline role_side assistant() { return {"Assistant Coach", "Both"}; }

inline closeness_table make_ladder_table() {
    closeness_table t;
    t.add({hc(), hc(), 1.0, 10});
    t.add({oc(), hc(), 0.8, 8});
    t.add({dc(), hc(), 0.8, 8});
    t.add({stc(), hc(), 0.6, 6});
    t.add({pc_off(), hc(), 0.4, 4});
    t.add({pc_def(), hc(), 0.4, 4});
    t.add({assistant(), hc(), 0.2, 2});
    // Non-ladder entries: position-to-coordinator closeness.
    t.add({pc_off(), oc(), 0.7, 4});
    t.add({pc_def(), dc(), 0.7, 4});
    return t;
}

inline coach_record coach(std::uint32_t id, std::string name, role_side role,
                          std::optional<double> value = std::nullopt,
                          int last_year = 2024) {
    return coach_record{coach_id{id}, std::move(name), std::move(role), last_year, value};
}

inline relationship_edge edge(std::uint32_t a, std::uint32_t b, int years) {
    relationship_edge e;
    e.coach_1 = coach_id{a};
    e.coach_2 = coach_id{b};
    e.years_together = years;
    return e;
}

inline staff_row row(int year, std::string team, std::uint32_t id, std::string name,
                     role_side role, std::optional<double> value = std::nullopt) {
    staff_row r;
    r.year = year;
    r.team = std::move(team);
    r.coach = coach_id{id};
    r.coach_name = std::move(name);
    r.role = std::move(role);
    r.value = value;
    return r;
}

} // namespace staffnet::fixtures

#endif // STAFFNET_TESTS_SUPPORT_STAFF_FIXTURES_H
