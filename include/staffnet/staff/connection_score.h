// staff/connection_score.h - Candidate connection strength
// Part of the staff network library (C++20)
//
// score = performance_weight(value)
//       x tenure_multiplier(years_together)
//       x degree_multiplier(degree)
//
// Direct connections dominate: a friend-of-a-friend scores half of an
// otherwise identical direct colleague, anything further a tenth.
// Shared tenure is stepped, capped at four seasons.  A coach without a
// recorded value gets a floor weight rather than zero.
//
// Every function is constexpr and noexcept; the score is a pure
// function of its three inputs.

#ifndef STAFFNET_STAFF_CONNECTION_SCORE_H
#define STAFFNET_STAFF_CONNECTION_SCORE_H

#include "../core/defaults.h"

#include <cstddef>
#include <optional>

namespace staffnet {

/// Performance value, or the missing-value floor.
[[nodiscard]] constexpr double
performance_weight(std::optional<double> value,
                   double floor = defaults::missing_value_floor) noexcept {
    return value ? *value : floor;
}

/// <= 1 season: 1.0, 2: 1.5, 3: 2.0, >= 4: 2.5.
[[nodiscard]] constexpr double tenure_multiplier(int years_together) noexcept {
    if (years_together >= 4) return 2.5;
    if (years_together == 3) return 2.0;
    if (years_together == 2) return 1.5;
    return 1.0;
}

/// 1: 1.0, 2: 0.5, otherwise 0.1.
[[nodiscard]] constexpr double degree_multiplier(std::size_t degree) noexcept {
    if (degree == 1) return 1.0;
    if (degree == 2) return 0.5;
    return 0.1;
}

[[nodiscard]] constexpr double
connection_score(std::optional<double> value, int years_together, std::size_t degree,
                 double floor = defaults::missing_value_floor) noexcept {
    return performance_weight(value, floor)
         * tenure_multiplier(years_together)
         * degree_multiplier(degree);
}

static_assert(tenure_multiplier(3) == 2.0);
static_assert(degree_multiplier(2) == 0.5);
static_assert(performance_weight(std::nullopt) == 0.3);

} // namespace staffnet

#endif // STAFFNET_STAFF_CONNECTION_SCORE_H
