#pragma once

/**
 * @file Phase.hpp
 * @brief Normalized phase helper shared by the periodic generators
 */

#include <cmath>

namespace philbrick {
namespace components {

/// (frequency * t) mod 1, always in [0, 1)
[[nodiscard]] inline double NormalizedPhase(double frequency, double t) {
    double cycles = frequency * t;
    double phase = cycles - std::floor(cycles);
    return phase >= 1.0 ? 0.0 : phase;
}

} // namespace components
} // namespace philbrick
