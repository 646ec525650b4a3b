#pragma once

/**
 * @file Config.hpp
 * @brief Build configuration and debug macros for Philbrick
 *
 * - PHILBRICK_DEBUG: Defined in Debug builds via CMake
 * - PHILBRICK_ASSERT: Runtime assertions (throws in debug, no-op in release)
 */

#include <stdexcept>
#include <string>

namespace philbrick {

/// Check if we're in debug mode at compile time
#ifdef PHILBRICK_DEBUG
constexpr bool kDebugMode = true;
#else
constexpr bool kDebugMode = false;
#endif

} // namespace philbrick

#ifdef PHILBRICK_DEBUG

/**
 * @brief Assert a condition in debug builds, throw if false
 *
 * In release builds, this macro compiles to nothing.
 */
#define PHILBRICK_ASSERT(cond, msg)                                                                \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::logic_error(std::string("PHILBRICK_ASSERT failed: ") + (msg));              \
        }                                                                                          \
    } while (0)

#else // Release builds

#define PHILBRICK_ASSERT(cond, msg) ((void)0)

#endif // PHILBRICK_DEBUG
