#pragma once

/**
 * @file Console.hpp
 * @brief Terminal output for philbrick_run and the log sinks
 *
 * Diagnostics (log lines, errors) go to stderr so that a CSV piped from
 * stdout stays clean; the run summary table goes to stdout.
 */

#include <array>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace philbrick {

/**
 * @brief Log severity, lowest first
 */
enum class LogLevel {
    Trace,   ///< Per-step detail
    Debug,   ///< Registrations, template expansion
    Info,    ///< Load / build / save results
    Event,   ///< Run start and end
    Warning, ///< Suspicious but accepted input
    Error,   ///< A build or load attempt failed
    Fatal    ///< Programming error
};

/// ANSI escape sequences
namespace ansi {
inline constexpr const char *kReset = "\033[0m";
inline constexpr const char *kBold = "\033[1m";
inline constexpr const char *kDim = "\033[2m";
inline constexpr const char *kRed = "\033[31m";
inline constexpr const char *kGreen = "\033[32m";
inline constexpr const char *kYellow = "\033[33m";
inline constexpr const char *kCyan = "\033[36m";
inline constexpr const char *kGray = "\033[90m";
inline constexpr const char *kOnRed = "\033[41m";
} // namespace ansi

/**
 * @brief Tag and colour a level is printed with
 */
struct LevelStyle {
    const char *tag;
    const char *color;
};

/// Indexed by LogLevel
inline constexpr std::array<LevelStyle, 7> kLevelStyles{{
    {"[TRC]", ansi::kGray},
    {"[DBG]", ansi::kCyan},
    {"[INF]", ansi::kReset},
    {"[EVT]", ansi::kGreen},
    {"[WRN]", ansi::kYellow},
    {"[ERR]", ansi::kRed},
    {"[FTL]", ansi::kOnRed},
}};

[[nodiscard]] inline const LevelStyle &StyleOf(LogLevel level) {
    return kLevelStyles[static_cast<std::size_t>(level)];
}

/**
 * @brief Colour-aware writer for diagnostics and the summary table
 *
 * Colour is on when stderr is a terminal, since that is where tagged
 * output lands.
 */
class Console {
  public:
    Console() : color_(isatty(STDERR_FILENO) != 0) {}
    explicit Console(bool color) : color_(color) {}

    void SetColorEnabled(bool enabled) { color_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_; }

    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        std::string out(text);
        if (color_) {
            out.insert(0, color);
            out += ansi::kReset;
        }
        return out;
    }

    /// "[WRN]", coloured when enabled
    [[nodiscard]] std::string Tag(LogLevel level) const {
        const auto &style = StyleOf(level);
        return Colorize(style.tag, style.color);
    }

    /// Summary line on stdout
    void WriteLine(std::string_view text = "") const { std::cout << text << '\n'; }

    /// Tagged error on stderr
    void Error(std::string_view msg) const {
        std::cerr << Tag(LogLevel::Error) << ' ' << msg << '\n';
    }

    // =========================================================================
    // Table cells
    // =========================================================================

    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        std::string out(text);
        if (out.size() < width) {
            out.append(width - out.size(), ' ');
        }
        return out;
    }

    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        std::string out(text);
        if (out.size() < width) {
            out.insert(0, width - out.size(), ' ');
        }
        return out;
    }

    [[nodiscard]] static std::string FormatNumber(double value, int precision = 4) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    [[nodiscard]] static std::string Rule(std::size_t width, char c = '-') {
        return std::string(width, c);
    }

  private:
    bool color_ = false;
};

} // namespace philbrick
