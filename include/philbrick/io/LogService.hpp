#pragma once

/**
 * @file LogService.hpp
 * @brief Process-wide log service for circuit load, build and run
 *
 * Messages carry the simulation time and the circuit/component they
 * concern. The loader and builder log immediately; philbrick_run buffers
 * the stepping loop and flushes once it ends.
 */

#include <philbrick/io/Console.hpp>

#include <cstddef>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace philbrick {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Which circuit and component a message concerns
 */
struct LogContext {
    std::string circuit;   ///< e.g. "harmonic_oscillator"
    std::string component; ///< Primitive or subcircuit instance, e.g. "SM1.EXP0"

    /// "circuit.component", or whichever part is set
    [[nodiscard]] std::string Path() const {
        if (circuit.empty() || component.empty()) {
            return circuit + component;
        }
        return circuit + "." + component;
    }

    [[nodiscard]] bool Empty() const { return circuit.empty() && component.empty(); }

    /// The calling thread's current context
    static LogContext &Current() {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
        static thread_local LogContext current;
        return current;
    }
};

/**
 * @brief Sets the thread's log context for the enclosing block
 *
 * An empty circuit keeps the enclosing circuit, so template expansion
 * inside a build only swaps the component.
 */
class ScopedLogContext {
  public:
    ScopedLogContext(const std::string &circuit, const std::string &component)
        : saved_(LogContext::Current()) {
        auto &ctx = LogContext::Current();
        if (!circuit.empty()) {
            ctx.circuit = circuit;
        }
        ctx.component = component;
    }

    ~ScopedLogContext() { LogContext::Current() = saved_; }

    ScopedLogContext(const ScopedLogContext &) = delete;
    ScopedLogContext &operator=(const ScopedLogContext &) = delete;

  private:
    LogContext saved_;
};

// =============================================================================
// LogEntry
// =============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    double time = 0.0;
    std::string message;
    LogContext context;

    /// "[1.250] [WRN] [osc.INT1] saturated"
    [[nodiscard]] std::string Format(bool with_context = true) const {
        return Render(Console(false), with_context);
    }

    [[nodiscard]] std::string Render(const Console &console, bool with_context = true) const {
        std::ostringstream oss;
        oss << console.Colorize("[", ansi::kDim) << std::fixed << std::setprecision(3) << time
            << console.Colorize("]", ansi::kDim) << ' ' << console.Tag(level) << ' ';
        if (with_context && !context.Empty()) {
            oss << console.Colorize("[" + context.Path() + "]", ansi::kCyan) << ' ';
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Level filter, sinks, and an optional buffer for the run loop
 */
class LogService {
  public:
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    /**
     * @brief Holds messages back until the scope ends, then flushes them
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service) : service_(service) {
            std::lock_guard<std::mutex> lock(service_.mutex_);
            saved_ = service_.buffering_;
            service_.buffering_ = true;
        }

        ~BufferedScope() {
            service_.Flush();
            std::lock_guard<std::mutex> lock(service_.mutex_);
            service_.buffering_ = saved_;
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;

      private:
        LogService &service_;
        bool saved_ = false;
    };

    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel MinLevel() const { return min_level_; }

    /// Sink that receives entries at or above `min_level`
    void AddSink(Sink sink, LogLevel min_level = LogLevel::Trace) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    /// Log under the calling thread's context
    void Log(LogLevel level, double time, std::string_view message) {
        Log(level, time, message, LogContext::Current());
    }

    void Log(LogLevel level, double time, std::string_view message, const LogContext &context) {
        if (level < min_level_) {
            return;
        }
        LogEntry entry{level, time, std::string(message), context};

        std::lock_guard<std::mutex> lock(mutex_);
        if (level >= LogLevel::Error) {
            ++error_count_;
        }
        if (buffering_) {
            pending_.push_back(std::move(entry));
        } else {
            Deliver({std::move(entry)});
        }
    }

    [[nodiscard]] bool IsBuffering() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffering_;
    }

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    /// Deliver and drop buffered entries
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        Deliver(pending_);
        pending_.clear();
    }

    /// Drop buffered entries undelivered
    void Discard() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
    }

    /// Entries logged at Error or Fatal since the last reset
    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    void ResetErrorCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
    }

  private:
    void Deliver(const std::vector<LogEntry> &entries) const {
        for (const auto &[sink, floor] : sinks_) {
            std::vector<LogEntry> selected;
            for (const auto &e : entries) {
                if (e.level >= floor) {
                    selected.push_back(e);
                }
            }
            if (!selected.empty()) {
                sink(selected);
            }
        }
    }

    std::vector<std::pair<Sink, LogLevel>> sinks_;
    std::vector<LogEntry> pending_;
    LogLevel min_level_ = LogLevel::Info;
    bool buffering_ = false;
    std::size_t error_count_ = 0;
    mutable std::mutex mutex_;
};

inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

// =============================================================================
// Sinks
// =============================================================================

namespace LogSinks {

/// Writes each entry to stderr, coloured when the console is
inline LogService::Sink ConsoleSink(const Console &console) {
    return [console](const std::vector<LogEntry> &entries) {
        for (const auto &e : entries) {
            std::cerr << e.Render(console) << '\n';
        }
    };
}

/// Appends entries to a caller-owned vector
inline LogService::Sink Collect(std::vector<LogEntry> &out) {
    return [&out](const std::vector<LogEntry> &entries) {
        out.insert(out.end(), entries.begin(), entries.end());
    };
}

} // namespace LogSinks

} // namespace philbrick

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define PHILBRICK_LOG_DEBUG(time, msg)                                                             \
    ::philbrick::GetLogService().Log(::philbrick::LogLevel::Debug, (time), (msg))
#define PHILBRICK_LOG_INFO(time, msg)                                                              \
    ::philbrick::GetLogService().Log(::philbrick::LogLevel::Info, (time), (msg))
#define PHILBRICK_LOG_EVENT(time, msg)                                                             \
    ::philbrick::GetLogService().Log(::philbrick::LogLevel::Event, (time), (msg))
#define PHILBRICK_LOG_WARN(time, msg)                                                              \
    ::philbrick::GetLogService().Log(::philbrick::LogLevel::Warning, (time), (msg))
// NOLINTEND(cppcoreguidelines-macro-usage)
