#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Routes caught Philbrick errors into the LogService
 *
 * The loader and builder catch at their entry points, log here, and
 * rethrow, so front-ends see the failure in the log as well as the
 * exception.
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/io/LogService.hpp>

#include <string>

namespace philbrick {

inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error under the current circuit context
 *
 * @param component Overrides the context's component (e.g. the file being loaded)
 */
inline void LogError(const Error &error, double time = 0.0, const std::string &component = "") {
    LogContext ctx = LogContext::Current();
    if (!component.empty()) {
        ctx.component = component;
    }
    GetLogService().Log(SeverityToLogLevel(error.severity()), time, error.what(), ctx);
}

} // namespace philbrick
