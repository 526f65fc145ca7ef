#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Include this header to get automatic logging when throwing errors.
 * This file bridges Error.hpp and LogService.hpp.
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/io/LogService.hpp>

#include <string>
#include <utility>

namespace optiframe {

/**
 * @brief Convert error severity to log level
 */
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
 * @brief Log an error to the global LogService
 *
 * @param error Error to log
 * @param step Step context (empty: use the current thread-local context)
 * @param task Task context
 */
inline void LogError(const Error &error, const std::string &step = "",
                     const std::string &task = "") {
    ErrorReport report = error.toReport(MakeFullPath(step, task));
    LogLevel level = SeverityToLogLevel(report.severity);

    if (!step.empty() || !task.empty()) {
        LogContext ctx;
        ctx.step = step;
        ctx.task = task;
        GetLogService().Log(level, report.message, ctx);
    } else {
        GetLogService().Log(level, report.message);
    }
}

/**
 * @brief Throw an error after logging it
 *
 * Usage:
 * @code
 * ThrowAndLog(ScheduleError(step_name, stuck), step_name);
 * @endcode
 */
template <typename E>
[[noreturn]] void ThrowAndLog(E &&error, const std::string &step = "",
                              const std::string &task = "") {
    LogError(error, step, task);
    throw std::forward<E>(error);
}

} // namespace optiframe

// =============================================================================
// Logging-Enabled Throw Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error after logging it to global LogService
 * @param error The error to throw
 */
#define OPTIFRAME_THROW_LOG(error) ::optiframe::ThrowAndLog((error))

/**
 * @brief Throw an error with step/task context, logging before throw
 */
#define OPTIFRAME_THROW_LOG_CTX(error, step, task) ::optiframe::ThrowAndLog((error), (step), (task))

// NOLINTEND(cppcoreguidelines-macro-usage)
