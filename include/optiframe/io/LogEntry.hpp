#pragma once

/**
 * @file LogEntry.hpp
 * @brief Log context and entry structures
 *
 * Captures full context for each log message: step, task, timestamp, level.
 */

#include <optiframe/core/CoreTypes.hpp>
#include <optiframe/io/Console.hpp>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace optiframe {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Log context set by the Step while a task runs
 *
 * The LogContext is thread-local, so a task logging from inside Execute() is
 * attributed to its step and task without passing anything explicitly.
 */
struct LogContext {
    std::string step; ///< Step name (e.g., "pre_processing")
    std::string task; ///< Task name (e.g., "BuildIndex")

    /// Full path: "step.task", or just "task" if no step
    [[nodiscard]] std::string FullPath() const {
        if (task.empty()) {
            return step;
        }
        return MakeFullPath(step, task);
    }

    [[nodiscard]] bool IsSet() const { return !step.empty() || !task.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 */
struct LogEntry {
    LogLevel level = LogLevel::Info;
    double timestamp = 0.0; ///< Seconds since the LogService started
    std::string message;
    LogContext context;

    /// Wall clock time for ordering logs from concurrent tasks
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double timestamp, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.timestamp = timestamp;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[t] [LVL] [step.task] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(3) << timestamp << "] ";
        oss << Console::LevelTag(level) << " ";
        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }
        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[", AnsiColor::Dim);
        oss << std::fixed << std::setprecision(3) << timestamp;
        oss << console.Colorize("]", AnsiColor::Dim) << " ";
        oss << console.Colorize(Console::LevelTag(level), Console::LevelColor(level)) << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 *
 * The Step sets this around each task, including tasks run on worker threads
 * in parallel mode.
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }

    static void ClearContext() { current_context_ = LogContext{}; }

    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &step, const std::string &task)
            : previous_(current_context_) {
            current_context_.step = step;
            current_context_.task = task;
        }

        ~ScopedContext() { current_context_ = previous_; }

        // Non-copyable, non-movable
        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

} // namespace optiframe
