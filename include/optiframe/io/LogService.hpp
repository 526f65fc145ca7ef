#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Optiframe
 *
 * Provides both immediate and buffered logging modes. Entries carry the
 * thread-local step/task context and the time since the service started.
 */

#include <optiframe/io/Console.hpp>
#include <optiframe/io/LogEntry.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace optiframe {

/**
 * @brief Unified logging service
 *
 * ALL library logging goes through this service. It operates in two modes:
 *
 * 1. **Immediate mode** (default):
 *    Entries are passed to the sinks as soon as they are logged.
 *
 * 2. **Buffered mode** (BufferedScope):
 *    Entries are collected and flushed when the scope ends. Useful when many
 *    tasks log from worker threads and the output should be sorted by time.
 *
 * Internally synchronized: tasks may log from any thread.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() : start_(std::chrono::steady_clock::now()) {}

    // === Mode Control ===

    void SetImmediateMode(bool immediate) {
        std::lock_guard<std::mutex> lock(mutex_);
        immediate_mode_ = immediate;
    }

    [[nodiscard]] bool IsImmediateMode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return immediate_mode_;
    }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, restores previous mode
     * and flushes on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service, bool sort_by_time = true)
            : service_(service), previous_mode_(service.IsImmediateMode()),
              sort_by_time_(sort_by_time) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear(sort_by_time_);
            service_.SetImmediateMode(previous_mode_);
        }

        // Non-copyable, non-movable
        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
        bool sort_by_time_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    [[nodiscard]] LogLevel GetMinLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    /// Add an output sink
    void AddSink(Sink sink) { AddSink(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    [[nodiscard]] std::size_t SinkCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }

    /// Seconds since the service was created (or the clock was reset)
    [[nodiscard]] double Elapsed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ElapsedLocked();
    }

    void ResetClock() {
        std::lock_guard<std::mutex> lock(mutex_);
        start_ = std::chrono::steady_clock::now();
    }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, std::string_view message) {
        Log(level, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, std::string_view message, const LogContext &ctx) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        entries_.push_back(LogEntry::Create(level, ElapsedLocked(), message, ctx));

        if (immediate_mode_) {
            FlushEntry(entries_.back());
            flushed_ = entries_.size();
        }
    }

    // Convenience methods (use thread-local context)
    void Trace(std::string_view msg) { Log(LogLevel::Trace, msg); }
    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }
    void Fatal(std::string_view msg) { Log(LogLevel::Fatal, msg); }

    // === Flush Control ===

    /// Flush buffer to all sinks
    void Flush(bool sort_by_time = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        FlushLocked(sort_by_time);
    }

    /// Flush and clear buffer
    void FlushAndClear(bool sort_by_time = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        FlushLocked(sort_by_time);
        entries_.clear();
        flushed_ = 0;
    }

    /// Clear buffer without flushing (discard pending logs)
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        flushed_ = 0;
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] bool HasErrors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_ > 0;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    /// Reset error counts (call at start of new run)
    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

    // === Filtering (for query, not output) ===

    [[nodiscard]] std::vector<LogEntry> GetEntriesAtLevel(LogLevel level) const {
        return Select([level](const LogEntry &e) { return e.level == level; });
    }

    [[nodiscard]] std::vector<LogEntry> GetEntriesForStep(std::string_view step) const {
        return Select([step](const LogEntry &e) { return e.context.step == step; });
    }

    /// Entries logged under "step.task"
    [[nodiscard]] std::vector<LogEntry> GetEntriesForTask(std::string_view path) const {
        return Select([path](const LogEntry &e) { return e.context.FullPath() == path; });
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;
    std::chrono::steady_clock::time_point start_;

    std::size_t flushed_ = 0; ///< Entries [0, flushed_) already reached the sinks
    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    /// Caller holds mutex_
    [[nodiscard]] double ElapsedLocked() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        return elapsed.count();
    }

    void FlushLocked(bool sort_by_time) {
        if (flushed_ >= entries_.size()) {
            return;
        }

        auto first = entries_.begin() + static_cast<std::ptrdiff_t>(flushed_);
        if (sort_by_time) {
            std::stable_sort(first, entries_.end(), [](const LogEntry &a, const LogEntry &b) {
                return a.wall_time < b.wall_time;
            });
        }

        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size() - flushed_);
            for (auto it = first; it != entries_.end(); ++it) {
                if (it->level >= min_level) {
                    filtered.push_back(*it);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
        flushed_ = entries_.size();
    }

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }

    template <typename Pred> std::vector<LogEntry> Select(Pred pred) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (pred(entry)) {
                result.push_back(entry);
            }
        }
        return result;
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace optiframe

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define OPTIFRAME_LOG_TRACE(msg) ::optiframe::GetLogService().Trace(msg)

#define OPTIFRAME_LOG_DEBUG(msg) ::optiframe::GetLogService().Debug(msg)

#define OPTIFRAME_LOG_INFO(msg) ::optiframe::GetLogService().Info(msg)

#define OPTIFRAME_LOG_EVENT(msg) ::optiframe::GetLogService().Event(msg)

#define OPTIFRAME_LOG_WARN(msg) ::optiframe::GetLogService().Warning(msg)

#define OPTIFRAME_LOG_ERROR(msg) ::optiframe::GetLogService().Error(msg)

#define OPTIFRAME_LOG_FATAL(msg) ::optiframe::GetLogService().Fatal(msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
