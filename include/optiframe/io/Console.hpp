#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Provides terminal-aware output with ANSI escape codes, log levels and
 * padding helpers used by the step/workflow summaries.
 */

#include <optiframe/core/Error.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace optiframe {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Most verbose, internal debugging
    Debug,   ///< Per-task and per-pass scheduling detail
    Info,    ///< Normal operation (step start/finish)
    Event,   ///< Workflow events (pipeline phase changes, etc.)
    Warning, ///< Potential issues (duplicate producers)
    Error,   ///< Scheduling stalls and failed tasks
    Fatal    ///< Unrecoverable errors
};

[[nodiscard]] inline std::string to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Event:
        return "event";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::Fatal:
        return "fatal";
    }
    return "unknown";
}

/**
 * @brief Parse a log level name (case-insensitive, "warn" accepted)
 * @throws ConfigError if the name is not recognized
 */
[[nodiscard]] inline LogLevel parse_log_level(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "event")
        return LogLevel::Event;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    throw ConfigError("unknown log level '" + name + "'");
}

// =============================================================================
// AnsiColor
// =============================================================================

/**
 * @brief ANSI color codes
 */
struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    // Foreground colors
    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    // Background colors
    static constexpr const char *BgRed = "\033[41m";
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 *
 * Detects if stdout is a terminal and enables/disables ANSI colors accordingly.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    /// Enable/disable color output (auto-detected by default)
    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Minimum level for direct Console::Log output
    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    void Info(std::string_view msg) const { Log(LogLevel::Info, msg); }
    void Warning(std::string_view msg) const { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) const { Log(LogLevel::Error, msg); }

    /// Log with explicit level, bypassing the LogService (examples, CLI output)
    void Log(LogLevel level, std::string_view msg) const {
        if (level < min_level_) {
            return;
        }
        std::cout << Colorize(LevelTag(level), LevelColor(level)) << " " << msg << "\n";
    }

    // === Formatting Helpers ===

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    /// Create horizontal rule
    [[nodiscard]] static std::string HorizontalRule(int width = 80, char c = '-') {
        return std::string(static_cast<std::size_t>(width), c);
    }

    /// Pad string to width (text left, padding right)
    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    /// Pad string to width (padding left, text right)
    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(width - text.size(), ' ') + std::string(text);
    }

    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }

    void Flush() const { std::cout.flush(); }

    /// Three-letter tag used in formatted log lines ("[INF]")
    [[nodiscard]] static const char *LevelTag(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "[TRC]";
        case LogLevel::Debug:
            return "[DBG]";
        case LogLevel::Info:
            return "[INF]";
        case LogLevel::Event:
            return "[EVT]";
        case LogLevel::Warning:
            return "[WRN]";
        case LogLevel::Error:
            return "[ERR]";
        case LogLevel::Fatal:
            return "[FTL]";
        }
        return "[???]";
    }

    [[nodiscard]] static const char *LevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

} // namespace optiframe
