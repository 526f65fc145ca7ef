#pragma once

/**
 * @file LogConfig.hpp
 * @brief Logging configuration structure and its application to a LogService
 */

#include <optiframe/io/Console.hpp>
#include <optiframe/io/LogService.hpp>
#include <optiframe/io/LogSink.hpp>

#include <string>

namespace optiframe {

/**
 * @brief Logging configuration
 */
struct LogConfig {
    // Console output
    LogLevel console_level = LogLevel::Info;

    // File output
    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;
    bool file_json = false; ///< JSON Lines instead of plain text

    bool quiet_mode = false; ///< Suppress all but errors on the console

    [[nodiscard]] static LogConfig Default() { return {}; }

    /// Create quiet config (errors only)
    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }

    /// Create verbose config (all output)
    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        config.file_level = LogLevel::Trace;
        return config;
    }

    /// Level actually applied to the console sink
    [[nodiscard]] LogLevel EffectiveConsoleLevel() const {
        if (quiet_mode && console_level < LogLevel::Error) {
            return LogLevel::Error;
        }
        return console_level;
    }
};

/**
 * @brief Replace the sinks of a service according to a LogConfig
 *
 * Installs a console sink (console must outlive the service's use of it) and,
 * when enabled, a file sink. The service minimum level becomes the lowest
 * level any sink wants.
 *
 * @throws IOError if the log file cannot be opened
 */
inline void ConfigureLogging(LogService &service, const LogConfig &config,
                             const Console &console) {
    const LogLevel console_level = config.EffectiveConsoleLevel();
    LogLevel min_level = console_level;

    service.ClearSinks();
    service.AddSink(LogSinks::Console(console), console_level);

    if (config.file_enabled && !config.file_path.empty()) {
        auto sink = config.file_json ? LogSinks::JsonLines(config.file_path)
                                     : LogSinks::File(config.file_path);
        service.AddSink(std::move(sink), config.file_level);
        if (config.file_level < min_level) {
            min_level = config.file_level;
        }
    }

    service.SetMinLevel(min_level);
}

} // namespace optiframe
