#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/io/Console.hpp>
#include <optiframe/io/LogEntry.hpp>
#include <optiframe/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace optiframe {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection); console must outlive the sink
    static LogService::Sink Console(const class Console &console) {
        return [&console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console.IsColorEnabled()) {
                    std::cout << entry.FormatColored(console) << "\n";
                } else {
                    std::cout << entry.Format() << "\n";
                }
            }
            std::cout.flush();
        };
    }

    /**
     * @brief File sink (plain text, no colors, appends)
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink File(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /**
     * @brief JSON Lines sink (one object per entry, for log aggregation)
     *
     * Keys: time, level, step, task, message.
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << ToJson(entry).dump() << "\n";
            }
            file->flush();
        };
    }

    /// Null sink (for testing/benchmarking)
    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    /// Callback sink (custom handling)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }

    /// JSON object for one entry
    [[nodiscard]] static nlohmann::json ToJson(const LogEntry &entry) {
        nlohmann::json j;
        j["time"] = entry.timestamp;
        j["level"] = to_string(entry.level);
        j["step"] = entry.context.step;
        j["task"] = entry.context.task;
        j["message"] = entry.message;
        return j;
    }

  private:
    static std::shared_ptr<std::ofstream> OpenAppend(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, "cannot open for writing");
        }
        return file;
    }
};

} // namespace optiframe
