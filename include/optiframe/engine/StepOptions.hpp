#pragma once

/**
 * @file StepOptions.hpp
 * @brief Per-step scheduling options
 */

#include <optiframe/core/Error.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

namespace optiframe {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief What to do when two tasks of one step declare the same output
 */
enum class DuplicateOutputPolicy {
    LastWriteWins, ///< Allowed; the later completion overwrites (warning logged)
    Error          ///< Rejected with InjectionError before any task runs
};

/**
 * @brief How the ready tasks of a pass are run
 */
enum class ExecutionMode {
    Sequential, ///< One after another, in registration order
    Parallel    ///< Concurrently, outputs written in registration order
};

[[nodiscard]] inline std::string to_string(DuplicateOutputPolicy policy) {
    switch (policy) {
    case DuplicateOutputPolicy::LastWriteWins:
        return "last_write_wins";
    case DuplicateOutputPolicy::Error:
        return "error";
    }
    return "unknown";
}

[[nodiscard]] inline std::string to_string(ExecutionMode mode) {
    switch (mode) {
    case ExecutionMode::Sequential:
        return "sequential";
    case ExecutionMode::Parallel:
        return "parallel";
    }
    return "unknown";
}

namespace detail {

inline std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace detail

/**
 * @brief Parse a duplicate output policy (case-insensitive)
 * @throws ConfigError if the name is not recognized
 */
[[nodiscard]] inline DuplicateOutputPolicy parse_duplicate_output_policy(const std::string &name) {
    const std::string lower = detail::ToLower(name);
    if (lower == "last_write_wins")
        return DuplicateOutputPolicy::LastWriteWins;
    if (lower == "error")
        return DuplicateOutputPolicy::Error;
    throw ConfigError("unknown duplicate output policy '" + name +
                      "' (expected last_write_wins or error)");
}

/**
 * @brief Parse an execution mode (case-insensitive)
 * @throws ConfigError if the name is not recognized
 */
[[nodiscard]] inline ExecutionMode parse_execution_mode(const std::string &name) {
    const std::string lower = detail::ToLower(name);
    if (lower == "sequential")
        return ExecutionMode::Sequential;
    if (lower == "parallel")
        return ExecutionMode::Parallel;
    throw ConfigError("unknown execution mode '" + name + "' (expected sequential or parallel)");
}

// =============================================================================
// StepOptions
// =============================================================================

/**
 * @brief Scheduling options of one step
 *
 * The defaults give the reference behavior: sequential passes in registration
 * order, duplicate producers allowed with last-write-wins.
 */
struct StepOptions {
    DuplicateOutputPolicy duplicate_outputs = DuplicateOutputPolicy::LastWriteWins;
    ExecutionMode execution = ExecutionMode::Sequential;
    std::size_t max_workers = 4; ///< Upper bound on concurrently running tasks (parallel only)

    [[nodiscard]] static StepOptions Default() { return {}; }

    [[nodiscard]] static StepOptions Parallel(std::size_t workers = 4) {
        StepOptions options;
        options.execution = ExecutionMode::Parallel;
        options.max_workers = workers;
        return options;
    }

    /// Validate options, returns a list of problems (empty when valid)
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (execution == ExecutionMode::Parallel && max_workers == 0) {
            errors.emplace_back("max_workers must be at least 1 in parallel mode");
        }
        return errors;
    }
};

} // namespace optiframe
