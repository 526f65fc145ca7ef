#pragma once

/**
 * @file EngineConfig.hpp
 * @brief Engine-wide configuration: step scheduling options and logging
 */

#include <optiframe/engine/StepOptions.hpp>
#include <optiframe/io/LogConfig.hpp>

#include <string>
#include <vector>

namespace optiframe {

/**
 * @brief Configuration loaded from the `engine` and `logging` YAML sections
 */
struct EngineConfig {
    StepOptions step;   ///< Applied to every step of a configured workflow
    LogConfig logging;

    std::string source_file; ///< Where the config was loaded from (diagnostics)

    [[nodiscard]] static EngineConfig Default() { return {}; }

    /// Validate configuration, returns a list of problems (empty when valid)
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors = step.Validate();
        if (logging.file_enabled && logging.file_path.empty()) {
            errors.emplace_back("logging: file output enabled without a file path");
        }
        return errors;
    }
};

} // namespace optiframe
