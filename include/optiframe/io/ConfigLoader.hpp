#pragma once

/**
 * @file ConfigLoader.hpp
 * @brief Loads the engine configuration from YAML
 *
 * Recognized sections (all optional):
 * @code
 * engine:
 *   duplicate_outputs: last_write_wins   # or: error
 *   execution: sequential                # or: parallel
 *   max_workers: 4
 * logging:
 *   console_level: info
 *   quiet: false
 *   file: optiframe.log
 *   file_level: debug
 *   file_format: text                    # or: json
 * @endcode
 */

#include <optiframe/io/EngineConfig.hpp>

#include <yaml-cpp/yaml.h>

#include <string>

namespace optiframe::io {

class ConfigLoader {
  public:
    /**
     * @brief Load engine config from file
     * @throws ConfigError if the file cannot be read, is not valid YAML or has invalid values
     */
    static EngineConfig Load(const std::string &path);

    /// Parse engine config from a YAML string (for testing)
    static EngineConfig Parse(const std::string &yaml_content);

    /// Read engine config from an already parsed document
    static EngineConfig FromNode(const YAML::Node &root, const std::string &source);

  private:
    static void ParseEngine(StepOptions &options, const YAML::Node &node,
                            const std::string &source);
    static void ParseLogging(LogConfig &logging, const YAML::Node &node,
                             const std::string &source);
};

} // namespace optiframe::io
