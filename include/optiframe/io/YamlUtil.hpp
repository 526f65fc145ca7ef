#pragma once

/**
 * @file YamlUtil.hpp
 * @brief Typed yaml-cpp access that reports problems as ConfigError
 */

#include <optiframe/core/Error.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace optiframe::io::yaml {

/// 1-based line of a node, or -1 when yaml-cpp has no position for it
inline int LineOf(const YAML::Node &node) {
    const YAML::Mark mark = node.Mark();
    return mark.is_null() ? -1 : mark.line + 1;
}

/**
 * @brief Convert a node, turning yaml-cpp conversion errors into ConfigError
 *
 * @param node Node to convert
 * @param what Dotted key path for the message (e.g. "engine.max_workers")
 * @param source File name (or "<string>")
 */
template <typename T>
T As(const YAML::Node &node, const std::string &what, const std::string &source) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion &e) {
        throw ConfigError("invalid value for '" + what + "'", source, LineOf(node), e.msg);
    }
}

/// Value of an optional key, or fallback when the key is absent or null
template <typename T>
T Get(const YAML::Node &map, const std::string &key, const T &fallback,
      const std::string &section, const std::string &source) {
    const YAML::Node node = map[key];
    if (!node.IsDefined() || node.IsNull()) {
        return fallback;
    }
    return As<T>(node, section + "." + key, source);
}

/// Value of a required key
template <typename T>
T Require(const YAML::Node &map, const std::string &key, const std::string &section,
          const std::string &source) {
    const YAML::Node node = map[key];
    if (!node.IsDefined() || node.IsNull()) {
        throw ConfigError("'" + section + "' missing required key '" + key + "'", source,
                          LineOf(map));
    }
    return As<T>(node, section + "." + key, source);
}

/// Fail unless the node is a map (or absent)
inline void ExpectMap(const YAML::Node &node, const std::string &section,
                      const std::string &source) {
    if (node.IsDefined() && !node.IsNull() && !node.IsMap()) {
        throw ConfigError("'" + section + "' must be a mapping", source, LineOf(node));
    }
}

} // namespace optiframe::io::yaml
