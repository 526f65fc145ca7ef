/**
 * @file ConfigLoader.cpp
 * @brief Engine configuration parsing
 */

#include <optiframe/io/ConfigLoader.hpp>

#include <optiframe/io/YamlUtil.hpp>

namespace optiframe::io {

namespace {

/// Parse an enumerated string value, reporting bad names with file context
template <typename Parser>
auto ParseNamed(const YAML::Node &map, const std::string &key, const std::string &section,
                const std::string &source, Parser parse, const std::string &hint)
    -> decltype(parse(std::string{})) {
    const YAML::Node node = map[key];
    const auto text = yaml::As<std::string>(node, section + "." + key, source);
    try {
        return parse(text);
    } catch (const ConfigError &) {
        throw ConfigError("invalid value '" + text + "' for '" + section + "." + key + "'",
                          source, yaml::LineOf(node), hint);
    }
}

bool Has(const YAML::Node &map, const std::string &key) {
    const YAML::Node node = map[key];
    return node.IsDefined() && !node.IsNull();
}

} // namespace

EngineConfig ConfigLoader::Load(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw ConfigError("cannot read config file", path, -1, "check that the file exists");
    } catch (const YAML::ParserException &e) {
        throw ConfigError("invalid YAML: " + e.msg, path, e.mark.line + 1);
    }
    return FromNode(root, path);
}

EngineConfig ConfigLoader::Parse(const std::string &yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::ParserException &e) {
        throw ConfigError("invalid YAML: " + e.msg, "<string>", e.mark.line + 1);
    }
    return FromNode(root, "<string>");
}

EngineConfig ConfigLoader::FromNode(const YAML::Node &root, const std::string &source) {
    EngineConfig cfg;
    cfg.source_file = source;

    if (root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("top level must be a mapping", source, yaml::LineOf(root));
    }

    if (Has(root, "engine")) {
        yaml::ExpectMap(root["engine"], "engine", source);
        ParseEngine(cfg.step, root["engine"], source);
    }
    if (Has(root, "logging")) {
        yaml::ExpectMap(root["logging"], "logging", source);
        ParseLogging(cfg.logging, root["logging"], source);
    }

    auto errors = cfg.Validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto &e : errors) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += e;
        }
        throw ConfigError(joined, source, -1);
    }
    return cfg;
}

void ConfigLoader::ParseEngine(StepOptions &options, const YAML::Node &node,
                               const std::string &source) {
    if (Has(node, "duplicate_outputs")) {
        options.duplicate_outputs =
            ParseNamed(node, "duplicate_outputs", "engine", source,
                       parse_duplicate_output_policy, "use last_write_wins or error");
    }
    if (Has(node, "execution")) {
        options.execution = ParseNamed(node, "execution", "engine", source, parse_execution_mode,
                                       "use sequential or parallel");
    }

    const int workers = yaml::Get<int>(node, "max_workers", static_cast<int>(options.max_workers),
                                       "engine", source);
    if (workers < 0) {
        throw ConfigError("'engine.max_workers' must not be negative", source,
                          yaml::LineOf(node["max_workers"]));
    }
    options.max_workers = static_cast<std::size_t>(workers);
}

void ConfigLoader::ParseLogging(LogConfig &logging, const YAML::Node &node,
                                const std::string &source) {
    const std::string level_hint = "use trace, debug, info, event, warning, error or fatal";

    if (Has(node, "console_level")) {
        logging.console_level =
            ParseNamed(node, "console_level", "logging", source, parse_log_level, level_hint);
    }
    logging.quiet_mode = yaml::Get<bool>(node, "quiet", logging.quiet_mode, "logging", source);

    logging.file_path = yaml::Get<std::string>(node, "file", logging.file_path, "logging", source);
    logging.file_enabled = !logging.file_path.empty();
    if (Has(node, "file_level")) {
        logging.file_level =
            ParseNamed(node, "file_level", "logging", source, parse_log_level, level_hint);
    }

    const auto format = yaml::Get<std::string>(node, "file_format", "text", "logging", source);
    if (format == "json") {
        logging.file_json = true;
    } else if (format == "text") {
        logging.file_json = false;
    } else {
        throw ConfigError("invalid value '" + format + "' for 'logging.file_format'", source,
                          yaml::LineOf(node["file_format"]), "use text or json");
    }
}

} // namespace optiframe::io
