/**
 * @file WorkflowLoader.cpp
 * @brief Workflow layout parsing and assembly
 */

#include <optiframe/io/WorkflowLoader.hpp>

#include <optiframe/io/YamlUtil.hpp>

#include <algorithm>

namespace optiframe::io {

std::vector<std::string> WorkflowDefinition::TaskTypes() const {
    std::vector<std::string> types;
    for (const auto &step : steps) {
        for (const auto &task : step.tasks) {
            if (std::find(types.begin(), types.end(), task) == types.end()) {
                types.push_back(task);
            }
        }
    }
    return types;
}

WorkflowDefinition WorkflowLoader::Load(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw ConfigError("cannot read workflow file", path, -1, "check that the file exists");
    } catch (const YAML::ParserException &e) {
        throw ConfigError("invalid YAML: " + e.msg, path, e.mark.line + 1);
    }
    return FromNode(root, path);
}

WorkflowDefinition WorkflowLoader::Parse(const std::string &yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::ParserException &e) {
        throw ConfigError("invalid YAML: " + e.msg, "<string>", e.mark.line + 1);
    }
    return FromNode(root, "<string>");
}

WorkflowDefinition WorkflowLoader::FromNode(const YAML::Node &root, const std::string &source) {
    if (!root.IsMap() || !root["workflow"].IsDefined()) {
        throw ConfigError("missing 'workflow' section", source, -1,
                          "add a 'workflow' mapping with 'name' and 'steps'");
    }

    const YAML::Node section = root["workflow"];
    yaml::ExpectMap(section, "workflow", source);

    WorkflowDefinition def;
    def.source_file = source;
    def.name = yaml::Get<std::string>(section, "name", def.name, "workflow", source);

    const YAML::Node steps = section["steps"];
    if (!steps.IsDefined() || !steps.IsSequence()) {
        throw ConfigError("'workflow.steps' must be a list", source, yaml::LineOf(section),
                          "list steps as '- name: ...' entries with a 'tasks' list");
    }

    for (std::size_t i = 0; i < steps.size(); ++i) {
        const YAML::Node node = steps[i];
        const std::string where = "workflow.steps[" + std::to_string(i) + "]";
        if (!node.IsMap()) {
            throw ConfigError("'" + where + "' must be a mapping", source, yaml::LineOf(node));
        }

        StepDefinition step;
        step.name = yaml::Require<std::string>(node, "name", where, source);
        step.line = yaml::LineOf(node);

        const YAML::Node tasks = node["tasks"];
        if (tasks.IsDefined() && !tasks.IsNull()) {
            if (!tasks.IsSequence()) {
                throw ConfigError("'" + where + ".tasks' must be a list", source,
                                  yaml::LineOf(tasks));
            }
            step.tasks = yaml::As<std::vector<std::string>>(tasks, where + ".tasks", source);
        }

        for (const auto &existing : def.steps) {
            if (existing.name == step.name) {
                throw ConfigError("duplicate step name '" + step.name + "'", source, step.line);
            }
        }
        def.steps.push_back(std::move(step));
    }

    return def;
}

Workflow WorkflowLoader::Build(const WorkflowDefinition &definition, const TaskFactory &factory,
                               const StepOptions &options) {
    Workflow workflow(definition.name);
    for (const auto &step_def : definition.steps) {
        Step step(step_def.name, options);
        for (const auto &type : step_def.tasks) {
            if (!factory.HasType(type)) {
                std::string registered;
                for (const auto &name : factory.GetRegisteredTypes()) {
                    if (!registered.empty()) {
                        registered += ", ";
                    }
                    registered += name;
                }
                if (registered.empty()) {
                    registered = "(none)";
                }
                throw ConfigError("unknown task type '" + type + "' in step '" + step_def.name +
                                      "'",
                                  definition.source_file, step_def.line,
                                  "registered types: " + registered);
            }
            step.AddTask(factory.Create(type));
        }
        workflow.AddStep(std::move(step));
    }
    return workflow;
}

} // namespace optiframe::io
