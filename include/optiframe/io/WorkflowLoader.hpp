#pragma once

/**
 * @file WorkflowLoader.hpp
 * @brief Loads a workflow layout (steps and task type names) from YAML
 *
 * @code
 * workflow:
 *   name: demo
 *   steps:
 *     - name: first
 *       tasks: [ProduceA, ProduceB]
 *     - name: second
 *       tasks: [ConsumeB]
 * @endcode
 *
 * Task names are resolved through a TaskFactory when the workflow is built.
 */

#include <optiframe/engine/StepOptions.hpp>
#include <optiframe/engine/TaskFactory.hpp>
#include <optiframe/engine/Workflow.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace optiframe::io {

struct StepDefinition {
    std::string name;
    std::vector<std::string> tasks; ///< Task type names, in registration order
    int line = -1;                  ///< Source line (diagnostics)
};

struct WorkflowDefinition {
    std::string name = "workflow";
    std::vector<StepDefinition> steps;
    std::string source_file;

    /// Every task type name referenced, in first-use order
    [[nodiscard]] std::vector<std::string> TaskTypes() const;
};

class WorkflowLoader {
  public:
    /**
     * @brief Load the `workflow` section of a YAML file
     * @throws ConfigError on unreadable files, invalid YAML or a malformed section
     */
    static WorkflowDefinition Load(const std::string &path);

    /// Parse the `workflow` section from a YAML string (for testing)
    static WorkflowDefinition Parse(const std::string &yaml_content);

    static WorkflowDefinition FromNode(const YAML::Node &root, const std::string &source);

    /**
     * @brief Create the workflow, resolving task names through the factory
     *
     * @param definition Parsed layout
     * @param factory Task registry (TaskFactory::Instance() by default)
     * @param options Scheduling options applied to every step
     * @throws ConfigError naming the step when a task type is unknown
     */
    static Workflow Build(const WorkflowDefinition &definition,
                          const TaskFactory &factory = TaskFactory::Instance(),
                          const StepOptions &options = StepOptions::Default());
};

} // namespace optiframe::io
