#pragma once

/**
 * @file WorkflowGraph.hpp
 * @brief Task dependency graph of a workflow, exportable as JSON or YAML
 *
 * Nodes are tasks; an edge connects the task (or seed) that provides a key to
 * each task consuming it.
 *
 * ## JSON Schema
 *
 * ```json
 * {
 *   "workflow": "demo",
 *   "summary": { "total_tasks": 3, "total_edges": 2, "unresolved_inputs": 0 },
 *   "seeds": ["Settings"],
 *   "tasks": [
 *     { "id": "first.ProduceA", "step": "first", "name": "ProduceA",
 *       "inputs": [ { "parameter": "settings", "type": "Settings" } ], "output": "A" }
 *   ],
 *   "edges": [
 *     { "source": "first.ProduceA", "target": "second.ConsumeA", "key": "A", "kind": "cross_step" }
 *   ],
 *   "unresolved": [ { "task": "...", "parameter": "...", "type": "..." } ]
 * }
 * ```
 */

#include <optiframe/core/TypeKey.hpp>
#include <optiframe/engine/Workflow.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace optiframe {

/**
 * @brief Edge classification
 */
enum class EdgeKind {
    Seed,      ///< Key supplied at initialization
    IntraStep, ///< Producer runs earlier in the same step
    CrossStep  ///< Producer belongs to an earlier step
};

[[nodiscard]] inline const char *to_string(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::Seed:
        return "seed";
    case EdgeKind::IntraStep:
        return "intra_step";
    case EdgeKind::CrossStep:
        return "cross_step";
    }
    return "unknown";
}

struct GraphInput {
    std::string parameter;
    std::string type;
};

struct TaskNode {
    std::string id; ///< "step.task"
    std::string step;
    std::string name;
    std::vector<GraphInput> inputs;
    std::optional<std::string> output;
};

struct GraphEdge {
    std::string source; ///< Producer id, or "seed"
    std::string target; ///< Consumer id
    std::string key;    ///< Type name carried
    EdgeKind kind;
};

struct UnresolvedInput {
    std::string task; ///< Consumer id
    std::string parameter;
    std::string type;
};

struct WorkflowGraph {
    /// Source name used for edges from seed data
    static constexpr const char *kSeedSource = "seed";

    std::string workflow;
    std::vector<std::string> seeds; ///< Seed key names, sorted
    std::vector<TaskNode> tasks;
    std::vector<GraphEdge> edges;
    std::vector<UnresolvedInput> unresolved;

    /**
     * @brief Build the graph of a workflow
     *
     * Each consumed key is attributed to the latest earlier step producing it,
     * else the seed, else the first other producer in the consumer's own step.
     * Keys with none of these are listed as unresolved.
     */
    [[nodiscard]] static WorkflowGraph Build(const Workflow &workflow,
                                             const std::vector<TypeKey> &seeds = {});

    [[nodiscard]] const TaskNode *FindTask(const std::string &id) const;

    /// Edges ending at a task
    [[nodiscard]] std::vector<GraphEdge> InputsOf(const std::string &id) const;

    [[nodiscard]] nlohmann::json ToJSON() const;

    /// YAML document with the same structure as ToJSON()
    [[nodiscard]] std::string ToYAML() const;

    /// @throws IOError if the file cannot be written
    void ToJSONFile(const std::string &path) const;

    /// @throws IOError if the file cannot be written
    void ToYAMLFile(const std::string &path) const;
};

} // namespace optiframe
