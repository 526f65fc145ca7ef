/**
 * @file WorkflowGraph.cpp
 * @brief Graph construction and JSON/YAML export
 */

#include <optiframe/analysis/WorkflowGraph.hpp>

#include <optiframe/core/CoreTypes.hpp>
#include <optiframe/core/Error.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace optiframe {

namespace detail {

template <typename Writer> void WriteToFile(const std::string &path, Writer &&write) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IOError("write", path, "cannot open for writing");
    }
    write(file);
    if (!file) {
        throw IOError("write", path, "write failed");
    }
}

} // namespace detail

namespace {

/// Id of the last task of a step that produces key, or nothing
std::optional<std::string> LastProducer(const Step &step, const TypeKey &key) {
    std::optional<std::string> id;
    for (const auto &task : step.Tasks()) {
        if (task.Produces(key)) {
            id = MakeFullPath(step.Name(), task.Name());
        }
    }
    return id;
}

/**
 * @brief Pass in which each task of a step runs, given the keys available before it
 *
 * Tasks that would stall have no pass. Outputs of scheduled tasks are added to
 * available.
 */
std::vector<std::optional<std::size_t>> PassIndices(const Step &step,
                                                    std::unordered_set<TypeKey> &available) {
    const auto &tasks = step.Tasks();
    std::vector<std::optional<std::size_t>> passes(tasks.size());
    std::vector<std::size_t> pending(tasks.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i] = i;
    }

    for (std::size_t pass = 0; !pending.empty(); ++pass) {
        std::vector<std::size_t> ready;
        std::vector<std::size_t> waiting;
        for (std::size_t index : pending) {
            if (tasks[index].MissingIn(available).empty()) {
                ready.push_back(index);
            } else {
                waiting.push_back(index);
            }
        }
        if (ready.empty()) {
            break;
        }
        for (std::size_t index : ready) {
            passes[index] = pass;
            if (tasks[index].HasOutput()) {
                available.insert(*tasks[index].Output());
            }
        }
        pending = std::move(waiting);
    }
    return passes;
}

} // namespace

WorkflowGraph WorkflowGraph::Build(const Workflow &workflow, const std::vector<TypeKey> &seeds) {
    WorkflowGraph graph;
    graph.workflow = workflow.Name();

    const std::unordered_set<TypeKey> seed_set(seeds.begin(), seeds.end());
    for (const auto &key : seeds) {
        graph.seeds.push_back(key.Name());
    }
    std::sort(graph.seeds.begin(), graph.seeds.end());
    graph.seeds.erase(std::unique(graph.seeds.begin(), graph.seeds.end()), graph.seeds.end());

    std::unordered_set<TypeKey> available = seed_set;
    const auto &steps = workflow.Steps();
    for (std::size_t s = 0; s < steps.size(); ++s) {
        const Step &step = steps[s];
        const auto &tasks = step.Tasks();
        const auto passes = PassIndices(step, available);

        for (std::size_t t = 0; t < tasks.size(); ++t) {
            const TaskDescriptor &task = tasks[t];

            TaskNode node;
            node.id = MakeFullPath(step.Name(), task.Name());
            node.step = step.Name();
            node.name = task.Name();
            if (task.HasOutput()) {
                node.output = task.Output()->Name();
            }

            for (const auto &dep : task.Dependencies()) {
                node.inputs.push_back(
                    GraphInput{.parameter = dep.parameter, .type = dep.key.Name()});

                std::optional<GraphEdge> edge;

                // Last writer of the key in an earlier pass of this step
                if (passes[t]) {
                    std::optional<std::size_t> writer;
                    for (std::size_t other = 0; other < tasks.size(); ++other) {
                        if (other == t || !passes[other] || *passes[other] >= *passes[t] ||
                            !tasks[other].Produces(dep.key)) {
                            continue;
                        }
                        if (!writer || *passes[other] >= *passes[*writer]) {
                            writer = other;
                        }
                    }
                    if (writer) {
                        edge = GraphEdge{.source =
                                             MakeFullPath(step.Name(), tasks[*writer].Name()),
                                         .target = node.id,
                                         .key = dep.key.Name(),
                                         .kind = EdgeKind::IntraStep};
                    }
                }
                for (std::size_t prev = s; prev-- > 0 && !edge;) {
                    if (auto producer = LastProducer(steps[prev], dep.key)) {
                        edge = GraphEdge{.source = *producer,
                                         .target = node.id,
                                         .key = dep.key.Name(),
                                         .kind = EdgeKind::CrossStep};
                    }
                }
                if (!edge && seed_set.contains(dep.key)) {
                    edge = GraphEdge{.source = kSeedSource,
                                     .target = node.id,
                                     .key = dep.key.Name(),
                                     .kind = EdgeKind::Seed};
                }
                if (!edge) {
                    // Consumer never becomes ready: link the last registered producer
                    for (std::size_t other = tasks.size(); other-- > 0 && !edge;) {
                        if (other != t && tasks[other].Produces(dep.key)) {
                            edge = GraphEdge{.source =
                                                 MakeFullPath(step.Name(), tasks[other].Name()),
                                             .target = node.id,
                                             .key = dep.key.Name(),
                                             .kind = EdgeKind::IntraStep};
                        }
                    }
                }

                if (edge) {
                    graph.edges.push_back(std::move(*edge));
                } else {
                    graph.unresolved.push_back(UnresolvedInput{
                        .task = node.id, .parameter = dep.parameter, .type = dep.key.Name()});
                }
            }

            graph.tasks.push_back(std::move(node));
        }
    }
    return graph;
}

const TaskNode *WorkflowGraph::FindTask(const std::string &id) const {
    for (const auto &task : tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

std::vector<GraphEdge> WorkflowGraph::InputsOf(const std::string &id) const {
    std::vector<GraphEdge> result;
    for (const auto &edge : edges) {
        if (edge.target == id) {
            result.push_back(edge);
        }
    }
    return result;
}

nlohmann::json WorkflowGraph::ToJSON() const {
    nlohmann::json j;
    j["workflow"] = workflow;

    j["summary"]["total_tasks"] = tasks.size();
    j["summary"]["total_edges"] = edges.size();
    j["summary"]["unresolved_inputs"] = unresolved.size();

    j["seeds"] = seeds;

    j["tasks"] = nlohmann::json::array();
    for (const auto &task : tasks) {
        nlohmann::json jtask;
        jtask["id"] = task.id;
        jtask["step"] = task.step;
        jtask["name"] = task.name;
        jtask["inputs"] = nlohmann::json::array();
        for (const auto &input : task.inputs) {
            jtask["inputs"].push_back({{"parameter", input.parameter}, {"type", input.type}});
        }
        jtask["output"] = task.output ? nlohmann::json(*task.output) : nlohmann::json(nullptr);
        j["tasks"].push_back(jtask);
    }

    j["edges"] = nlohmann::json::array();
    for (const auto &edge : edges) {
        nlohmann::json jedge;
        jedge["source"] = edge.source;
        jedge["target"] = edge.target;
        jedge["key"] = edge.key;
        jedge["kind"] = to_string(edge.kind);
        j["edges"].push_back(jedge);
    }

    j["unresolved"] = nlohmann::json::array();
    for (const auto &input : unresolved) {
        j["unresolved"].push_back(
            {{"task", input.task}, {"parameter", input.parameter}, {"type", input.type}});
    }

    return j;
}

std::string WorkflowGraph::ToYAML() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "workflow" << YAML::Value << workflow;

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total_tasks" << YAML::Value << tasks.size();
    out << YAML::Key << "total_edges" << YAML::Value << edges.size();
    out << YAML::Key << "unresolved_inputs" << YAML::Value << unresolved.size();
    out << YAML::EndMap;

    out << YAML::Key << "seeds" << YAML::Value << YAML::BeginSeq;
    for (const auto &seed : seeds) {
        out << seed;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto &task : tasks) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << task.id;
        out << YAML::Key << "step" << YAML::Value << task.step;
        out << YAML::Key << "name" << YAML::Value << task.name;
        out << YAML::Key << "inputs" << YAML::Value << YAML::BeginSeq;
        for (const auto &input : task.inputs) {
            out << YAML::BeginMap;
            out << YAML::Key << "parameter" << YAML::Value << input.parameter;
            out << YAML::Key << "type" << YAML::Value << input.type;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "output" << YAML::Value;
        if (task.output) {
            out << *task.output;
        } else {
            out << YAML::Null;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "edges" << YAML::Value << YAML::BeginSeq;
    for (const auto &edge : edges) {
        out << YAML::BeginMap;
        out << YAML::Key << "source" << YAML::Value << edge.source;
        out << YAML::Key << "target" << YAML::Value << edge.target;
        out << YAML::Key << "key" << YAML::Value << edge.key;
        out << YAML::Key << "kind" << YAML::Value << to_string(edge.kind);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "unresolved" << YAML::Value << YAML::BeginSeq;
    for (const auto &input : unresolved) {
        out << YAML::BeginMap;
        out << YAML::Key << "task" << YAML::Value << input.task;
        out << YAML::Key << "parameter" << YAML::Value << input.parameter;
        out << YAML::Key << "type" << YAML::Value << input.type;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

void WorkflowGraph::ToJSONFile(const std::string &path) const {
    detail::WriteToFile(path, [&](std::ofstream &file) { file << ToJSON().dump(2); });
}

void WorkflowGraph::ToYAMLFile(const std::string &path) const {
    const std::string yaml = ToYAML();
    detail::WriteToFile(path, [&](std::ofstream &file) { file << yaml; });
}

} // namespace optiframe
