/**
 * @file DependencyAnalyzer.cpp
 * @brief Dry-run fixpoint over key sets
 */

#include <optiframe/analysis/DependencyAnalyzer.hpp>

#include <algorithm>
#include <sstream>

namespace optiframe {

std::string ExecutionPlan::ToString() const {
    std::ostringstream oss;
    oss << "Plan for workflow '" << workflow << "'" << (IsValid() ? "" : " (INVALID)") << "\n";
    for (const auto &step : steps) {
        oss << "  step '" << step.step << "'\n";
        for (std::size_t i = 0; i < step.passes.size(); ++i) {
            oss << "    pass " << (i + 1) << ":";
            for (const auto &task : step.passes[i]) {
                oss << " " << task;
            }
            oss << "\n";
        }
        for (const auto &stuck : step.stuck) {
            oss << "    stuck " << stuck.task << ": [";
            for (std::size_t i = 0; i < stuck.missing.size(); ++i) {
                if (i > 0) {
                    oss << ", ";
                }
                oss << stuck.missing[i].parameter << ": " << stuck.missing[i].type;
            }
            oss << "]\n";
        }
    }
    return oss.str();
}

ExecutionPlan DependencyAnalyzer::Plan(const Workflow &workflow,
                                       const std::vector<TypeKey> &seeds) {
    ExecutionPlan plan;
    plan.workflow = workflow.Name();

    std::unordered_set<TypeKey> available(seeds.begin(), seeds.end());
    for (const auto &step : workflow.Steps()) {
        plan.steps.push_back(PlanStep(step, available));
        if (!plan.steps.back().IsValid()) {
            break;
        }
    }
    return plan;
}

ExecutionPlan DependencyAnalyzer::Plan(const Workflow &workflow, const Registry &seeds) {
    return Plan(workflow, seeds.Keys());
}

StepPlan DependencyAnalyzer::PlanStep(const Step &step, std::unordered_set<TypeKey> &available) {
    StepPlan plan;
    plan.step = step.Name();

    const auto &tasks = step.Tasks();
    std::vector<std::size_t> pending(tasks.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i] = i;
    }

    while (!pending.empty()) {
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
            for (std::size_t index : waiting) {
                plan.stuck.push_back(tasks[index].ToStuck(tasks[index].MissingIn(available)));
            }
            break;
        }

        std::vector<std::string> pass;
        for (std::size_t index : ready) {
            pass.push_back(tasks[index].Name());
            if (tasks[index].HasOutput()) {
                available.insert(*tasks[index].Output());
            }
        }
        plan.passes.push_back(std::move(pass));
        pending = std::move(waiting);
    }

    for (const auto &key : available) {
        plan.available_after.push_back(key.Name());
    }
    std::sort(plan.available_after.begin(), plan.available_after.end());
    return plan;
}

} // namespace optiframe
