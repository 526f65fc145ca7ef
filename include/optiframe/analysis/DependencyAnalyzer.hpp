#pragma once

/**
 * @file DependencyAnalyzer.hpp
 * @brief Dry-run scheduling of a workflow over TypeKey sets
 *
 * Runs the same fixpoint as Step::Execute without executing any task: a task
 * counts as producing its declared output as soon as it is scheduled. Used to
 * check a workflow against the data it will be seeded with before running it.
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/core/TypeKey.hpp>
#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/Step.hpp>
#include <optiframe/engine/Workflow.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace optiframe {

/**
 * @brief Predicted schedule of one step
 */
struct StepPlan {
    std::string step;
    std::vector<std::vector<std::string>> passes; ///< Task names per pass
    std::vector<std::string> available_after;     ///< Key names present after the step, sorted
    std::vector<StuckTask> stuck;                 ///< Tasks that could never run

    [[nodiscard]] bool IsValid() const { return stuck.empty(); }
};

/**
 * @brief Predicted schedule of a workflow
 *
 * Planning stops at the first step that would stall, since later steps would
 * never run.
 */
struct ExecutionPlan {
    std::string workflow;
    std::vector<StepPlan> steps;

    [[nodiscard]] bool IsValid() const {
        for (const auto &step : steps) {
            if (!step.IsValid()) {
                return false;
            }
        }
        return true;
    }

    /// First step that would stall, or nullptr
    [[nodiscard]] const StepPlan *FirstInvalid() const {
        for (const auto &step : steps) {
            if (!step.IsValid()) {
                return &step;
            }
        }
        return nullptr;
    }

    /// @throws ScheduleError matching the one execution would raise
    void ThrowIfInvalid() const {
        if (const StepPlan *bad = FirstInvalid()) {
            throw ScheduleError(bad->step, bad->stuck);
        }
    }

    /// Multi-line human readable summary
    [[nodiscard]] std::string ToString() const;
};

class DependencyAnalyzer {
  public:
    /**
     * @brief Plan a workflow given the keys it will be seeded with
     */
    [[nodiscard]] static ExecutionPlan Plan(const Workflow &workflow,
                                            const std::vector<TypeKey> &seeds = {});

    /// Plan using the keys currently present in a registry as seeds
    [[nodiscard]] static ExecutionPlan Plan(const Workflow &workflow, const Registry &seeds);

    /**
     * @brief Plan a single step
     * @param step Step to plan
     * @param available Keys present before the step; extended with its outputs
     */
    [[nodiscard]] static StepPlan PlanStep(const Step &step,
                                           std::unordered_set<TypeKey> &available);
};

} // namespace optiframe
