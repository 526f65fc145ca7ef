#pragma once

/**
 * @file Pipeline.hpp
 * @brief Fixed-phase workflow assembled from domain modules
 *
 * A pipeline owns one step per Phase. Phase-boundary tasks (creating the
 * problem object, calling the solver) are registered first, then the tasks of
 * each module in the order the modules were added. Phases run strictly in
 * order.
 */

#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/StepOptions.hpp>
#include <optiframe/engine/Task.hpp>
#include <optiframe/engine/TaskDescriptor.hpp>
#include <optiframe/engine/Workflow.hpp>
#include <optiframe/pipeline/Module.hpp>
#include <optiframe/pipeline/Phase.hpp>

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace optiframe {

/**
 * @brief Seeded into every pipeline run
 */
struct PipelineSettings {
    std::string name;
};

/**
 * @brief Wall-clock duration of each phase, kept in the registry after each phase
 */
struct PhaseTimes {
    std::array<double, kNumPhases> seconds{};

    [[nodiscard]] double Of(Phase phase) const { return seconds[PhaseIndex(phase)]; }

    [[nodiscard]] double Total() const {
        double total = 0.0;
        for (double s : seconds) {
            total += s;
        }
        return total;
    }
};

class InitializedPipeline;

// =============================================================================
// Pipeline
// =============================================================================

class Pipeline {
  public:
    explicit Pipeline(std::string name, StepOptions options = StepOptions::Default())
        : name_(std::move(name)), options_(options) {}

    Pipeline &AddModule(Module module) {
        modules_.push_back(std::move(module));
        return *this;
    }

    template <typename... ModuleTypes> Pipeline &AddModules(ModuleTypes &&...modules) {
        (AddModule(std::forward<ModuleTypes>(modules)), ...);
        return *this;
    }

    /// Register a phase-boundary task (runs in the phase ahead of module tasks)
    Pipeline &AddPhaseTask(Phase phase, TaskDescriptor descriptor) {
        boundary_[PhaseIndex(phase)].push_back(std::move(descriptor));
        return *this;
    }

    template <Phase P, TaskType T> Pipeline &AddPhaseTask() {
        return AddPhaseTask(P, TaskDescriptor::Of<T>());
    }

    [[nodiscard]] const std::string &Name() const { return name_; }
    [[nodiscard]] const std::vector<Module> &Modules() const { return modules_; }
    [[nodiscard]] const StepOptions &Options() const { return options_; }

    /// The workflow with one step per phase, in phase order
    [[nodiscard]] Workflow BuildWorkflow() const;

    /**
     * @brief Bind the pipeline to the data defining a problem instance
     *
     * PipelineSettings{Name()} is stored after the seeds.
     */
    template <typename... Seeds>
    [[nodiscard]] InitializedPipeline Initialize(Seeds &&...seeds) const;

  private:
    std::string name_;
    StepOptions options_;
    std::vector<Module> modules_;
    std::array<std::vector<TaskDescriptor>, kNumPhases> boundary_;
};

// =============================================================================
// InitializedPipeline
// =============================================================================

class InitializedPipeline {
  public:
    explicit InitializedPipeline(InitializedWorkflow workflow) : workflow_(std::move(workflow)) {}

    /**
     * @brief Run one phase
     * @throws LifecycleError unless phase is the next one to run
     */
    const Registry &RunPhase(Phase phase);

    /// Run every phase up to and including the given one (no-op if already done)
    const Registry &RunThrough(Phase phase);

    /// Run all remaining phases
    const Registry &Run();

    /// Add data needed by a later phase (e.g. solver settings)
    template <typename T> InitializedPipeline &AddData(T &&value) {
        workflow_.AddData(std::forward<T>(value));
        return *this;
    }

    [[nodiscard]] const std::vector<Phase> &CompletedPhases() const { return completed_; }

    /// Next phase to run, or nothing when the pipeline has finished
    [[nodiscard]] std::optional<Phase> NextPhase() const;

    [[nodiscard]] bool IsComplete() const { return completed_.size() == kNumPhases; }

    [[nodiscard]] const PhaseTimes &Times() const { return times_; }

    [[nodiscard]] const Registry &GetRegistry() const { return workflow_.GetRegistry(); }

    [[nodiscard]] const InitializedWorkflow &GetWorkflow() const { return workflow_; }

  private:
    InitializedWorkflow workflow_;
    std::vector<Phase> completed_;
    PhaseTimes times_;
};

template <typename... Seeds>
InitializedPipeline Pipeline::Initialize(Seeds &&...seeds) const {
    InitializedWorkflow workflow = BuildWorkflow().Initialize(std::forward<Seeds>(seeds)...);
    workflow.AddData(PipelineSettings{.name = name_});
    return InitializedPipeline(std::move(workflow));
}

} // namespace optiframe
