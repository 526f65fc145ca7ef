/**
 * @file Pipeline.cpp
 * @brief Phase assembly and ordered phase execution
 */

#include <optiframe/pipeline/Pipeline.hpp>

#include <optiframe/core/Error.hpp>
#include <optiframe/io/LogService.hpp>

#include <iomanip>
#include <sstream>

namespace optiframe {

// =============================================================================
// Pipeline
// =============================================================================

Workflow Pipeline::BuildWorkflow() const {
    Workflow workflow(name_);
    for (Phase phase : kPhaseOrder) {
        Step step(PhaseName(phase), options_);
        for (const auto &task : boundary_[PhaseIndex(phase)]) {
            step.AddTask(task);
        }
        for (const auto &module : modules_) {
            for (const auto &task : module.TasksFor(phase)) {
                step.AddTask(task);
            }
        }
        workflow.AddStep(std::move(step));
    }
    return workflow;
}

// =============================================================================
// InitializedPipeline
// =============================================================================

std::optional<Phase> InitializedPipeline::NextPhase() const {
    if (IsComplete()) {
        return std::nullopt;
    }
    return kPhaseOrder[completed_.size()];
}

const Registry &InitializedPipeline::RunPhase(Phase phase) {
    const std::size_t index = PhaseIndex(phase);
    const std::size_t next = completed_.size();
    if (index < next) {
        throw LifecycleError("phase '" + std::string(PhaseName(phase)) + "' already ran");
    }
    if (index > next) {
        throw LifecycleError("cannot run phase '" + std::string(PhaseName(phase)) +
                             "' before '" + PhaseName(kPhaseOrder[next]) + "'");
    }

    auto &log = GetLogService();
    const LogContext ctx{.step = PhaseName(phase), .task = ""};
    log.Log(LogLevel::Event, "Phase '" + std::string(PhaseName(phase)) + "' started", ctx);

    workflow_.ExecuteStep(index);

    times_.seconds[index] = workflow_.Reports().back().duration_s;
    completed_.push_back(phase);
    workflow_.AddData(times_);

    std::ostringstream oss;
    oss << "Phase '" << PhaseName(phase) << "' complete (" << std::fixed << std::setprecision(3)
        << times_.seconds[index] << "s)";
    log.Log(LogLevel::Event, oss.str(), ctx);

    return workflow_.GetRegistry();
}

const Registry &InitializedPipeline::RunThrough(Phase phase) {
    while (completed_.size() <= PhaseIndex(phase)) {
        RunPhase(kPhaseOrder[completed_.size()]);
    }
    return workflow_.GetRegistry();
}

const Registry &InitializedPipeline::Run() { return RunThrough(Phase::Extract); }

} // namespace optiframe
