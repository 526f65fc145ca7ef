/**
 * @file Workflow.cpp
 * @brief Workflow assembly and step-by-step execution
 */

#include <optiframe/engine/Workflow.hpp>

#include <optiframe/io/LogService.hpp>

#include <chrono>
#include <iomanip>
#include <sstream>

namespace optiframe {

// =============================================================================
// Workflow
// =============================================================================

Workflow &Workflow::AddStep(Step step) {
    steps_.push_back(std::move(step));
    return *this;
}

Workflow &Workflow::ApplyOptions(const StepOptions &options) {
    for (auto &step : steps_) {
        step.SetOptions(options);
    }
    return *this;
}

const Step &Workflow::StepAt(std::size_t index) const & {
    if (index >= steps_.size()) {
        throw LifecycleError::StepIndex(index, steps_.size());
    }
    return steps_[index];
}

const Step *Workflow::FindStep(const std::string &name) const & {
    for (const auto &step : steps_) {
        if (step.Name() == name) {
            return &step;
        }
    }
    return nullptr;
}

InitializedWorkflow Workflow::InitializeWith(Registry data) const {
    return {*this, std::move(data)};
}

// =============================================================================
// InitializedWorkflow
// =============================================================================

const Registry &InitializedWorkflow::ExecuteStep(std::size_t index) {
    const Step &step = workflow_.StepAt(index);
    reports_.push_back(step.Execute(data_));
    return data_;
}

const Registry &InitializedWorkflow::ExecuteAll() {
    auto &log = GetLogService();
    const LogContext ctx{.step = workflow_.Name(), .task = ""};
    log.Log(LogLevel::Event,
            "Executing workflow '" + workflow_.Name() + "' (" +
                std::to_string(workflow_.NumSteps()) + " steps)",
            ctx);
    const auto start = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < workflow_.NumSteps(); ++i) {
        ExecuteStep(i);
    }

    std::ostringstream oss;
    oss << "Finished workflow '" << workflow_.Name() << "' in " << std::fixed
        << std::setprecision(3)
        << std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count()
        << "s.";
    log.Log(LogLevel::Event, oss.str(), ctx);
    return data_;
}

} // namespace optiframe
