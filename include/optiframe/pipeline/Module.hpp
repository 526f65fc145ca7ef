#pragma once

/**
 * @file Module.hpp
 * @brief Bundle of per-phase tasks supplied by a domain package
 */

#include <optiframe/engine/Task.hpp>
#include <optiframe/engine/TaskDescriptor.hpp>
#include <optiframe/pipeline/Phase.hpp>

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace optiframe {

/**
 * @brief Tasks a domain package contributes to each pipeline phase
 *
 * Example:
 * @code
 * Module base("knapsack_base");
 * base.Add<Phase::Validate, ValidateItems>()
 *     .Add<Phase::Build, BuildModel>()
 *     .Add<Phase::Extract, ExtractPacking>();
 * @endcode
 */
class Module {
  public:
    explicit Module(std::string name) : name_(std::move(name)) {}

    template <Phase P, TaskType T> Module &Add() { return Add(P, TaskDescriptor::Of<T>()); }

    Module &Add(Phase phase, TaskDescriptor descriptor) {
        tasks_[PhaseIndex(phase)].push_back(std::move(descriptor));
        return *this;
    }

    [[nodiscard]] const std::string &Name() const { return name_; }

    [[nodiscard]] const std::vector<TaskDescriptor> &TasksFor(Phase phase) const {
        return tasks_[PhaseIndex(phase)];
    }

    [[nodiscard]] std::size_t NumTasks() const {
        std::size_t n = 0;
        for (const auto &phase_tasks : tasks_) {
            n += phase_tasks.size();
        }
        return n;
    }

  private:
    std::string name_;
    std::array<std::vector<TaskDescriptor>, kNumPhases> tasks_;
};

} // namespace optiframe
