#pragma once

/**
 * @file Step.hpp
 * @brief A set of tasks scheduled together against one Registry
 *
 * Scheduling is an iterative ready-set fixpoint: each pass runs every pending
 * task whose dependencies are all present, in registration order, and writes
 * their outputs. A pass that runs nothing while tasks remain is a stall and
 * fails with ScheduleError.
 */

#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/StepOptions.hpp>
#include <optiframe/engine/Task.hpp>
#include <optiframe/engine/TaskDescriptor.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace optiframe {

/**
 * @brief What a successful step execution did
 */
struct StepReport {
    std::string step;
    std::vector<std::vector<std::string>> passes; ///< Task names run in each pass
    double duration_s = 0.0;                      ///< Wall-clock duration

    [[nodiscard]] std::size_t NumPasses() const { return passes.size(); }

    [[nodiscard]] std::size_t NumTasksRun() const {
        std::size_t n = 0;
        for (const auto &pass : passes) {
            n += pass.size();
        }
        return n;
    }
};

/**
 * @brief Output key produced by more than one task of a step
 */
struct DuplicateOutput {
    TypeKey key;
    std::vector<std::string> producers; ///< In registration order
};

/**
 * @brief Ordered collection of task descriptors plus scheduling options
 *
 * Example:
 * @code
 * Step step("pre_processing");
 * step.AddTasks<NormalizeItems, BuildIndex>();
 * step.Execute(registry);
 * @endcode
 */
class Step {
  public:
    /**
     * @brief Create an empty step
     * @throws ConfigError if the options are invalid
     */
    explicit Step(std::string name, StepOptions options = StepOptions::Default());

    // =========================================================================
    // Assembly
    // =========================================================================

    /// Append a task type (descriptor derived now)
    template <TaskType T> Step &AddTask() { return AddTask(TaskDescriptor::Of<T>()); }

    /// Append several task types, in order
    template <TaskType... Ts> Step &AddTasks() {
        (AddTask<Ts>(), ...);
        return *this;
    }

    /// Append a prepared descriptor (e.g. from TaskDescriptor::FromFunction or the factory)
    Step &AddTask(TaskDescriptor descriptor);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return name_; }
    [[nodiscard]] const std::vector<TaskDescriptor> &Tasks() const { return tasks_; }
    [[nodiscard]] std::size_t NumTasks() const { return tasks_.size(); }
    [[nodiscard]] std::vector<std::string> TaskNames() const;

    [[nodiscard]] const StepOptions &Options() const { return options_; }

    /// @throws ConfigError if the options are invalid
    void SetOptions(const StepOptions &options);

    /// Output keys declared by more than one task, in first-producer order
    [[nodiscard]] std::vector<DuplicateOutput> DuplicateOutputs() const;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Run every task exactly once, extending the registry with their outputs
     *
     * @param data Registry read for dependencies and written with outputs
     * @return Passes executed and duration
     * @throws InjectionError on a duplicate producer under DuplicateOutputPolicy::Error
     *         (before any task runs) or a declared output that was not produced
     * @throws ScheduleError if a pass makes no progress
     *
     * Errors thrown by tasks propagate unchanged. The registry is not rolled
     * back: it keeps every output written before the failure.
     */
    StepReport Execute(Registry &data) const;

  private:
    std::string name_;
    StepOptions options_;
    std::vector<TaskDescriptor> tasks_;

    void CheckDuplicateOutputs() const;

    void RunSequential(const std::vector<std::size_t> &ready, Registry &snapshot,
                       Registry &data) const;

    void RunParallel(const std::vector<std::size_t> &ready, Registry &snapshot,
                     Registry &data) const;

    /// Run one task under its log context; returns the wrapped output
    std::any RunTask(const TaskDescriptor &task, Registry &snapshot) const;

    static void WriteOutput(const TaskDescriptor &task, std::any output, Registry &data);
};

} // namespace optiframe
