#pragma once

/**
 * @file Workflow.hpp
 * @brief Ordered sequence of Steps over a shared, evolving Registry
 */

#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/Step.hpp>
#include <optiframe/engine/StepOptions.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace optiframe {

namespace detail {

template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T> struct IsSharedPtr : std::false_type {};
template <typename T> struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

/**
 * @brief Store one seed value under its own type
 *
 * An empty std::optional or null std::shared_ptr is skipped, so callers can
 * pass data that is only sometimes available.
 */
template <typename T> void Seed(Registry &data, T &&value) {
    using Value = std::remove_cvref_t<T>;
    if constexpr (IsOptional<Value>::value) {
        if (value.has_value()) {
            data.Set(*std::forward<T>(value));
        }
    } else if constexpr (IsSharedPtr<Value>::value) {
        if (value) {
            data.SetShared(std::forward<T>(value));
        }
    } else {
        data.Set(std::forward<T>(value));
    }
}

} // namespace detail

class InitializedWorkflow;

// =============================================================================
// Workflow
// =============================================================================

/**
 * @brief An ordered list of steps, reusable across initializations
 *
 * Example:
 * @code
 * Workflow workflow("knapsack");
 * workflow.AddSteps(std::move(validate), std::move(solve));
 * auto run = workflow.Initialize(items, capacity);
 * const Registry &result = run.ExecuteAll();
 * @endcode
 */
class Workflow {
  public:
    explicit Workflow(std::string name = "workflow") : name_(std::move(name)) {}

    Workflow &AddStep(Step step);

    template <typename... StepTypes> Workflow &AddSteps(StepTypes &&...steps) {
        (AddStep(std::forward<StepTypes>(steps)), ...);
        return *this;
    }

    /// Replace the scheduling options of every step added so far
    Workflow &ApplyOptions(const StepOptions &options);

    [[nodiscard]] const std::string &Name() const { return name_; }
    [[nodiscard]] std::size_t NumSteps() const { return steps_.size(); }
    [[nodiscard]] const std::vector<Step> &Steps() const & { return steps_; }

    /// @throws LifecycleError if index is out of range
    [[nodiscard]] const Step &StepAt(std::size_t index) const &;

    /// Step with the given name, or nullptr
    [[nodiscard]] const Step *FindStep(const std::string &name) const &;

    // Step references into a temporary workflow would dangle
    const std::vector<Step> &Steps() const && = delete;
    const Step &StepAt(std::size_t index) const && = delete;
    const Step *FindStep(const std::string &name) const && = delete;

    /**
     * @brief Bind the workflow to initial data
     *
     * Each seed is stored under its own type; a later seed of the same type
     * overwrites an earlier one. Empty optionals are skipped.
     */
    template <typename... Seeds>
    [[nodiscard]] InitializedWorkflow Initialize(Seeds &&...seeds) const;

    /// Bind the workflow to an existing registry
    [[nodiscard]] InitializedWorkflow InitializeWith(Registry data) const;

  private:
    std::string name_;
    std::vector<Step> steps_;
};

// =============================================================================
// InitializedWorkflow
// =============================================================================

/**
 * @brief A workflow bound to its Registry, executed step by step or all at once
 */
class InitializedWorkflow {
  public:
    InitializedWorkflow(Workflow workflow, Registry data)
        : workflow_(std::move(workflow)), data_(std::move(data)) {}

    /// Add data that was not available at initialization
    template <typename T> InitializedWorkflow &AddData(T &&value) {
        detail::Seed(data_, std::forward<T>(value));
        return *this;
    }

    /**
     * @brief Run exactly one step against the current registry
     * @throws LifecycleError if index is out of range
     */
    const Registry &ExecuteStep(std::size_t index);

    /// Run every step in order
    const Registry &ExecuteAll();

    const Registry &Execute() { return ExecuteAll(); }

    [[nodiscard]] const Registry &GetRegistry() const { return data_; }
    [[nodiscard]] Registry &GetRegistry() { return data_; }

    [[nodiscard]] const Workflow &GetWorkflow() const { return workflow_; }
    [[nodiscard]] std::size_t NumSteps() const { return workflow_.NumSteps(); }

    /// Reports of the steps executed so far, in execution order
    [[nodiscard]] const std::vector<StepReport> &Reports() const { return reports_; }

  private:
    Workflow workflow_;
    Registry data_;
    std::vector<StepReport> reports_;
};

template <typename... Seeds> InitializedWorkflow Workflow::Initialize(Seeds &&...seeds) const {
    Registry data;
    (detail::Seed(data, std::forward<Seeds>(seeds)), ...);
    return InitializeWith(std::move(data));
}

} // namespace optiframe
