#pragma once

/**
 * @file TaskFactory.hpp
 * @brief Factory for creating task descriptors by type name
 *
 * Lets workflows be assembled from configuration files: a step lists task
 * type names, the factory turns each name into a descriptor.
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/engine/Task.hpp>
#include <optiframe/engine/TaskDescriptor.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace optiframe {

/**
 * @brief Singleton registry of task type names
 *
 * Tasks register themselves using the OPTIFRAME_REGISTER_TASK macro.
 *
 * Example usage:
 * @code
 * // In the task's source file
 * OPTIFRAME_REGISTER_TASK(BuildIndex)
 *
 * // When assembling a workflow from config
 * auto descriptor = TaskFactory::Instance().Create("BuildIndex");
 * @endcode
 */
class TaskFactory {
  public:
    /// Creator function type: returns a fresh descriptor
    using Creator = std::function<TaskDescriptor()>;

    /**
     * @brief Register a task type with a custom creator
     *
     * Registering a name twice replaces the earlier creator.
     */
    void Register(const std::string &type_name, Creator creator) {
        creators_[type_name] = std::move(creator);
    }

    /// Register a task class under a name
    template <TaskType T> void Register(const std::string &type_name) {
        Register(type_name, [] { return TaskDescriptor::Of<T>(); });
    }

    /**
     * @brief Create the descriptor of a registered task type
     * @throws InjectionError (a ConfigError) if the type is not registered
     */
    [[nodiscard]] TaskDescriptor Create(const std::string &type_name) const {
        auto it = creators_.find(type_name);
        if (it == creators_.end()) {
            throw InjectionError::UnknownTask(type_name, ListTypesString());
        }
        return it->second();
    }

    [[nodiscard]] bool HasType(const std::string &type_name) const {
        return creators_.contains(type_name);
    }

    /// Registered type names, sorted
    [[nodiscard]] std::vector<std::string> GetRegisteredTypes() const {
        std::vector<std::string> types;
        types.reserve(creators_.size());
        for (const auto &pair : creators_) {
            types.push_back(pair.first);
        }
        std::sort(types.begin(), types.end());
        return types;
    }

    [[nodiscard]] std::size_t NumRegistered() const { return creators_.size(); }

    static TaskFactory &Instance() {
        static TaskFactory instance;
        return instance;
    }

    /// Clear all registrations (for testing)
    void Clear() { creators_.clear(); }

    TaskFactory() = default;

  private:
    [[nodiscard]] std::string ListTypesString() const {
        std::string result;
        for (const auto &type : GetRegisteredTypes()) {
            if (!result.empty())
                result += ", ";
            result += type;
        }
        return result.empty() ? "(none)" : result;
    }

    std::unordered_map<std::string, Creator> creators_;
};

} // namespace optiframe

// =============================================================================
// Registration Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define OPTIFRAME_REGISTER_TASK_IMPL2(TaskClass, TypeName, Counter)                                \
    namespace {                                                                                    \
    const bool optiframe_task_reg_##Counter = [] {                                                 \
        ::optiframe::TaskFactory::Instance().Register<TaskClass>(TypeName);                        \
        return true;                                                                               \
    }();                                                                                           \
    }

#define OPTIFRAME_REGISTER_TASK_IMPL(TaskClass, TypeName, Counter)                                 \
    OPTIFRAME_REGISTER_TASK_IMPL2(TaskClass, TypeName, Counter)

/**
 * @brief Register a task class with the global factory under a custom name
 *
 * Usage (at namespace scope, in a source file):
 * @code
 * OPTIFRAME_REGISTER_TASK_AS(knapsack::SolveGreedy, "SolveGreedy")
 * @endcode
 */
#define OPTIFRAME_REGISTER_TASK_AS(TaskClass, TypeName)                                            \
    OPTIFRAME_REGISTER_TASK_IMPL(TaskClass, TypeName, __COUNTER__)

/**
 * @brief Register a task class under its spelled name
 *
 * @code
 * OPTIFRAME_REGISTER_TASK(SolveGreedy)
 * @endcode
 */
#define OPTIFRAME_REGISTER_TASK(TaskClass) OPTIFRAME_REGISTER_TASK_AS(TaskClass, #TaskClass)

// NOLINTEND(cppcoreguidelines-macro-usage)
