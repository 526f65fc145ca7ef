#pragma once

/**
 * @file TaskDescriptor.hpp
 * @brief Static metadata and type-erased runner of one task
 *
 * A descriptor is derived once, when the task is added to a step. It holds the
 * ordered dependency list, the optional output key and a runner that builds
 * the task from registry values and executes it.
 */

#include <optiframe/core/Error.hpp>
#include <optiframe/core/TypeKey.hpp>
#include <optiframe/engine/Registry.hpp>
#include <optiframe/engine/Task.hpp>

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace optiframe {

/**
 * @brief One declared input of a task
 */
struct Dependency {
    std::string parameter; ///< Constructor parameter name (defaults to the type name)
    TypeKey key;
};

namespace detail {

/// Value of type D from the registry; the registry keeps it alive
template <typename D> D &Bind(Registry &data) {
    std::shared_ptr<D> value = data.GetShared<D>();
    if (!value) {
        throw RegistryError::NotFound(TypeKey::Of<D>().Name());
    }
    return *value;
}

/// Wrap a task result as a registry value (std::any holding shared_ptr<Value>)
template <typename Output> std::any ShareOutput(Output &&out, const std::string &task) {
    using Traits = OutputTraits<std::remove_cvref_t<Output>>;
    using Value = typename Traits::Value;
    static_assert(!std::is_const_v<Value>, "Task outputs must be mutable types");
    if (!Traits::HasValue(out)) {
        throw InjectionError::MissingOutput(task, TypeKey::Of<Value>().Name());
    }
    return std::any(Traits::Share(std::forward<Output>(out)));
}

template <typename... Ds> constexpr void CheckDependencyTypes() {
    static_assert((!std::is_reference_v<Ds> && ...),
                  "Dependencies are declared as plain types, not references");
    static_assert((!std::is_const_v<Ds> && ...),
                  "Dependencies are declared without const; take them as const T& instead");
}

template <typename T> std::string TaskNameOf() {
    if constexpr (NamedTask<T>) {
        return std::string(T::kName);
    } else {
        return TypeName<T>::Get();
    }
}

template <typename T> std::vector<std::string> ParameterNamesOf() {
    std::vector<std::string> names;
    if constexpr (TaskWithParameterNames<T>) {
        for (const auto &name : T::kParameterNames) {
            names.emplace_back(name);
        }
    }
    return names;
}

} // namespace detail

// =============================================================================
// TaskDescriptor
// =============================================================================

class TaskDescriptor {
  public:
    /// Builds the task from registry values, runs it, returns the wrapped output
    using Runner = std::function<std::any(Registry &)>;

    TaskDescriptor(std::string name, std::vector<Dependency> dependencies,
                   std::optional<TypeKey> output, Runner runner);

    /**
     * @brief Derive the descriptor of a task class
     * @throws InjectionError if kParameterNames does not match the dependency count
     */
    template <TaskType T> [[nodiscard]] static TaskDescriptor Of() {
        return OfImpl<T>(static_cast<typename T::Dependencies *>(nullptr));
    }

    /**
     * @brief Describe a callable as a task
     *
     * @tparam Output Return type of the callable (same rules as Task<Output>)
     * @tparam Ds Dependency types, passed to the callable as `Ds &` in order
     *
     * Example:
     * @code
     * auto task = TaskDescriptor::FromFunction<Total, Items>(
     *     "sum_items", [](const Items &items) { return Total{...}; });
     * @endcode
     */
    template <typename Output, typename... Ds, typename F>
    [[nodiscard]] static TaskDescriptor FromFunction(std::string name, F fn) {
        return FromFunction<Output, Ds...>(std::move(name), {}, std::move(fn));
    }

    template <typename Output, typename... Ds, typename F>
    [[nodiscard]] static TaskDescriptor FromFunction(std::string name,
                                                     std::vector<std::string> parameter_names,
                                                     F fn) {
        detail::CheckDependencyTypes<Ds...>();
        static_assert(std::is_invocable_r_v<Output, F &, Ds &...>,
                      "Callable must accept the dependencies and return Output");

        auto dependencies = MakeDependencies<Ds...>(name, parameter_names);
        Runner runner = [fn = std::move(fn), name](Registry &data) mutable -> std::any {
            if constexpr (std::is_void_v<Output>) {
                fn(detail::Bind<Ds>(data)...);
                return {};
            } else {
                return detail::ShareOutput(static_cast<Output>(fn(detail::Bind<Ds>(data)...)),
                                           name);
            }
        };
        return {std::move(name), std::move(dependencies), OutputKey<Output>(), std::move(runner)};
    }

    // =========================================================================
    // Metadata
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return name_; }
    [[nodiscard]] const std::vector<Dependency> &Dependencies() const { return dependencies_; }
    [[nodiscard]] const std::optional<TypeKey> &Output() const { return output_; }
    [[nodiscard]] bool HasOutput() const { return output_.has_value(); }

    [[nodiscard]] bool Produces(const TypeKey &key) const { return output_ && *output_ == key; }
    [[nodiscard]] bool DependsOn(const TypeKey &key) const;

    // =========================================================================
    // Readiness
    // =========================================================================

    /// Dependencies with no value in the registry, in declaration order
    [[nodiscard]] std::vector<Dependency> MissingIn(const Registry &data) const;

    /// Dependencies not in the set of available keys, in declaration order
    [[nodiscard]] std::vector<Dependency>
    MissingIn(const std::unordered_set<TypeKey> &available) const;

    [[nodiscard]] bool IsReadyIn(const Registry &data) const { return MissingIn(data).empty(); }

    /// Report entry for a task that stalled with the given missing dependencies
    [[nodiscard]] StuckTask ToStuck(const std::vector<Dependency> &missing) const;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Construct the task from registry values and run it
     *
     * Non-const dependencies are bound to the stored values, so the task may
     * mutate them. Only entries are read; the key set is left unchanged.
     * @return Empty std::any for tasks without output, otherwise the shared output
     */
    std::any Run(Registry &data) const { return runner_(data); }

  private:
    template <typename T, typename... Ds> static TaskDescriptor OfImpl(Deps<Ds...> * /*tag*/) {
        detail::CheckDependencyTypes<Ds...>();
        static_assert(std::is_constructible_v<T, Ds &...>,
                      "Task constructor must accept its Dependencies in declaration order");

        using Output = typename T::OutputType;
        std::string name = detail::TaskNameOf<T>();
        auto dependencies = MakeDependencies<Ds...>(name, detail::ParameterNamesOf<T>());

        Runner runner = [name](Registry &data) -> std::any {
            T task{detail::Bind<Ds>(data)...};
            if constexpr (std::is_void_v<Output>) {
                task.Execute();
                return {};
            } else {
                return detail::ShareOutput(task.Execute(), name);
            }
        };
        return {std::move(name), std::move(dependencies), OutputKey<Output>(), std::move(runner)};
    }

    template <typename... Ds>
    static std::vector<Dependency> MakeDependencies(const std::string &task,
                                                    const std::vector<std::string> &names) {
        std::vector<TypeKey> keys{TypeKey::Of<Ds>()...};
        if (!names.empty() && names.size() != keys.size()) {
            throw InjectionError::ParameterMismatch(task, keys.size(), names.size());
        }
        std::vector<Dependency> dependencies;
        dependencies.reserve(keys.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            dependencies.push_back(
                Dependency{.parameter = names.empty() ? keys[i].Name() : names[i], .key = keys[i]});
        }
        return dependencies;
    }

    template <typename Output> static std::optional<TypeKey> OutputKey() {
        if constexpr (std::is_void_v<Output>) {
            return std::nullopt;
        } else {
            return TypeKey::Of<detail::OutputValueT<Output>>();
        }
    }

    std::string name_;
    std::vector<Dependency> dependencies_;
    std::optional<TypeKey> output_;
    Runner runner_;
};

} // namespace optiframe
