#pragma once

/**
 * @file Task.hpp
 * @brief The unit of work scheduled by a Step
 *
 * A task declares the data it consumes as constructor parameters and the data
 * it produces as the return value of Execute(). The scheduler never inspects a
 * task beyond these declarations: domain code writes tasks, not scheduler
 * internals.
 */

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace optiframe {

/**
 * @brief Ordered list of dependency types of a task
 *
 * The task constructor takes one parameter per entry, in this order, as
 * `const T &` (read-only) or `T &` (the task modifies the shared value).
 */
template <typename... Ts> struct Deps {
    static constexpr std::size_t size = sizeof...(Ts);
};

/**
 * @brief Base class for tasks producing a value of type Output
 *
 * Example:
 * @code
 * class BuildIndex : public optiframe::Task<Index> {
 *   public:
 *     using Dependencies = optiframe::Deps<Items, Settings>;
 *     static constexpr std::array<std::string_view, 2> kParameterNames{"items", "settings"};
 *
 *     BuildIndex(const Items &items, const Settings &settings)
 *         : items_(items), settings_(settings) {}
 *
 *     Index Execute() override { ... }
 *
 *   private:
 *     const Items &items_;
 *     const Settings &settings_;
 * };
 * @endcode
 *
 * Output may be:
 * - `void`: the task produces nothing
 * - `T`: the task always produces a T
 * - `std::optional<T>`, `std::unique_ptr<T>`, `std::shared_ptr<T>`: the output
 *   key is T; returning an empty value is an InjectionError
 *
 * Optional static members:
 * - `kName` (string_view): name used in logs and errors (default: type name)
 * - `kParameterNames` (array of string_view): one name per dependency
 *
 * A task instance is constructed immediately before it runs, executed exactly
 * once, then discarded. Referenced dependency values outlive the instance.
 */
template <typename Output> class Task {
  public:
    using OutputType = Output;
    using Dependencies = Deps<>;

    virtual ~Task() = default;

    /// Run the task; the returned value is made available to other tasks
    virtual Output Execute() = 0;
};

namespace detail {

// =============================================================================
// Output traits
// =============================================================================

template <typename T> struct OutputTraits {
    using Value = T;
    static bool HasValue(const T & /*value*/) { return true; }
    static std::shared_ptr<Value> Share(T &&value) { return std::make_shared<T>(std::move(value)); }
};

template <typename T> struct OutputTraits<std::optional<T>> {
    using Value = T;
    static bool HasValue(const std::optional<T> &value) { return value.has_value(); }
    static std::shared_ptr<Value> Share(std::optional<T> &&value) {
        return std::make_shared<T>(std::move(*value));
    }
};

template <typename T> struct OutputTraits<std::unique_ptr<T>> {
    using Value = T;
    static bool HasValue(const std::unique_ptr<T> &value) { return value != nullptr; }
    static std::shared_ptr<Value> Share(std::unique_ptr<T> &&value) {
        return std::shared_ptr<T>(std::move(value));
    }
};

template <typename T> struct OutputTraits<std::shared_ptr<T>> {
    using Value = T;
    static bool HasValue(const std::shared_ptr<T> &value) { return value != nullptr; }
    static std::shared_ptr<Value> Share(std::shared_ptr<T> &&value) { return std::move(value); }
};

/// Registry value type produced by a task output type (void stays void)
template <typename Output> struct OutputValue {
    using type = typename OutputTraits<Output>::Value;
};

template <> struct OutputValue<void> {
    using type = void;
};

template <typename Output> using OutputValueT = typename OutputValue<Output>::type;

template <typename T> struct IsDeps : std::false_type {};

template <typename... Ts> struct IsDeps<Deps<Ts...>> : std::true_type {};

} // namespace detail

// =============================================================================
// Concepts
// =============================================================================

/**
 * @brief Concept for types that can be registered as tasks
 */
template <typename T>
concept TaskType = requires {
    typename T::OutputType;
    typename T::Dependencies;
} && std::derived_from<T, Task<typename T::OutputType>> &&
                   detail::IsDeps<typename T::Dependencies>::value;

/// Task declares a custom name
template <typename T>
concept NamedTask = requires {
    { T::kName } -> std::convertible_to<std::string_view>;
};

/// Task declares names for its constructor parameters
template <typename T>
concept TaskWithParameterNames = requires {
    T::kParameterNames.size();
    T::kParameterNames.begin();
};

} // namespace optiframe
