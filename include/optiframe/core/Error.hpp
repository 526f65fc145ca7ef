#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Optiframe
 *
 * Provides a flattened exception hierarchy with a handful of error categories.
 * Each category carries contextual information rather than many subclasses.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace optiframe {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning
    ERROR,   ///< Error (the current step is aborted)
    FATAL    ///< Fatal (programming error, the workflow cannot continue)
};

// =============================================================================
// Error Report (structured error for logging)
// =============================================================================

struct ErrorReport {
    Severity severity;
    std::string message;
    std::string source; ///< Category, or the step/task the error came from
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Optiframe exceptions
 *
 * All Optiframe exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context
 * - Conversion to ErrorReport for LogService integration
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[optiframe] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

    /// Convert to ErrorReport for logging
    [[nodiscard]] ErrorReport toReport(const std::string &source = "") const {
        return ErrorReport{.severity = severity_,
                           .message = what(),
                           .source = source.empty() ? category_ : source};
    }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &section, const std::string &key)
        : Error("Config: " + section + " missing required key '" + key + "'", Severity::ERROR,
                "config") {}

    ConfigError(const std::string &message, const std::string &file, int line,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  protected:
    ConfigError(const std::string &full_message, Severity severity)
        : Error(full_message, severity, "config") {}

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// Injection Errors (task descriptors that cannot be resolved)
// =============================================================================

/**
 * @brief Ways a task descriptor can fail to resolve
 */
enum class InjectionErrorKind {
    ParameterMismatch, ///< Parameter names do not match the declared dependencies
    MissingOutput,     ///< Task declared an output but returned nothing
    DuplicateProducer, ///< Two tasks of one step declare the same output
    UnknownTask        ///< Task type name not registered with the factory
};

/**
 * @brief The dependencies or output of a task cannot be injected
 *
 * A programmer error: raised when a step is assembled or when the offending
 * task first runs, never retried.
 */
class InjectionError : public ConfigError {
  public:
    InjectionError(InjectionErrorKind kind, const std::string &task, const std::string &detail)
        : ConfigError(FormatMessage(kind, task, detail), Severity::FATAL), kind_(kind),
          task_(task) {}

    [[nodiscard]] InjectionErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string &task() const { return task_; }

    static InjectionError ParameterMismatch(const std::string &task, std::size_t dependencies,
                                            std::size_t names) {
        return {InjectionErrorKind::ParameterMismatch, task,
                std::to_string(dependencies) + " dependencies but " + std::to_string(names) +
                    " parameter names"};
    }

    static InjectionError MissingOutput(const std::string &task, const std::string &output) {
        return {InjectionErrorKind::MissingOutput, task,
                "declares output '" + output + "' but returned nothing"};
    }

    static InjectionError DuplicateProducer(const std::string &step, const std::string &output,
                                            const std::vector<std::string> &producers) {
        std::string joined;
        for (const auto &p : producers) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += p;
        }
        return {InjectionErrorKind::DuplicateProducer, step,
                "output '" + output + "' is produced by multiple tasks: " + joined};
    }

    static InjectionError UnknownTask(const std::string &type_name,
                                      const std::string &registered) {
        return {InjectionErrorKind::UnknownTask, type_name, "registered types: " + registered};
    }

  private:
    static std::string FormatMessage(InjectionErrorKind kind, const std::string &task,
                                     const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case InjectionErrorKind::ParameterMismatch:
            prefix = "Parameter mismatch";
            break;
        case InjectionErrorKind::MissingOutput:
            prefix = "Missing output";
            break;
        case InjectionErrorKind::DuplicateProducer:
            prefix = "Duplicate producer";
            break;
        case InjectionErrorKind::UnknownTask:
            prefix = "Unknown task type";
            break;
        }
        return "Config: " + prefix + ": '" + task + "' (" + detail + ")";
    }

    InjectionErrorKind kind_;
    std::string task_;
};

// =============================================================================
// Schedule Errors
// =============================================================================

/**
 * @brief A dependency that is not available when a task should run
 */
struct MissingDependency {
    std::string parameter; ///< Constructor parameter name
    std::string type;      ///< Readable TypeKey name
};

/**
 * @brief A task left pending when scheduling stalled
 */
struct StuckTask {
    std::string task;
    std::vector<MissingDependency> missing;
};

/**
 * @brief The tasks of a step cannot be scheduled
 *
 * Raised when a fixpoint pass makes no progress while tasks remain pending.
 * Covers circular dependencies, missing producers and data never supplied.
 */
class ScheduleError : public Error {
  public:
    ScheduleError(std::string step, std::vector<StuckTask> stuck)
        : Error(FormatMessage(step, stuck), Severity::ERROR, "schedule"), step_(std::move(step)),
          stuck_(std::move(stuck)) {}

    [[nodiscard]] const std::string &step() const { return step_; }
    [[nodiscard]] const std::vector<StuckTask> &stuck_tasks() const { return stuck_; }

    /// Check whether a given task is among the stuck ones
    [[nodiscard]] bool IsStuck(const std::string &task) const {
        for (const auto &s : stuck_) {
            if (s.task == task) {
                return true;
            }
        }
        return false;
    }

  private:
    static std::string FormatMessage(const std::string &step, const std::vector<StuckTask> &stuck) {
        std::string names;
        for (const auto &s : stuck) {
            if (!names.empty()) {
                names += ", ";
            }
            names += s.task;
        }

        std::string msg = "Schedule [" + step + "]: the tasks could not be scheduled, [" + names +
                          "] have unfulfilled dependencies:";
        for (const auto &s : stuck) {
            msg += "\n  - " + s.task + ": [";
            for (std::size_t i = 0; i < s.missing.size(); ++i) {
                if (i > 0) {
                    msg += ", ";
                }
                msg += s.missing[i].parameter + ": " + s.missing[i].type;
            }
            msg += "]";
        }
        return msg;
    }

    std::string step_;
    std::vector<StuckTask> stuck_;
};

// =============================================================================
// Registry Errors
// =============================================================================

/**
 * @brief Lookup of a TypeKey that has no value in the registry
 */
class RegistryError : public Error {
  public:
    explicit RegistryError(const std::string &msg)
        : Error("Registry: " + msg, Severity::ERROR, "registry") {}

    static RegistryError NotFound(const std::string &type) {
        RegistryError error("no value for type '" + type + "'");
        error.type_ = type;
        return error;
    }

    [[nodiscard]] const std::string &type() const { return type_; }

  private:
    std::string type_;
};

// =============================================================================
// Lifecycle Errors
// =============================================================================

/**
 * @brief Workflow/pipeline ordering errors
 */
class LifecycleError : public Error {
  public:
    explicit LifecycleError(const std::string &msg)
        : Error("Lifecycle: " + msg, Severity::ERROR, "lifecycle") {}

    static LifecycleError StepIndex(std::size_t index, std::size_t count) {
        return LifecycleError("step index " + std::to_string(index) + " out of range (" +
                              std::to_string(count) + " steps)");
    }
};

// =============================================================================
// Validation Errors
// =============================================================================

/**
 * @brief Input data violates a domain invariant
 *
 * Thrown by validation tasks. Opaque to the scheduler: it aborts the step and
 * propagates to the caller.
 */
class ValidationError : public Error {
  public:
    explicit ValidationError(const std::string &msg, std::string context = "")
        : Error("Validation: " + msg, Severity::ERROR, "validation"),
          context_(std::move(context)) {}

    [[nodiscard]] const std::string &context() const { return context_; }

  private:
    std::string context_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace optiframe

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define OPTIFRAME_THROW(error) throw(error)

/**
 * @brief Fail a validation task when a condition does not hold
 * @param cond Condition that must be true
 * @param msg Message describing the violated invariant
 */
#define OPTIFRAME_REQUIRE(cond, msg)                                                               \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw ::optiframe::ValidationError(msg);                                               \
        }                                                                                          \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)
