/**
 * @file Step.cpp
 * @brief Fixpoint scheduling of the tasks of one step
 */

#include <optiframe/engine/Step.hpp>

#include <optiframe/core/ErrorLogging.hpp>
#include <optiframe/io/LogService.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iomanip>
#include <sstream>

namespace optiframe {

namespace {

std::string JoinNames(const std::vector<std::string> &names) {
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds << "s";
    return oss.str();
}

void ValidateOptions(const std::string &step, const StepOptions &options) {
    auto errors = options.Validate();
    if (!errors.empty()) {
        throw ConfigError("step '" + step + "': " + JoinNames(errors));
    }
}

} // namespace

Step::Step(std::string name, StepOptions options)
    : name_(std::move(name)), options_(options) {
    ValidateOptions(name_, options_);
}

Step &Step::AddTask(TaskDescriptor descriptor) {
    tasks_.push_back(std::move(descriptor));
    return *this;
}

std::vector<std::string> Step::TaskNames() const {
    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto &task : tasks_) {
        names.push_back(task.Name());
    }
    return names;
}

void Step::SetOptions(const StepOptions &options) {
    ValidateOptions(name_, options);
    options_ = options;
}

std::vector<DuplicateOutput> Step::DuplicateOutputs() const {
    std::vector<DuplicateOutput> outputs;
    for (const auto &task : tasks_) {
        if (!task.HasOutput()) {
            continue;
        }
        auto it = std::find_if(outputs.begin(), outputs.end(), [&task](const DuplicateOutput &d) {
            return d.key == *task.Output();
        });
        if (it == outputs.end()) {
            outputs.push_back(DuplicateOutput{.key = *task.Output(), .producers = {task.Name()}});
        } else {
            it->producers.push_back(task.Name());
        }
    }
    outputs.erase(std::remove_if(outputs.begin(), outputs.end(),
                                 [](const DuplicateOutput &d) { return d.producers.size() < 2; }),
                  outputs.end());
    return outputs;
}

void Step::CheckDuplicateOutputs() const {
    for (const auto &duplicate : DuplicateOutputs()) {
        if (options_.duplicate_outputs == DuplicateOutputPolicy::Error) {
            ThrowAndLog(
                InjectionError::DuplicateProducer(name_, duplicate.key.Name(), duplicate.producers),
                name_);
        }
        GetLogService().Log(LogLevel::Warning,
                            "Output '" + duplicate.key.Name() + "' is produced by " +
                                JoinNames(duplicate.producers) + " (last write wins)",
                            LogContext{.step = name_, .task = ""});
    }
}

StepReport Step::Execute(Registry &data) const {
    const LogContext step_ctx{.step = name_, .task = ""};
    auto &log = GetLogService();

    CheckDuplicateOutputs();

    log.Log(LogLevel::Info,
            "Executing step '" + name_ + "' (" + std::to_string(tasks_.size()) + " tasks, " +
                to_string(options_.execution) + ")",
            step_ctx);
    const auto start = std::chrono::steady_clock::now();

    StepReport report;
    report.step = name_;

    std::vector<std::size_t> pending(tasks_.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i] = i;
    }

    while (!pending.empty()) {
        // Dependencies of this pass are read from the state at its start
        Registry snapshot = data;

        std::vector<std::size_t> ready;
        std::vector<std::size_t> waiting;
        for (std::size_t index : pending) {
            if (tasks_[index].IsReadyIn(snapshot)) {
                ready.push_back(index);
            } else {
                waiting.push_back(index);
            }
        }

        if (ready.empty()) {
            std::vector<StuckTask> stuck;
            stuck.reserve(waiting.size());
            for (std::size_t index : waiting) {
                const auto &task = tasks_[index];
                stuck.push_back(task.ToStuck(task.MissingIn(snapshot)));
            }
            ThrowAndLog(ScheduleError(name_, std::move(stuck)), name_);
        }

        std::vector<std::string> pass_names;
        pass_names.reserve(ready.size());
        for (std::size_t index : ready) {
            pass_names.push_back(tasks_[index].Name());
        }
        log.Log(LogLevel::Debug,
                "Pass " + std::to_string(report.passes.size() + 1) + ": " + JoinNames(pass_names),
                step_ctx);

        if (options_.execution == ExecutionMode::Parallel && ready.size() > 1) {
            RunParallel(ready, snapshot, data);
        } else {
            RunSequential(ready, snapshot, data);
        }

        report.passes.push_back(std::move(pass_names));
        pending = std::move(waiting);
    }

    report.duration_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log.Log(LogLevel::Info,
            "Finished step '" + name_ + "' in " + FormatSeconds(report.duration_s) + ".",
            step_ctx);
    return report;
}

void Step::RunSequential(const std::vector<std::size_t> &ready, Registry &snapshot,
                         Registry &data) const {
    for (std::size_t index : ready) {
        const auto &task = tasks_[index];
        WriteOutput(task, RunTask(task, snapshot), data);
    }
}

void Step::RunParallel(const std::vector<std::size_t> &ready, Registry &snapshot,
                       Registry &data) const {
    const std::size_t workers = std::max<std::size_t>(1, options_.max_workers);

    // Results are indexed like `ready`; only a prefix is filled on failure
    std::vector<std::any> outputs(ready.size());
    std::size_t completed = 0;
    std::exception_ptr failure;

    for (std::size_t begin = 0; begin < ready.size() && !failure; begin += workers) {
        const std::size_t end = std::min(ready.size(), begin + workers);

        std::vector<std::future<std::any>> batch;
        batch.reserve(end - begin);
        for (std::size_t k = begin; k < end; ++k) {
            const TaskDescriptor &task = tasks_[ready[k]];
            batch.push_back(std::async(std::launch::async, [this, &task, &snapshot] {
                return RunTask(task, snapshot);
            }));
        }

        for (std::size_t k = begin; k < end; ++k) {
            try {
                std::any output = batch[k - begin].get();
                if (!failure) {
                    outputs[k] = std::move(output);
                    completed = k + 1;
                }
            } catch (...) {
                // The first failure in registration order wins; later batch
                // members are still joined before rethrowing
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    for (std::size_t k = 0; k < completed; ++k) {
        WriteOutput(tasks_[ready[k]], std::move(outputs[k]), data);
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

std::any Step::RunTask(const TaskDescriptor &task, Registry &snapshot) const {
    LogContextManager::ScopedContext ctx(name_, task.Name());
    auto &log = GetLogService();
    log.Debug("Running task");
    try {
        const auto start = std::chrono::steady_clock::now();
        std::any output = task.Run(snapshot);
        log.Debug("Task done in " +
                  FormatSeconds(std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                              start)
                                    .count()));
        return output;
    } catch (const std::exception &e) {
        log.Error(std::string("Task failed: ") + e.what());
        throw;
    }
}

void Step::WriteOutput(const TaskDescriptor &task, std::any output, Registry &data) {
    if (task.HasOutput()) {
        data.Assign(*task.Output(), std::move(output));
    }
}

} // namespace optiframe
