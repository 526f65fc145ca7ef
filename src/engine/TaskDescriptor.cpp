/**
 * @file TaskDescriptor.cpp
 * @brief Task metadata queries
 */

#include <optiframe/engine/TaskDescriptor.hpp>

#include <algorithm>

namespace optiframe {

TaskDescriptor::TaskDescriptor(std::string name, std::vector<Dependency> dependencies,
                               std::optional<TypeKey> output, Runner runner)
    : name_(std::move(name)), dependencies_(std::move(dependencies)), output_(std::move(output)),
      runner_(std::move(runner)) {
    if (!runner_) {
        throw ConfigError("task '" + name_ + "' has no runner");
    }
}

bool TaskDescriptor::DependsOn(const TypeKey &key) const {
    return std::any_of(dependencies_.begin(), dependencies_.end(),
                       [&key](const Dependency &dep) { return dep.key == key; });
}

std::vector<Dependency> TaskDescriptor::MissingIn(const Registry &data) const {
    std::vector<Dependency> missing;
    for (const auto &dep : dependencies_) {
        if (!data.Contains(dep.key)) {
            missing.push_back(dep);
        }
    }
    return missing;
}

std::vector<Dependency>
TaskDescriptor::MissingIn(const std::unordered_set<TypeKey> &available) const {
    std::vector<Dependency> missing;
    for (const auto &dep : dependencies_) {
        if (!available.contains(dep.key)) {
            missing.push_back(dep);
        }
    }
    return missing;
}

StuckTask TaskDescriptor::ToStuck(const std::vector<Dependency> &missing) const {
    StuckTask stuck{.task = name_, .missing = {}};
    stuck.missing.reserve(missing.size());
    for (const auto &dep : missing) {
        stuck.missing.push_back(
            MissingDependency{.parameter = dep.parameter, .type = dep.key.Name()});
    }
    return stuck;
}

} // namespace optiframe
