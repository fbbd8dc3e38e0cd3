#include "tasks/collection.hpp"

#include <algorithm>
#include <utility>
#include "core/config/context.hpp"

namespace taskrun::tasks {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;

namespace {

TaskError task_not_found(const std::string& full_name) {
    if (full_name.empty()) {
        return TaskError{ErrorCategory::Lookup, "No task name given and no default task is set.",
                         "task_not_found", "Name a task, or use --list to see them."};
    }
    return TaskError{ErrorCategory::Lookup, "Task not found: " + full_name,
                     "task_not_found", "Use --list to see available tasks."};
}

}  // namespace

Collection::Collection(std::string name) : name_(std::move(name)) {}

core::errors::Result<std::string> Collection::check_new_name(
    const std::string& name, const std::string& what) const {
    if (name.empty()) {
        return TaskError{ErrorCategory::Config, what + " name cannot be empty.",
                         "invalid_task_name"};
    }
    if (name.find('.') != std::string::npos) {
        return TaskError{ErrorCategory::Config,
                         what + " name cannot contain '.': " + name,
                         "invalid_task_name"};
    }
    if (tasks_.count(name) != 0 || aliases_.count(name) != 0 ||
        collections_.count(name) != 0) {
        return TaskError{ErrorCategory::Config,
                         "Name already in use in collection '" + name_ + "': " + name,
                         "duplicate_task"};
    }
    return name;
}

core::errors::Result<std::string> Collection::add_task(TaskDefinition definition) {
    auto checked = check_new_name(definition.name, "Task");
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    for (const auto& alias : definition.aliases) {
        if (alias == definition.name) {
            continue;
        }
        auto alias_checked = check_new_name(alias, "Alias");
        if (core::errors::is_error(alias_checked)) {
            return core::errors::get_error(alias_checked);
        }
    }

    const std::string task_name = definition.name;
    for (const auto& alias : definition.aliases) {
        if (alias != task_name) {
            aliases_[alias] = task_name;
        }
    }
    tasks_.emplace(task_name, std::make_unique<Task>(std::move(definition)));
    return task_name;
}

core::errors::Result<std::string> Collection::add_collection(Collection collection) {
    auto checked = check_new_name(collection.name(), "Collection");
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    const std::string child_name = collection.name();
    collections_.emplace(child_name, std::make_unique<Collection>(std::move(collection)));
    return child_name;
}

core::errors::Result<std::string> Collection::set_default(const std::string& task_name) {
    if (tasks_.count(task_name) == 0) {
        return TaskError{ErrorCategory::Config,
                         "Default task '" + task_name + "' is not a task of collection '" +
                             name_ + "'.",
                         "task_not_found"};
    }
    default_task_ = task_name;
    return task_name;
}

void Collection::configure(const json::object_t& values) {
    core::config::deep_merge(configuration_, json(values));
}

core::errors::Result<const Task*> Collection::resolve(const std::string& name,
                                                      const std::string& full_name) const {
    if (name.empty()) {
        if (!default_task_.has_value()) {
            return task_not_found(full_name);
        }
        return static_cast<const Task*>(tasks_.at(default_task_.value()).get());
    }

    const auto dot = name.find('.');
    if (dot != std::string::npos && dot + 1 == name.size()) {
        return task_not_found(full_name);
    }
    const std::string head = name.substr(0, dot);
    const auto child = collections_.find(head);
    if (child != collections_.end()) {
        const std::string rest = dot == std::string::npos ? "" : name.substr(dot + 1);
        return child->second->resolve(rest, full_name);
    }
    if (dot != std::string::npos) {
        return task_not_found(full_name);
    }

    auto task = tasks_.find(name);
    if (task == tasks_.end()) {
        const auto alias = aliases_.find(name);
        if (alias == aliases_.end()) {
            return task_not_found(full_name);
        }
        task = tasks_.find(alias->second);
    }
    return static_cast<const Task*>(task->second.get());
}

core::errors::Result<const Task*> Collection::lookup(const std::string& name) const {
    return resolve(name, name);
}

core::errors::Result<Task*> Collection::lookup(const std::string& name) {
    auto resolved = resolve(name, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    // Every Task is owned by a non-const Collection reachable from this one.
    return const_cast<Task*>(core::errors::get_value(resolved));
}

core::errors::Result<json> Collection::resolve_configuration(
    const std::string& name, const std::string& full_name) const {
    const auto dot = name.find('.');
    if (dot != std::string::npos && dot + 1 == name.size()) {
        return task_not_found(full_name);
    }
    const std::string head = name.substr(0, dot);
    const auto child = collections_.find(head);
    if (!name.empty() && child != collections_.end()) {
        const std::string rest = dot == std::string::npos ? "" : name.substr(dot + 1);
        auto inner = child->second->resolve_configuration(rest, full_name);
        if (core::errors::is_error(inner)) {
            return inner;
        }
        json merged = core::errors::get_value(inner);
        core::config::deep_merge(merged, configuration_);
        return merged;
    }

    auto resolved = resolve(name, full_name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    return configuration_;
}

core::errors::Result<json> Collection::configuration(const std::string& name) const {
    return resolve_configuration(name, name);
}

void Collection::collect_names(const std::string& prefix,
                               std::vector<std::string>& out) const {
    for (const auto& entry : tasks_) {
        out.push_back(prefix + entry.first);
    }
    for (const auto& entry : collections_) {
        entry.second->collect_names(prefix + entry.first + ".", out);
    }
}

std::vector<std::string> Collection::task_names() const {
    std::vector<std::string> names;
    collect_names("", names);
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t Collection::size() const {
    std::size_t count = tasks_.size();
    for (const auto& entry : collections_) {
        count += entry.second->size();
    }
    return count;
}

}  // namespace taskrun::tasks
