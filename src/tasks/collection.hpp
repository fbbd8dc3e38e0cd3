#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"
#include "tasks/task.hpp"

namespace taskrun::tasks {

// Registry of tasks and nested namespaces for one session. Owns every Task, and
// with it the per-session "called" state.
class Collection {
public:
    explicit Collection(std::string name = "");

    Collection(Collection&&) = default;
    Collection& operator=(Collection&&) = default;
    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    const std::string& name() const { return name_; }

    core::errors::Result<std::string> add_task(TaskDefinition definition);
    core::errors::Result<std::string> add_collection(Collection collection);
    core::errors::Result<std::string> set_default(const std::string& task_name);
    const std::optional<std::string>& default_task() const { return default_task_; }

    // Deep-merges into this collection's own configuration.
    void configure(const nlohmann::json::object_t& values);
    const nlohmann::json& local_configuration() const { return configuration_; }

    // Resolves "task", "alias", "ns.task", "ns" (namespace default) or "" (default).
    core::errors::Result<Task*> lookup(const std::string& name);
    core::errors::Result<const Task*> lookup(const std::string& name) const;

    // Configuration for the task at `name`, merged along its namespace path.
    // Outer collections win over inner ones on conflicting keys.
    core::errors::Result<nlohmann::json> configuration(const std::string& name) const;

    std::vector<std::string> task_names() const;
    std::size_t size() const;

private:
    core::errors::Result<std::string> check_new_name(const std::string& name,
                                                     const std::string& what) const;
    core::errors::Result<const Task*> resolve(const std::string& name,
                                              const std::string& full_name) const;
    core::errors::Result<nlohmann::json> resolve_configuration(
        const std::string& name, const std::string& full_name) const;
    void collect_names(const std::string& prefix, std::vector<std::string>& out) const;

    std::string name_;
    std::map<std::string, std::unique_ptr<Task>> tasks_;
    std::map<std::string, std::string> aliases_;
    std::map<std::string, std::unique_ptr<Collection>> collections_;
    std::optional<std::string> default_task_;
    nlohmann::json configuration_ = nlohmann::json::object();
};

}  // namespace taskrun::tasks
