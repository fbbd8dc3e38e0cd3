#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/context.hpp"
#include "core/errors/task_errors.hpp"

namespace taskrun::tasks {

struct TaskParameter {
    std::string name;
    bool required = false;
    nlohmann::json default_value;  // null means "no default"
};

// Arguments of a single invocation. `context` is set only for contextualized tasks.
struct TaskCall {
    std::optional<core::config::Context> context;
    nlohmann::json kwargs = nlohmann::json::object();
};

using TaskBody =
    std::function<core::errors::Result<nlohmann::json>(const TaskCall& call)>;

struct TaskDefinition {
    std::string name;
    std::vector<std::string> pre;  // one level only, in declaration order
    bool contextualized = false;
    std::vector<std::string> aliases;
    std::string help;
    // When unset the task accepts any keyword arguments.
    std::optional<std::vector<TaskParameter>> parameters;
    TaskBody body;
};

class Task {
public:
    explicit Task(TaskDefinition definition);

    const std::string& name() const { return definition_.name; }
    const std::vector<std::string>& pre() const { return definition_.pre; }
    bool contextualized() const { return definition_.contextualized; }
    const std::vector<std::string>& aliases() const { return definition_.aliases; }
    const std::string& help() const { return definition_.help; }
    const std::optional<std::vector<TaskParameter>>& parameters() const {
        return definition_.parameters;
    }

    bool called() const { return times_called_ > 0; }
    std::size_t times_called() const { return times_called_; }

    // Runs the body. Marks the task called only when the body succeeds.
    core::errors::Result<nlohmann::json> invoke(const TaskCall& call);

private:
    core::errors::Result<nlohmann::json> bind_arguments(
        const nlohmann::json& kwargs) const;

    TaskDefinition definition_;
    std::size_t times_called_ = 0;
};

}  // namespace taskrun::tasks
