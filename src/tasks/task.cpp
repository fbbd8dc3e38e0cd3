#include "tasks/task.hpp"

#include <exception>
#include <utility>

namespace taskrun::tasks {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;

Task::Task(TaskDefinition definition) : definition_(std::move(definition)) {}

core::errors::Result<json> Task::bind_arguments(const json& kwargs) const {
    if (kwargs.is_null()) {
        return bind_arguments(json::object());
    }
    if (!kwargs.is_object()) {
        return TaskError{ErrorCategory::Input,
                         "Task '" + name() + "' expects keyword arguments as an object.",
                         "invalid_arguments"};
    }
    if (!definition_.parameters.has_value()) {
        return kwargs;
    }

    const auto& params = definition_.parameters.value();
    for (auto it = kwargs.begin(); it != kwargs.end(); ++it) {
        bool declared = false;
        for (const auto& param : params) {
            if (param.name == it.key()) {
                declared = true;
                break;
            }
        }
        if (!declared) {
            return TaskError{ErrorCategory::Input,
                             "Task '" + name() + "' got an unexpected keyword argument '" +
                                 it.key() + "'.",
                             "unexpected_argument"};
        }
    }

    json bound = kwargs;
    for (const auto& param : params) {
        if (bound.contains(param.name)) {
            continue;
        }
        if (param.required) {
            return TaskError{ErrorCategory::Input,
                             "Task '" + name() + "' is missing required argument '" +
                                 param.name + "'.",
                             "missing_argument",
                             "Pass it as --" + param.name + " <value>."};
        }
        if (!param.default_value.is_null()) {
            bound[param.name] = param.default_value;
        }
    }
    return bound;
}

core::errors::Result<json> Task::invoke(const TaskCall& call) {
    if (!definition_.body) {
        return TaskError{ErrorCategory::Internal,
                         "Task '" + name() + "' has no body.", "task_has_no_body"};
    }
    if (contextualized() && !call.context.has_value()) {
        return TaskError{ErrorCategory::Input,
                         "Task '" + name() + "' is contextualized but was called without a context.",
                         "missing_context"};
    }
    if (!contextualized() && call.context.has_value()) {
        return TaskError{ErrorCategory::Input,
                         "Task '" + name() + "' does not take a context.",
                         "unexpected_context"};
    }

    auto bound = bind_arguments(call.kwargs);
    if (core::errors::is_error(bound)) {
        return core::errors::get_error(bound);
    }

    TaskCall effective;
    effective.context = call.context;
    effective.kwargs = core::errors::get_value(bound);

    core::errors::Result<json> result = json();
    try {
        result = definition_.body(effective);
    } catch (const std::exception& e) {
        return TaskError{ErrorCategory::Execution,
                         "Task '" + name() + "' raised: " + e.what(),
                         "invocation_failed"};
    }

    if (core::errors::is_error(result)) {
        return result;
    }
    ++times_called_;
    return result;
}

}  // namespace taskrun::tasks
