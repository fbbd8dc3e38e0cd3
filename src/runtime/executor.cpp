#include "runtime/executor.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>
#include "core/logging/logger.hpp"

namespace taskrun::runtime {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;
using tasks::Task;
using tasks::TaskCall;

namespace {

std::string describe(const std::vector<std::string>& names) {
    std::string out = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += "'" + names[i] + "'";
    }
    return out + "]";
}

}  // namespace

Executor::Executor(tasks::Collection& collection, core::config::Context context)
    : collection_(collection), context_(std::move(context)) {}

core::errors::Result<std::vector<std::string>> Executor::expand(
    const Task& task, const std::string& name, const bool dedupe,
    const std::unordered_set<const Task*>* planned) const {
    std::vector<std::string> task_names = task.pre();
    task_names.push_back(name);
    LOG_DEBUG("Task list, including pre-tasks: " + describe(task_names));

    if (!dedupe) {
        LOG_DEBUG("Deduplication is disabled, full task list will run");
        return task_names;
    }

    std::vector<std::string> compact;
    for (const auto& task_name : task_names) {
        if (std::find(compact.begin(), compact.end(), task_name) == compact.end()) {
            compact.push_back(task_name);
        }
    }
    LOG_DEBUG("Task list, duplicates removed: " + describe(compact));

    std::vector<std::string> pending;
    for (const auto& task_name : compact) {
        auto resolved = collection_.lookup(task_name);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        const Task* candidate = core::errors::get_value(resolved);
        const bool seen = planned != nullptr && planned->count(candidate) > 0;
        if (!candidate->called() && !seen) {
            pending.push_back(task_name);
        }
    }
    LOG_DEBUG("Task list, already-called tasks removed: " + describe(pending));
    return pending;
}

core::errors::Result<std::vector<std::string>> Executor::plan(const std::string& name,
                                                              const bool dedupe) const {
    const tasks::Collection& collection = collection_;
    auto root = collection.lookup(name);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    return expand(*core::errors::get_value(root), name, dedupe);
}

core::errors::Result<std::vector<std::string>> Executor::plan(
    const std::string& name, const bool dedupe,
    std::unordered_set<const Task*>& planned) const {
    const tasks::Collection& collection = collection_;
    auto root = collection.lookup(name);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    auto expanded = expand(*core::errors::get_value(root), name, dedupe, &planned);
    if (core::errors::is_error(expanded)) {
        return expanded;
    }
    for (const auto& task_name : core::errors::get_value(expanded)) {
        auto resolved = collection.lookup(task_name);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }
        planned.insert(core::errors::get_value(resolved));
    }
    return expanded;
}

core::errors::Result<json> Executor::execute(const std::string& name, const json& kwargs,
                                             const bool dedupe) {
    auto root_result = collection_.lookup(name);
    if (core::errors::is_error(root_result)) {
        LOG_ERROR(core::errors::get_error(root_result).message);
        return core::errors::get_error(root_result);
    }
    const Task* root = core::errors::get_value(root_result);
    LOG_DEBUG("Executor is examining top level task '" + root->name() + "'");

    auto expanded = expand(*root, name, dedupe);
    if (core::errors::is_error(expanded)) {
        LOG_ERROR(core::errors::get_error(expanded).message);
        return core::errors::get_error(expanded);
    }
    const auto& task_names = core::errors::get_value(expanded);

    const json shared_kwargs = kwargs.is_null() ? json::object() : kwargs;
    std::unordered_map<const Task*, json> results;
    for (const auto& task_name : task_names) {
        auto resolved = collection_.lookup(task_name);
        if (core::errors::is_error(resolved)) {
            LOG_ERROR(core::errors::get_error(resolved).message);
            return core::errors::get_error(resolved);
        }
        Task* task = core::errors::get_value(resolved);
        LOG_DEBUG("Executing '" + task->name() + "'");

        TaskCall call;
        call.kwargs = shared_kwargs;
        if (task->contextualized()) {
            auto config = collection_.configuration(task_name);
            if (core::errors::is_error(config)) {
                LOG_ERROR(core::errors::get_error(config).message);
                return core::errors::get_error(config);
            }
            core::config::Context context = context_.clone();
            auto updated = context.update(core::errors::get_value(config));
            if (core::errors::is_error(updated)) {
                LOG_ERROR("Configuration for '" + task->name() + "' could not be applied: " +
                          core::errors::get_error(updated).message);
                return core::errors::get_error(updated);
            }
            call.context = std::move(context);
        }

        auto outcome = task->invoke(call);
        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            LOG_ERROR("Task '" + task->name() + "' failed [" + err.code + "]: " +
                      err.message);
            return err;
        }
        results[task] = core::errors::get_value(outcome);
    }

    const auto found = results.find(root);
    if (found == results.end()) {
        TaskError err{ErrorCategory::Lookup,
                      "No result for task '" + root->name() +
                          "': it already ran this session and was deduplicated.",
                      "missing_result",
                      "Disable deduplication to run it again."};
        LOG_ERROR(err.message);
        return err;
    }
    return found->second;
}

}  // namespace taskrun::runtime
