#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/context.hpp"
#include "core/errors/task_errors.hpp"
#include "tasks/collection.hpp"

namespace taskrun::runtime {

// Runs a task and its declared pre-tasks against a Collection. Task state
// (called / not called) lives in the Collection, so consecutive execute() calls
// on the same Collection share one session.
class Executor {
public:
    explicit Executor(tasks::Collection& collection,
                      core::config::Context context = core::config::Context());

    // Runs `name` after its pre-tasks (one level, declaration order), passing the
    // same kwargs to every task. With dedupe, repeated names collapse to their
    // first occurrence and tasks already called this session are skipped.
    // Returns the named task's result. If dedupe skipped the named task itself,
    // no result exists for this call and a "missing_result" error is returned.
    core::errors::Result<nlohmann::json> execute(
        const std::string& name,
        const nlohmann::json& kwargs = nlohmann::json::object(),
        bool dedupe = true);

    // The ordered list of task names execute() would run, without running them.
    core::errors::Result<std::vector<std::string>> plan(const std::string& name,
                                                        bool dedupe = true) const;

    // Plans one invocation of a multi-task session without running anything.
    // With dedupe, tasks in `planned` count as already called; every task in the
    // returned list is added to `planned` for the next invocation.
    core::errors::Result<std::vector<std::string>> plan(
        const std::string& name, bool dedupe,
        std::unordered_set<const tasks::Task*>& planned) const;

    const core::config::Context& context() const { return context_; }

private:
    core::errors::Result<std::vector<std::string>> expand(
        const tasks::Task& task, const std::string& name, bool dedupe,
        const std::unordered_set<const tasks::Task*>* planned = nullptr) const;

    tasks::Collection& collection_;
    core::config::Context context_;
};

}  // namespace taskrun::runtime
