#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/task_errors.hpp"
#include "core/logging/logger.hpp"
#include "loader/taskfile_loader.hpp"
#include "protocol/session_contract.hpp"
#include "runtime/executor.hpp"
#include "session/session_journal.hpp"

namespace {

std::string describe_plan(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        out += (out.empty() ? "" : " -> ") + name;
    }
    return out.empty() ? "(nothing to run)" : out;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = taskrun::core::errors;

    // 1. One session per process
    const std::string session_id = taskrun::core::config::generate_session_id();
    taskrun::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input
    auto parsed = taskrun::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        std::cerr << taskrun::app::cli::usage();
        return 2;
    }
    const auto& req = errors::get_value(parsed);
    if (req.show_help) {
        std::cout << taskrun::app::cli::usage();
        return 0;
    }
    if (req.verbose) {
        taskrun::core::logging::Logger::get().set_min_level(
            taskrun::core::logging::LogLevel::DEBUG);
    }

    // 3. Load the task collection for this session
    taskrun::loader::TaskfileLoader loader;
    auto loaded = loader.load_file(req.taskfile);
    if (errors::is_error(loaded)) {
        const auto& err = errors::get_error(loaded);
        LOG_ERROR("Taskfile error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }
    auto& taskfile = errors::get_value(loaded);
    taskfile.collection.configure(req.config_overrides.get<nlohmann::json::object_t>());

    if (req.list_tasks) {
        for (const auto& name : taskfile.collection.task_names()) {
            auto task = taskfile.collection.lookup(name);
            const std::string help =
                errors::is_error(task) ? "" : errors::get_value(task)->help();
            std::cout << "  " << name << (help.empty() ? "" : "  " + help) << "\n";
        }
        return 0;
    }

    taskrun::runtime::Executor executor(taskfile.collection, taskfile.context);
    if (req.dry_run) {
        std::unordered_set<const taskrun::tasks::Task*> planned;
        for (const auto& invocation : req.invocations) {
            auto plan = executor.plan(invocation.name, req.dedupe, planned);
            if (errors::is_error(plan)) {
                const auto& err = errors::get_error(plan);
                LOG_ERROR("Cannot plan '" + invocation.name + "' [" + err.code + "]: " +
                          err.message);
                return 1;
            }
            std::cout << describe_plan(errors::get_value(plan)) << "\n";
        }
        return 0;
    }

    std::optional<taskrun::session::SessionJournal> journal;
    if (req.journal) {
        journal.emplace(std::filesystem::current_path());
        auto started = journal->write_start(session_id, req);
        if (errors::is_error(started)) {
            const auto& err = errors::get_error(started);
            LOG_ERROR("Failed to write journal [" + err.code + "]: " + err.message);
            return 6;
        }
    }

    // 4. Run each requested task in the same session, so dedupe spans all of them
    std::optional<errors::TaskError> failure;
    std::size_t completed = 0;
    for (const auto& invocation : req.invocations) {
        LOG_INFO("Running task '" + invocation.name + "'");
        auto outcome = executor.execute(invocation.name, invocation.kwargs, req.dedupe);

        taskrun::protocol::InvocationRecord record;
        record.task_name = invocation.name;
        record.kwargs = invocation.kwargs;
        record.success = !errors::is_error(outcome);
        if (record.success) {
            record.result = errors::get_value(outcome);
            ++completed;
        } else {
            record.error = errors::get_error(outcome);
        }

        if (journal) {
            auto written = journal->write_invocation(session_id, record);
            if (errors::is_error(written)) {
                const auto& err = errors::get_error(written);
                LOG_ERROR("Failed to write journal [" + err.code + "]: " + err.message);
                return 6;
            }
        }

        if (!record.success) {
            failure = record.error;
            if (!failure->hint.empty()) {
                LOG_INFO("Hint: " + failure->hint);
            }
            break;
        }
    }

    const std::string summary = std::to_string(completed) + " of " +
                                std::to_string(req.invocations.size()) +
                                " task invocation(s) completed.";
    LOG_INFO(summary);

    if (journal) {
        auto written = journal->write_final(
            session_id,
            failure ? taskrun::protocol::SessionStatus::Failed
                    : taskrun::protocol::SessionStatus::Completed,
            summary,
            failure ? std::optional<std::string>(failure->message) : std::nullopt);
        if (errors::is_error(written)) {
            const auto& err = errors::get_error(written);
            LOG_ERROR("Failed to write journal [" + err.code + "]: " + err.message);
            return 6;
        }
        LOG_INFO("Journal: " + errors::get_value(written).string());
    }

    return failure ? 1 : 0;
}
