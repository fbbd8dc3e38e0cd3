#include "session/session_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace taskrun::session {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::RunRequest& request) {
    json invocations = json::array();
    for (const auto& invocation : request.invocations) {
        json entry;
        entry["name"] = invocation.name;
        entry["kwargs"] = invocation.kwargs;
        invocations.push_back(entry);
    }

    json payload;
    payload["taskfile"] = request.taskfile.string();
    payload["dedupe"] = request.dedupe;
    payload["dry_run"] = request.dry_run;
    payload["config_overrides"] = request.config_overrides;
    payload["invocations"] = invocations;
    return payload;
}

json record_to_json(const protocol::InvocationRecord& record) {
    json payload;
    payload["task"] = record.task_name;
    payload["kwargs"] = record.kwargs;
    payload["success"] = record.success;
    payload["result"] = record.result;
    if (record.error.has_value()) {
        payload["error"] = {{"category", core::errors::to_string(record.error->category)},
                            {"code", record.error->code},
                            {"message", record.error->message}};
    } else {
        payload["error"] = nullptr;
    }
    return payload;
}

json make_event(const std::string& event, const std::string& session_id, json payload) {
    json out;
    out["ts_unix_ms"] = now_unix_ms();
    out["event"] = event;
    out["session_id"] = session_id;
    out["payload"] = std::move(payload);
    return out;
}

}  // namespace

SessionJournal::SessionJournal(std::filesystem::path root,
                               std::filesystem::path journal_subdir)
    : root_(std::move(root)), journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> SessionJournal::journal_path(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return TaskError{ErrorCategory::Input, "Session ID cannot be empty.",
                         "invalid_session_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return TaskError{ErrorCategory::Input,
                         "Journal root is not a directory: " + root_.string(),
                         "invalid_journal_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return TaskError{ErrorCategory::Input,
                         "Unable to resolve journal root: " + root_.string(),
                         "invalid_journal_root"};
    }

    const auto journal_dir = canonical_root / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return TaskError{ErrorCategory::Internal,
                         "Unable to create journal directory: " + journal_dir.string(),
                         "journal_dir_create_failed"};
    }

    return journal_dir / (session_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> SessionJournal::append_event(
    const std::string& session_id, const std::string& event_json) const {
    auto path_result = journal_path(session_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return TaskError{ErrorCategory::Internal,
                         "Unable to open journal file: " + path.string(),
                         "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return TaskError{ErrorCategory::Internal,
                         "Unable to write journal event: " + path.string(),
                         "journal_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> SessionJournal::write_start(
    const std::string& session_id, const protocol::RunRequest& request) const {
    return append_event(session_id,
                        make_event("session_start", session_id, request_to_json(request)).dump());
}

core::errors::Result<std::filesystem::path> SessionJournal::write_invocation(
    const std::string& session_id, const protocol::InvocationRecord& record) const {
    return append_event(session_id,
                        make_event("invocation", session_id, record_to_json(record)).dump());
}

core::errors::Result<std::filesystem::path> SessionJournal::write_final(
    const std::string& session_id, const protocol::SessionStatus status,
    const std::string& summary, const std::optional<std::string>& error_message) const {
    json payload;
    payload["status"] = protocol::to_string(status);
    payload["summary"] = summary;
    payload["error_message"] = error_message.has_value() ? error_message.value() : "";
    return append_event(session_id, make_event("final", session_id, payload).dump());
}

}  // namespace taskrun::session
