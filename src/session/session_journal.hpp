#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/task_errors.hpp"
#include "protocol/run_request.hpp"
#include "protocol/session_contract.hpp"

namespace taskrun::session {

// Append-only JSON Lines record of one session: <root>/<subdir>/<session_id>.jsonl
class SessionJournal {
public:
    explicit SessionJournal(std::filesystem::path root,
                            std::filesystem::path journal_subdir = ".taskrun");

    core::errors::Result<std::filesystem::path> write_start(
        const std::string& session_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_invocation(
        const std::string& session_id, const protocol::InvocationRecord& record) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& session_id, protocol::SessionStatus status,
        const std::string& summary,
        const std::optional<std::string>& error_message = std::nullopt) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& session_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& session_id, const std::string& event_json) const;

    std::filesystem::path root_;
    std::filesystem::path journal_subdir_;
};

}  // namespace taskrun::session
