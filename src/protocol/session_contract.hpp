#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"

namespace taskrun::protocol {

enum class SessionStatus {
    Completed,
    Failed
};

// Outcome of one Executor::execute() call.
struct InvocationRecord {
    std::string task_name;
    nlohmann::json kwargs = nlohmann::json::object();
    bool success = false;
    nlohmann::json result;
    std::optional<core::errors::TaskError> error;
};

inline std::string to_string(const SessionStatus status) {
    switch (status) {
        case SessionStatus::Completed:
            return "completed";
        case SessionStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace taskrun::protocol
