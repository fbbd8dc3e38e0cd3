#pragma once
#include <string>
#include <variant>

namespace taskrun::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or kwargs a task does not accept
        Lookup,     // E.g., a dotted task name that does not resolve
        Execution,  // E.g., a task body or shell command failed
        Config,     // E.g., malformed taskfile or duplicate task name
        Internal    // E.g., fork/pipe failure
    };

    // The standardized error payload
    struct TaskError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a TaskError.
    template <typename T>
    using Result = std::variant<T, TaskError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TaskError>(result);
    }

    template <typename T>
    const TaskError& get_error(const Result<T>& result) {
        return std::get<TaskError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Lookup:    return "lookup";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace taskrun::core::errors
