#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/task_errors.hpp"

namespace taskrun::tools {

struct CommandRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 0;  // 0 disables the timeout
};

struct CommandOutcome {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

// Runs commands through /bin/sh, capturing both output streams.
class CommandRunner {
public:
    core::errors::Result<CommandOutcome> run(const CommandRequest& request) const;
};

// Wraps a value in single quotes for the shell.
std::string shell_quote(const std::string& value);

}  // namespace taskrun::tools
