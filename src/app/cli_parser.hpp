#pragma once
#include <string>
#include "protocol/run_request.hpp"
#include "core/errors/task_errors.hpp"

namespace taskrun::app::cli {
    taskrun::core::errors::Result<taskrun::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
