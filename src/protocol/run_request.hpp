#pragma once
#include <string>
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

namespace taskrun::protocol {

    // One task named on the command line, with its own keyword arguments.
    struct TaskInvocation {
        std::string name;
        nlohmann::json kwargs = nlohmann::json::object();
    };

    // Validated command-line input for one session
    struct RunRequest {
        std::filesystem::path taskfile = "taskfile.json";
        std::vector<TaskInvocation> invocations;
        nlohmann::json config_overrides = nlohmann::json::object();
        bool dedupe = true;
        bool list_tasks = false;
        bool dry_run = false;
        bool journal = false;
        bool verbose = false;
        bool show_help = false;
    };

} // namespace taskrun::protocol
