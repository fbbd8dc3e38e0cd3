#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/context.hpp"
#include "core/errors/task_errors.hpp"
#include "tasks/collection.hpp"
#include "tasks/task.hpp"

namespace taskrun::loader {

struct LoaderOptions {
    bool echo_output = true;             // copy each command's stdout to std::cout
    std::uint32_t default_timeout_ms = 0;  // per command, 0 means none
};

// A loaded taskfile: the session's Collection plus the executor's base context.
struct Taskfile {
    std::filesystem::path path;
    tasks::Collection collection;
    core::config::Context context;
};

class TaskfileLoader {
public:
    explicit TaskfileLoader(LoaderOptions options = {});

    core::errors::Result<Taskfile> load_file(const std::filesystem::path& path) const;

    // `base_dir` anchors relative "cwd" entries.
    core::errors::Result<Taskfile> load_json(const nlohmann::json& document,
                                             const std::filesystem::path& base_dir) const;

private:
    core::errors::Result<tasks::Collection> build_collection(
        const std::string& name, const nlohmann::json& node, const std::string& json_path,
        const std::filesystem::path& base_dir) const;

    core::errors::Result<tasks::TaskDefinition> build_task(
        const std::string& name, const nlohmann::json& node, const std::string& json_path,
        const std::filesystem::path& base_dir) const;

    LoaderOptions options_;
};

// Fills {name} placeholders from kwargs, then from the context (dotted keys).
// Substituted values are single-quoted; "{{" and "}}" produce literal braces.
core::errors::Result<std::string> render_command(const std::string& command_template,
                                                 const tasks::TaskCall& call);

}  // namespace taskrun::loader
