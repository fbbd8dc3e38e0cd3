#include "loader/taskfile_loader.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/command_runner.hpp"

namespace taskrun::loader {

using core::errors::ErrorCategory;
using core::errors::TaskError;
using nlohmann::json;
using tasks::Collection;
using tasks::TaskCall;
using tasks::TaskDefinition;
using tasks::TaskParameter;

namespace {

TaskError invalid(const std::string& json_path, const std::string& message) {
    return TaskError{ErrorCategory::Config, json_path + ": " + message, "invalid_taskfile"};
}

std::string join_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string placeholder_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

core::errors::Result<std::vector<std::string>> read_string_list(const json& node,
                                                                const std::string& json_path) {
    if (!node.is_array()) {
        return invalid(json_path, "expected an array of strings");
    }
    std::vector<std::string> values;
    for (std::size_t i = 0; i < node.size(); ++i) {
        if (!node[i].is_string()) {
            return invalid(json_path + "[" + std::to_string(i) + "]", "expected a string");
        }
        values.push_back(node[i].get<std::string>());
    }
    return values;
}

core::errors::Result<std::vector<TaskParameter>> read_parameters(const json& node,
                                                                 const std::string& json_path) {
    if (!node.is_object()) {
        return invalid(json_path, "expected an object of parameters");
    }
    std::vector<TaskParameter> params;
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string param_path = join_path(json_path, it.key());
        if (!it->is_object()) {
            return invalid(param_path, "expected an object");
        }
        TaskParameter param;
        param.name = it.key();
        if (it->contains("required")) {
            if (!it->at("required").is_boolean()) {
                return invalid(param_path + ".required", "expected a boolean");
            }
            param.required = it->at("required").get<bool>();
        }
        if (it->contains("default")) {
            param.default_value = it->at("default");
        }
        params.push_back(std::move(param));
    }
    return params;
}

tasks::TaskBody make_shell_body(const std::string& task_name, const std::string& command_template,
                                const std::filesystem::path& cwd, const std::uint32_t timeout_ms,
                                const bool echo_output) {
    return [=](const TaskCall& call) -> core::errors::Result<json> {
        auto rendered = render_command(command_template, call);
        if (core::errors::is_error(rendered)) {
            return core::errors::get_error(rendered);
        }

        tools::CommandRequest request;
        request.command = core::errors::get_value(rendered);
        request.working_directory = cwd;
        request.timeout_ms = timeout_ms;
        LOG_DEBUG("Task '" + task_name + "' running: " + request.command);

        tools::CommandRunner runner;
        auto ran = runner.run(request);
        if (core::errors::is_error(ran)) {
            return core::errors::get_error(ran);
        }
        const auto& outcome = core::errors::get_value(ran);
        if (echo_output && !outcome.stdout_text.empty()) {
            std::cout << outcome.stdout_text << std::flush;
        }

        if (!outcome.succeeded()) {
            std::string reason = outcome.timed_out
                                     ? "timed out after " + std::to_string(timeout_ms) + " ms"
                                     : "exited with code " + std::to_string(outcome.exit_code);
            return TaskError{ErrorCategory::Execution,
                             "Command for task '" + task_name + "' " + reason + ".",
                             "command_failed", outcome.stderr_text};
        }

        json result;
        result["command"] = request.command;
        result["exit_code"] = outcome.exit_code;
        result["stdout"] = outcome.stdout_text;
        result["stderr"] = outcome.stderr_text;
        result["duration_ms"] = outcome.duration_ms;
        return result;
    };
}

}  // namespace

core::errors::Result<std::string> render_command(const std::string& command_template,
                                                 const TaskCall& call) {
    std::string out;
    out.reserve(command_template.size());
    for (std::size_t i = 0; i < command_template.size(); ++i) {
        const char c = command_template[i];
        const bool doubled = i + 1 < command_template.size() && command_template[i + 1] == c;
        if (c == '}') {
            if (!doubled) {
                return TaskError{ErrorCategory::Input,
                                 "Unmatched '}' in command: " + command_template,
                                 "invalid_command_template"};
            }
            out.push_back('}');
            ++i;
            continue;
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        if (doubled) {
            out.push_back('{');
            ++i;
            continue;
        }

        const auto close = command_template.find('}', i + 1);
        if (close == std::string::npos) {
            return TaskError{ErrorCategory::Input,
                             "Unterminated placeholder in command: " + command_template,
                             "invalid_command_template"};
        }
        const std::string key = command_template.substr(i + 1, close - i - 1);

        std::optional<json> value;
        if (call.kwargs.is_object() && call.kwargs.contains(key)) {
            value = call.kwargs.at(key);
        } else if (call.context.has_value()) {
            value = call.context->find(key);
        }
        if (!value.has_value()) {
            return TaskError{ErrorCategory::Input,
                             "No value for placeholder {" + key + "}.",
                             "unresolved_placeholder",
                             "Pass --" + key + " <value> or set it in the task configuration."};
        }
        out += tools::shell_quote(placeholder_text(value.value()));
        i = close;
    }
    return out;
}

TaskfileLoader::TaskfileLoader(LoaderOptions options) : options_(options) {}

core::errors::Result<TaskDefinition> TaskfileLoader::build_task(
    const std::string& name, const json& node, const std::string& json_path,
    const std::filesystem::path& base_dir) const {
    if (!node.is_object()) {
        return invalid(json_path, "expected a task object");
    }

    TaskDefinition definition;
    definition.name = name;

    if (node.contains("pre")) {
        auto pre = read_string_list(node.at("pre"), json_path + ".pre");
        if (core::errors::is_error(pre)) {
            return core::errors::get_error(pre);
        }
        definition.pre = core::errors::get_value(pre);
    }
    if (node.contains("aliases")) {
        auto aliases = read_string_list(node.at("aliases"), json_path + ".aliases");
        if (core::errors::is_error(aliases)) {
            return core::errors::get_error(aliases);
        }
        definition.aliases = core::errors::get_value(aliases);
    }
    if (node.contains("contextualized")) {
        if (!node.at("contextualized").is_boolean()) {
            return invalid(json_path + ".contextualized", "expected a boolean");
        }
        definition.contextualized = node.at("contextualized").get<bool>();
    }
    if (node.contains("help")) {
        if (!node.at("help").is_string()) {
            return invalid(json_path + ".help", "expected a string");
        }
        definition.help = node.at("help").get<std::string>();
    }
    if (node.contains("parameters")) {
        auto params = read_parameters(node.at("parameters"), json_path + ".parameters");
        if (core::errors::is_error(params)) {
            return core::errors::get_error(params);
        }
        definition.parameters = core::errors::get_value(params);
    }

    std::uint32_t timeout_ms = options_.default_timeout_ms;
    if (node.contains("timeout_ms")) {
        if (!node.at("timeout_ms").is_number_unsigned()) {
            return invalid(json_path + ".timeout_ms", "expected a non-negative integer");
        }
        const auto requested = node.at("timeout_ms").get<std::uint64_t>();
        if (requested > std::numeric_limits<std::uint32_t>::max()) {
            return invalid(json_path + ".timeout_ms",
                           "must not exceed " +
                               std::to_string(std::numeric_limits<std::uint32_t>::max()));
        }
        timeout_ms = static_cast<std::uint32_t>(requested);
    }

    std::filesystem::path cwd = base_dir;
    if (node.contains("cwd")) {
        if (!node.at("cwd").is_string()) {
            return invalid(json_path + ".cwd", "expected a string");
        }
        const std::filesystem::path requested = node.at("cwd").get<std::string>();
        cwd = requested.is_relative() ? base_dir / requested : requested;
    }

    if (!node.contains("run")) {
        // Grouping task: only its pre-tasks do work.
        definition.body = [](const TaskCall&) -> core::errors::Result<json> { return json(); };
        return definition;
    }
    if (!node.at("run").is_string() || node.at("run").get<std::string>().empty()) {
        return invalid(json_path + ".run", "expected a non-empty command string");
    }
    definition.body = make_shell_body(name, node.at("run").get<std::string>(), cwd, timeout_ms,
                                      options_.echo_output);
    return definition;
}

core::errors::Result<Collection> TaskfileLoader::build_collection(
    const std::string& name, const json& node, const std::string& json_path,
    const std::filesystem::path& base_dir) const {
    if (!node.is_object()) {
        return invalid(json_path.empty() ? "<root>" : json_path, "expected an object");
    }

    Collection collection(name);
    if (node.contains("config")) {
        const auto& config = node.at("config");
        if (!config.is_object()) {
            return invalid(join_path(json_path, "config"), "expected an object");
        }
        collection.configure(config.get<json::object_t>());
    }

    if (node.contains("tasks")) {
        const auto& task_nodes = node.at("tasks");
        const std::string tasks_path = join_path(json_path, "tasks");
        if (!task_nodes.is_object()) {
            return invalid(tasks_path, "expected an object of tasks");
        }
        for (auto it = task_nodes.begin(); it != task_nodes.end(); ++it) {
            auto definition =
                build_task(it.key(), it.value(), join_path(tasks_path, it.key()), base_dir);
            if (core::errors::is_error(definition)) {
                return core::errors::get_error(definition);
            }
            auto added = collection.add_task(std::move(core::errors::get_value(definition)));
            if (core::errors::is_error(added)) {
                return core::errors::get_error(added);
            }
        }
    }

    if (node.contains("namespaces")) {
        const auto& children = node.at("namespaces");
        const std::string children_path = join_path(json_path, "namespaces");
        if (!children.is_object()) {
            return invalid(children_path, "expected an object of namespaces");
        }
        for (auto it = children.begin(); it != children.end(); ++it) {
            auto child = build_collection(it.key(), it.value(),
                                          join_path(children_path, it.key()), base_dir);
            if (core::errors::is_error(child)) {
                return core::errors::get_error(child);
            }
            auto added = collection.add_collection(std::move(core::errors::get_value(child)));
            if (core::errors::is_error(added)) {
                return core::errors::get_error(added);
            }
        }
    }

    if (node.contains("default")) {
        if (!node.at("default").is_string()) {
            return invalid(join_path(json_path, "default"), "expected a task name");
        }
        auto set = collection.set_default(node.at("default").get<std::string>());
        if (core::errors::is_error(set)) {
            return core::errors::get_error(set);
        }
    }
    return collection;
}

core::errors::Result<Taskfile> TaskfileLoader::load_json(
    const json& document, const std::filesystem::path& base_dir) const {
    auto built = build_collection("", document, "", base_dir);
    if (core::errors::is_error(built)) {
        return core::errors::get_error(built);
    }

    Taskfile taskfile{base_dir, std::move(core::errors::get_value(built)), core::config::Context()};
    if (document.contains("context")) {
        const auto& context = document.at("context");
        if (!context.is_object()) {
            return invalid("context", "expected an object");
        }
        taskfile.context = core::config::Context(context.get<json::object_t>());
    }
    LOG_DEBUG("Loaded " + std::to_string(taskfile.collection.size()) + " tasks");
    return taskfile;
}

core::errors::Result<Taskfile> TaskfileLoader::load_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return TaskError{ErrorCategory::Config, "Taskfile not found: " + path.string(),
                         "taskfile_not_found", "Pass --taskfile <path>."};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return TaskError{ErrorCategory::Config, "Unable to open taskfile: " + path.string(),
                         "taskfile_not_found"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return TaskError{ErrorCategory::Config, "Taskfile is not valid JSON: " + path.string(),
                         "taskfile_parse_error"};
    }

    const auto absolute = std::filesystem::absolute(path, ec);
    const auto base_dir = ec ? path.parent_path() : absolute.parent_path();
    auto loaded = load_json(document, base_dir);
    if (core::errors::is_error(loaded)) {
        return loaded;
    }
    core::errors::get_value(loaded).path = path;
    return loaded;
}

}  // namespace taskrun::loader
