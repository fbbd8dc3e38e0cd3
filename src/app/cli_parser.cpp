#include "cli_parser.hpp"
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace taskrun::app::cli {

    using namespace taskrun::core::errors;
    using taskrun::protocol::RunRequest;
    using taskrun::protocol::TaskInvocation;
    using nlohmann::json;

    namespace {

        // Numbers and booleans keep their JSON type, everything else stays a string.
        json parse_value(const std::string& text) {
            const json parsed = json::parse(text, nullptr, false);
            if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
                return parsed;
            }
            return text;
        }

        std::string to_kwarg_name(std::string flag) {
            for (auto& c : flag) {
                if (c == '-') c = '_';
            }
            return flag;
        }

        bool is_flag(const std::string& token) {
            return token.size() > 2 && token.rfind("--", 0) == 0;
        }

        Result<std::string> apply_override(json& overrides, const std::string& assignment) {
            const auto eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                return TaskError{ErrorCategory::Input, "Invalid config override: " + assignment,
                                 "invalid_config_override", "Use --config key.path=value"};
            }
            const std::string key = assignment.substr(0, eq);
            json* node = &overrides;
            std::size_t start = 0;
            while (true) {
                const auto dot = key.find('.', start);
                const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
                if (part.empty()) {
                    return TaskError{ErrorCategory::Input, "Invalid config key: " + key,
                                     "invalid_config_override", "Use --config key.path=value"};
                }
                if (dot == std::string::npos) {
                    (*node)[part] = parse_value(assignment.substr(eq + 1));
                    return key;
                }
                json& child = (*node)[part];
                if (!child.is_object()) child = json::object();
                node = &child;
                start = dot + 1;
            }
        }

    } // namespace

    std::string usage() {
        return "Usage: taskrun [options] [task [--key value]...]...\n"
               "\n"
               "Options:\n"
               "  -f, --taskfile PATH     Taskfile to load (default: taskfile.json)\n"
               "  -c, --config KEY=VALUE  Override configuration (dotted key, repeatable)\n"
               "      --no-dedupe         Run every task in the chain, even if it already ran\n"
               "  -l, --list              List available tasks\n"
               "      --dry-run           Print the planned task order without running it\n"
               "      --journal           Record the session under .taskrun/\n"
               "  -v, --verbose           Debug logging\n"
               "  -h, --help              Show this help\n";
    }

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        RunRequest req;
        std::size_t i = 0;

        // 1. Global options, up to the first task name
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "-f" || arg == "--taskfile") {
                if (i + 1 < args.size()) req.taskfile = args[++i];
                else return TaskError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 >= args.size()) {
                    return TaskError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
                }
                auto applied = apply_override(req.config_overrides, args[++i]);
                if (is_error(applied)) return get_error(applied);
            } else if (arg == "--no-dedupe") {
                req.dedupe = false;
            } else if (arg == "-l" || arg == "--list") {
                req.list_tasks = true;
            } else if (arg == "--dry-run") {
                req.dry_run = true;
            } else if (arg == "--journal") {
                req.journal = true;
            } else if (arg == "-v" || arg == "--verbose") {
                req.verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                req.show_help = true;
            } else if (!arg.empty() && arg[0] == '-') {
                return TaskError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument",
                                 "Options go before the first task name."};
            } else {
                break;
            }
        }

        // 2. Task names, each followed by its own --key value arguments
        std::optional<TaskInvocation> current;
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (!is_flag(arg)) {
                if (!arg.empty() && arg[0] == '-') {
                    return TaskError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument",
                                     "Task arguments are written --name value."};
                }
                if (current) req.invocations.push_back(*current);
                current = TaskInvocation{arg, json::object()};
                continue;
            }

            const std::string body = arg.substr(2);
            const auto eq = body.find('=');
            if (eq != std::string::npos) {
                if (eq == 0) {
                    return TaskError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
                }
                current->kwargs[to_kwarg_name(body.substr(0, eq))] = parse_value(body.substr(eq + 1));
            } else if (i + 1 < args.size() && !is_flag(args[i + 1])) {
                current->kwargs[to_kwarg_name(body)] = parse_value(args[++i]);
            } else {
                current->kwargs[to_kwarg_name(body)] = true;
            }
        }
        if (current) req.invocations.push_back(*current);

        // 3. No task named: run the collection's default task
        if (req.invocations.empty() && !req.list_tasks && !req.show_help) {
            req.invocations.push_back(TaskInvocation{"", json::object()});
        }

        return req;
    }

} // namespace taskrun::app::cli
