#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/context.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/task_errors.hpp"
#include "loader/taskfile_loader.hpp"
#include "runtime/executor.hpp"
#include "tasks/task.hpp"

namespace {

using taskrun::core::config::Context;
using taskrun::core::errors::ErrorCategory;
using taskrun::core::errors::get_error;
using taskrun::core::errors::get_value;
using taskrun::core::errors::is_error;
using taskrun::loader::LoaderOptions;
using taskrun::loader::TaskfileLoader;
using taskrun::loader::render_command;
using taskrun::runtime::Executor;
using taskrun::tasks::TaskCall;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                taskrun::core::config::generate_session_id(".tmp_taskfile_loader");
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TaskfileLoader quiet_loader() {
    LoaderOptions options;
    options.echo_output = false;
    return TaskfileLoader(options);
}

TEST(RenderCommandTest, FillsFromKwargsThenContext) {
    TaskCall call;
    call.kwargs = {{"target", "all"}, {"jobs", 4}};
    call.context = Context(json::object_t{{"build", {{"dir", "out dir"}}}, {"target", "ignored"}});

    auto rendered = render_command("make -C {build.dir} -j{jobs} {target} {{x}}", call);
    ASSERT_FALSE(is_error(rendered));
    EXPECT_EQ(get_value(rendered), "make -C 'out dir' -j'4' 'all' {x}");
}

TEST(RenderCommandTest, ReportsUnresolvedAndMalformedPlaceholders) {
    TaskCall call;
    auto unresolved = render_command("echo {name}", call);
    ASSERT_TRUE(is_error(unresolved));
    EXPECT_EQ(get_error(unresolved).code, "unresolved_placeholder");

    auto unterminated = render_command("echo {name", call);
    ASSERT_TRUE(is_error(unterminated));
    EXPECT_EQ(get_error(unterminated).code, "invalid_command_template");

    auto stray = render_command("echo }", call);
    ASSERT_TRUE(is_error(stray));
    EXPECT_EQ(get_error(stray).code, "invalid_command_template");
}

TEST(TaskfileLoaderTest, BuildsNamespacedCollectionAndContext) {
    const json document = {
        {"context", {{"greeting", "hello"}}},
        {"config", {{"owner", "root"}}},
        {"default", "all"},
        {"tasks",
         {{"all", {{"pre", {"clean", "docs.build"}}, {"help", "Everything"}}},
          {"clean", {{"run", "true"}, {"aliases", {"c"}}}}}},
        {"namespaces",
         {{"docs",
           {{"config", {{"format", "html"}}},
            {"default", "build"},
            {"tasks", {{"build", {{"run", "echo {format}"}, {"contextualized", true}}}}}}}}}};

    TempWorkspace workspace;
    auto loaded = quiet_loader().load_json(document, workspace.root());
    ASSERT_FALSE(is_error(loaded));
    auto& taskfile = get_value(loaded);

    const std::vector<std::string> names = {"all", "clean", "docs.build"};
    EXPECT_EQ(taskfile.collection.task_names(), names);
    EXPECT_EQ(taskfile.context.data().at("greeting"), "hello");

    auto by_default = taskfile.collection.lookup("");
    ASSERT_FALSE(is_error(by_default));
    EXPECT_EQ(get_value(by_default)->name(), "all");
    EXPECT_EQ(get_value(by_default)->help(), "Everything");

    auto alias = taskfile.collection.lookup("c");
    ASSERT_FALSE(is_error(alias));
    EXPECT_EQ(get_value(alias)->name(), "clean");

    auto docs = taskfile.collection.lookup("docs");
    ASSERT_FALSE(is_error(docs));
    EXPECT_TRUE(get_value(docs)->contextualized());
}

TEST(TaskfileLoaderTest, ShellTasksRunThroughExecutor) {
    TempWorkspace workspace;
    const json document = {
        {"config", {{"name", "docs"}}},
        {"tasks",
         {{"prepare", {{"run", "echo prepared >> log.txt"}}},
          {"build",
           {{"run", "echo {name}-{target} >> log.txt"},
            {"pre", {"prepare"}},
            {"contextualized", true},
            {"parameters", {{"target", {{"default", "html"}}}}}}}}}};

    auto loaded = quiet_loader().load_json(document, workspace.root());
    ASSERT_FALSE(is_error(loaded));
    auto& taskfile = get_value(loaded);
    Executor executor(taskfile.collection, taskfile.context);

    auto result = executor.execute("build", json::object());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("exit_code"), 0);
    EXPECT_EQ(get_value(result).at("command"), "echo 'docs'-'html' >> log.txt");

    const auto lines = read_lines(workspace.root() / "log.txt");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "prepared");
    EXPECT_EQ(lines[1], "docs-html");
}

TEST(TaskfileLoaderTest, FailingCommandAbortsChain) {
    TempWorkspace workspace;
    const json document = {
        {"tasks",
         {{"fail", {{"run", "echo broken 1>&2; exit 4"}}},
          {"after", {{"run", "touch after.txt"}, {"pre", {"fail"}}}}}}};

    auto loaded = quiet_loader().load_json(document, workspace.root());
    ASSERT_FALSE(is_error(loaded));
    auto& taskfile = get_value(loaded);
    Executor executor(taskfile.collection);

    auto result = executor.execute("after");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_failed");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_NE(get_error(result).message.find("exited with code 4"), std::string::npos);
    EXPECT_EQ(get_error(result).hint, "broken\n");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "after.txt"));
}

TEST(TaskfileLoaderTest, TaskCwdIsRelativeToTaskfile) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "sub");
    const json document = {{"tasks", {{"mark", {{"run", "touch marker"}, {"cwd", "sub"}}}}}};

    auto loaded = quiet_loader().load_json(document, workspace.root());
    ASSERT_FALSE(is_error(loaded));
    Executor executor(get_value(loaded).collection);
    ASSERT_FALSE(is_error(executor.execute("mark")));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "sub" / "marker"));
}

TEST(TaskfileLoaderTest, RejectsMalformedDocuments) {
    TempWorkspace workspace;
    const auto loader = quiet_loader();

    auto bad_pre = loader.load_json(json{{"tasks", {{"a", {{"pre", {1}}}}}}}, workspace.root());
    ASSERT_TRUE(is_error(bad_pre));
    EXPECT_EQ(get_error(bad_pre).code, "invalid_taskfile");
    EXPECT_NE(get_error(bad_pre).message.find("tasks.a.pre[0]"), std::string::npos);

    auto bad_run = loader.load_json(json{{"tasks", {{"a", {{"run", ""}}}}}}, workspace.root());
    ASSERT_TRUE(is_error(bad_run));
    EXPECT_EQ(get_error(bad_run).code, "invalid_taskfile");

    auto bad_default =
        loader.load_json(json{{"default", "nope"}, {"tasks", json::object()}}, workspace.root());
    ASSERT_TRUE(is_error(bad_default));
    EXPECT_EQ(get_error(bad_default).code, "task_not_found");

    auto dotted = loader.load_json(json{{"tasks", {{"a.b", json::object()}}}}, workspace.root());
    ASSERT_TRUE(is_error(dotted));
    EXPECT_EQ(get_error(dotted).code, "invalid_task_name");

    auto huge_timeout = loader.load_json(
        json{{"tasks", {{"a", {{"run", "true"}, {"timeout_ms", 4294967396ULL}}}}}},
        workspace.root());
    ASSERT_TRUE(is_error(huge_timeout));
    EXPECT_EQ(get_error(huge_timeout).code, "invalid_taskfile");
    EXPECT_NE(get_error(huge_timeout).message.find("tasks.a.timeout_ms"), std::string::npos);
}

TEST(TaskfileLoaderTest, LoadFileReportsMissingAndInvalidFiles) {
    TempWorkspace workspace;
    const auto loader = quiet_loader();

    auto missing = loader.load_file(workspace.root() / "nope.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "taskfile_not_found");

    const auto broken = workspace.root() / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    auto unparsable = loader.load_file(broken);
    ASSERT_TRUE(is_error(unparsable));
    EXPECT_EQ(get_error(unparsable).code, "taskfile_parse_error");

    const auto good = workspace.root() / "taskfile.json";
    {
        std::ofstream out(good);
        out << R"({"tasks": {"hello": {"run": "echo hi"}}})";
    }
    auto loaded = loader.load_file(good);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).path.string(), good.string());
    EXPECT_EQ(get_value(loaded).collection.size(), 1u);
}

}  // namespace
