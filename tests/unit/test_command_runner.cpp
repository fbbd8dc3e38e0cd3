#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/task_errors.hpp"
#include "tools/command_runner.hpp"

namespace {

using taskrun::core::errors::get_error;
using taskrun::core::errors::get_value;
using taskrun::core::errors::is_error;
using taskrun::tools::CommandRequest;
using taskrun::tools::CommandRunner;
using taskrun::tools::shell_quote;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                taskrun::core::config::generate_session_id(".tmp_command_runner");
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

TEST(CommandRunnerTest, CapturesStdoutAndStderr) {
    CommandRunner runner;
    CommandRequest request;
    request.command = "echo out; echo err 1>&2";

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.stdout_text, "out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
}

TEST(CommandRunnerTest, ReportsNonZeroExit) {
    CommandRunner runner;
    CommandRequest request;
    request.command = "exit 3";

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 3);
    EXPECT_FALSE(get_value(result).succeeded());
}

TEST(CommandRunnerTest, RunsInWorkingDirectory) {
    TempWorkspace workspace;
    CommandRunner runner;
    CommandRequest request;
    request.command = "pwd";
    request.working_directory = workspace.root();

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text,
              std::filesystem::canonical(workspace.root()).string() + "\n");
}

TEST(CommandRunnerTest, KillsCommandOnTimeout) {
    CommandRunner runner;
    CommandRequest request;
    request.command = "sleep 5";
    request.timeout_ms = 100;

    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_FALSE(get_value(result).succeeded());
    EXPECT_LT(get_value(result).duration_ms, 4000.0);
}

TEST(CommandRunnerTest, RejectsEmptyCommandAndMissingDirectory) {
    CommandRunner runner;
    auto empty = runner.run(CommandRequest{});
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_command");

    CommandRequest request;
    request.command = "true";
    request.working_directory = std::filesystem::current_path() / "__missing_runner_dir__";
    auto missing = runner.run(request);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_working_directory");
}

TEST(CommandRunnerTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");

    CommandRunner runner;
    CommandRequest request;
    request.command = "printf %s " + shell_quote("a 'quoted' $HOME");
    auto result = runner.run(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "a 'quoted' $HOME");
}

}  // namespace
