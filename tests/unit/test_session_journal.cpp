#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/task_errors.hpp"
#include "protocol/run_request.hpp"
#include "protocol/session_contract.hpp"
#include "session/session_journal.hpp"

namespace {

using taskrun::core::errors::ErrorCategory;
using taskrun::core::errors::TaskError;
using taskrun::core::errors::get_error;
using taskrun::core::errors::get_value;
using taskrun::core::errors::is_error;
using taskrun::protocol::InvocationRecord;
using taskrun::protocol::RunRequest;
using taskrun::protocol::SessionStatus;
using taskrun::protocol::TaskInvocation;
using taskrun::session::SessionJournal;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                taskrun::core::config::generate_session_id(".tmp_session_journal");
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

TEST(SessionJournalTest, WritesStartInvocationAndFinalEvents) {
    TempWorkspace workspace;
    SessionJournal journal(workspace.root());
    const std::string session_id = "session-journal-1";

    RunRequest request;
    request.invocations.push_back(TaskInvocation{"build", json{{"target", "all"}}});
    request.dedupe = false;
    const auto start = journal.write_start(session_id, request);
    ASSERT_FALSE(is_error(start));
    const auto log_path = get_value(start);
    EXPECT_TRUE(std::filesystem::exists(log_path));
    EXPECT_EQ(log_path.filename().string(), session_id + ".jsonl");

    InvocationRecord ok;
    ok.task_name = "build";
    ok.kwargs = json{{"target", "all"}};
    ok.success = true;
    ok.result = "built";
    ASSERT_FALSE(is_error(journal.write_invocation(session_id, ok)));

    InvocationRecord failed;
    failed.task_name = "deploy";
    failed.error = TaskError{ErrorCategory::Lookup, "Task not found: deploy", "task_not_found"};
    ASSERT_FALSE(is_error(journal.write_invocation(session_id, failed)));

    ASSERT_FALSE(is_error(journal.write_final(session_id, SessionStatus::Failed,
                                              "1 of 2 task invocation(s) completed.",
                                              std::string("Task not found: deploy"))));

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 4u);

    const auto start_event = json::parse(lines[0]);
    EXPECT_EQ(start_event.at("event").get<std::string>(), "session_start");
    EXPECT_EQ(start_event.at("session_id").get<std::string>(), session_id);
    EXPECT_FALSE(start_event.at("payload").at("dedupe").get<bool>());
    EXPECT_EQ(start_event.at("payload").at("invocations")[0].at("name"), "build");

    const auto ok_event = json::parse(lines[1]);
    EXPECT_EQ(ok_event.at("event").get<std::string>(), "invocation");
    EXPECT_TRUE(ok_event.at("payload").at("success").get<bool>());
    EXPECT_EQ(ok_event.at("payload").at("result"), "built");
    EXPECT_TRUE(ok_event.at("payload").at("error").is_null());

    const auto failed_event = json::parse(lines[2]);
    EXPECT_FALSE(failed_event.at("payload").at("success").get<bool>());
    EXPECT_EQ(failed_event.at("payload").at("error").at("code"), "task_not_found");
    EXPECT_EQ(failed_event.at("payload").at("error").at("category"), "lookup");

    const auto final_event = json::parse(lines[3]);
    EXPECT_EQ(final_event.at("event").get<std::string>(), "final");
    EXPECT_EQ(final_event.at("payload").at("status").get<std::string>(), "failed");
    EXPECT_EQ(final_event.at("payload").at("error_message").get<std::string>(),
              "Task not found: deploy");
}

TEST(SessionJournalTest, FailsForInvalidRoot) {
    const auto missing_root =
        std::filesystem::current_path() /
        taskrun::core::config::generate_session_id("__missing_journal_root__");
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);

    SessionJournal journal(missing_root);
    auto result = journal.write_start("session-journal-2", RunRequest{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_journal_root");
}

TEST(SessionJournalTest, RejectsEmptySessionId) {
    TempWorkspace workspace;
    SessionJournal journal(workspace.root());
    auto result = journal.journal_path("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_session_id");
}

}  // namespace
