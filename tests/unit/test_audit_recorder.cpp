#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/unique_id.hpp"
#include "core/errors/safety_errors.hpp"
#include "protocol/action_request.hpp"
#include "session/audit_recorder.hpp"

namespace {

using nlohmann::json;
using saferclaw::core::errors::get_error;
using saferclaw::core::errors::get_value;
using saferclaw::core::errors::is_error;
using saferclaw::protocol::ActionKind;
using saferclaw::protocol::ActionRequest;
using saferclaw::protocol::CommandAction;
using saferclaw::protocol::PlanAction;
using saferclaw::protocol::ReadFileAction;
using saferclaw::protocol::WriteFileAction;
using saferclaw::session::AuditEvent;
using saferclaw::session::AuditRecorder;
using saferclaw::session::AuditStatus;
using saferclaw::session::redact_payload;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_recorder_" + saferclaw::core::config::generate_unique_id("ws"));
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

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(AuditRecorderTest, AppendsOneJsonObjectPerLine) {
    TempWorkspace workspace;
    AuditRecorder recorder(workspace.root() / "logs" / "audit.jsonl");

    const ActionRequest request{CommandAction{{"ls", "-la"}}};
    ASSERT_FALSE(is_error(recorder.record_action(request, AuditStatus::Attempted)));
    ASSERT_FALSE(is_error(recorder.record_action(request, AuditStatus::Failed,
                                                 std::string("non_zero_exit"),
                                                 std::string("exit code 2"))));

    const auto lines = read_lines(recorder.path());
    ASSERT_EQ(lines.size(), 2u);

    const json first = json::parse(lines[0]);
    EXPECT_EQ(first["action"], "command");
    EXPECT_EQ(first["status"], "attempted");
    EXPECT_EQ(first["payload"]["command"], json({"ls", "-la"}));
    EXPECT_FALSE(first.contains("reason"));
    EXPECT_TRUE(first["timestamp"].get<std::string>().back() == 'Z');

    const json second = json::parse(lines[1]);
    EXPECT_EQ(second["status"], "failed");
    EXPECT_EQ(second["reason"], "non_zero_exit");
    EXPECT_EQ(second["detail"], "exit code 2");
}

TEST(AuditRecorderTest, NeverRewritesEarlierRecords) {
    TempWorkspace workspace;
    AuditRecorder recorder(workspace.root() / "audit.jsonl");
    const ActionRequest request{ReadFileAction{"notes.txt"}};

    ASSERT_FALSE(is_error(recorder.record_action(request, AuditStatus::Attempted)));
    const auto before = read_lines(recorder.path());
    ASSERT_FALSE(is_error(recorder.record_action(request, AuditStatus::Succeeded)));
    const auto after = read_lines(recorder.path());

    ASSERT_EQ(after.size(), before.size() + 1);
    EXPECT_EQ(after.front(), before.front());
}

TEST(AuditRecorderTest, SecretsAreRedacted) {
    const json payload = redact_payload(
        ActionRequest{CommandAction{{"git", "API_TOKEN=abc123", "db_password=hunter2", "name=ok"}}});
    EXPECT_EQ(payload["command"][1], "API_TOKEN=[redacted]");
    EXPECT_EQ(payload["command"][2], "db_password=[redacted]");
    EXPECT_EQ(payload["command"][3], "name=ok");
}

TEST(AuditRecorderTest, WriteContentIsSummarised) {
    const std::string content(1000, 'x');
    const json payload = redact_payload(ActionRequest{WriteFileAction{"out.txt", content}});
    EXPECT_EQ(payload["path"], "out.txt");
    EXPECT_EQ(payload["content_bytes"], 1000);
    EXPECT_LT(payload["content_preview"].get<std::string>().size(), content.size());
    EXPECT_FALSE(payload.contains("content"));
}

TEST(AuditRecorderTest, PlanStepsCarryTheirKind) {
    const json payload = redact_payload(ActionRequest{PlanAction{
        {ActionRequest{CommandAction{{"echo", "hi"}}}, ActionRequest{ReadFileAction{"a.txt"}}}}});
    ASSERT_EQ(payload["steps"].size(), 2u);
    EXPECT_EQ(payload["steps"][0]["kind"], "command");
    EXPECT_EQ(payload["steps"][1]["kind"], "read_file");
    EXPECT_EQ(payload["steps"][1]["path"], "a.txt");
}

TEST(AuditRecorderTest, ReadEventsReturnsTheTail) {
    TempWorkspace workspace;
    AuditRecorder recorder(workspace.root() / "audit.jsonl");
    for (int i = 0; i < 5; ++i) {
        AuditEvent event;
        event.action = ActionKind::ReadFile;
        event.payload = json{{"path", "file" + std::to_string(i)}};
        event.status = AuditStatus::Succeeded;
        ASSERT_FALSE(is_error(recorder.record(event)));
    }

    auto tail = recorder.read_events(2);
    ASSERT_FALSE(is_error(tail));
    ASSERT_EQ(get_value(tail).size(), 2u);
    EXPECT_EQ(get_value(tail)[0]["payload"]["path"], "file3");
    EXPECT_EQ(get_value(tail)[1]["payload"]["path"], "file4");

    auto all = recorder.read_events(0);
    ASSERT_FALSE(is_error(all));
    EXPECT_EQ(get_value(all).size(), 5u);
}

TEST(AuditRecorderTest, ReadEventsOnMissingFileIsEmpty) {
    TempWorkspace workspace;
    AuditRecorder recorder(workspace.root() / "never-written.jsonl");
    auto events = recorder.read_events(10);
    ASSERT_FALSE(is_error(events));
    EXPECT_TRUE(get_value(events).empty());
}

TEST(AuditRecorderTest, UnwritableLocationIsReported) {
    TempWorkspace workspace;
    // A directory where the file should be makes the open fail.
    std::filesystem::create_directories(workspace.root() / "audit.jsonl");
    AuditRecorder recorder(workspace.root() / "audit.jsonl");

    auto recorded =
        recorder.record_action(ActionRequest{ReadFileAction{"a"}}, AuditStatus::Attempted);
    ASSERT_TRUE(is_error(recorded));
    EXPECT_EQ(get_error(recorded).code, "audit_write_failed");
}

}  // namespace
