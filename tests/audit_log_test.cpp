#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "audit/audit_log.hpp"
#include "utils/common.hpp"

using gradebox::audit::AuditEvent;
using gradebox::audit::AuditEventToJson;
using gradebox::audit::AuditLevel;
using gradebox::audit::LogAuditSink;

TEST(AuditLogTest, JsonOmitsEmptyFields) {
    AuditEvent event;
    event.level = AuditLevel::kWarn;
    event.event = "api.rate_limited";
    event.request_id = "req-1";
    event.error_code = "RATE_LIMIT";
    event.meta = {{"limit", 20}};
    const auto json = AuditEventToJson(event);
    EXPECT_EQ(json["level"], "warn");
    EXPECT_EQ(json["event"], "api.rate_limited");
    EXPECT_EQ(json["requestId"], "req-1");
    EXPECT_EQ(json["errorCode"], "RATE_LIMIT");
    EXPECT_EQ(json["meta"]["limit"], 20);
    EXPECT_TRUE(json.contains("ts"));
    EXPECT_FALSE(json.contains("userId"));
    EXPECT_FALSE(json.contains("runnerStatus"));
}

TEST(AuditLogTest, RunnerStatusIsKept) {
    AuditEvent event;
    event.event = "runner.http_error";
    event.runner_status = 500;
    EXPECT_EQ(AuditEventToJson(event)["runnerStatus"], 500);
}

TEST(AuditLogTest, FileSinkAppendsOneLinePerEvent) {
    const auto dir = std::filesystem::temp_directory_path() / ("gradebox-audit-" + gradebox::utils::GenerateRequestId());
    const auto path = dir / "nested" / "audit.log";
    {
        LogAuditSink sink(path);
        AuditEvent first;
        first.event = "runner.timeout";
        first.level = AuditLevel::kError;
        sink.Record(first);
        AuditEvent second;
        second.event = "runner.network_error";
        second.level = AuditLevel::kError;
        sink.Record(second);
    }

    std::ifstream input(path);
    ASSERT_TRUE(input.is_open());
    std::string line;
    std::vector<std::string> events;
    while (std::getline(input, line)) {
        events.push_back(nlohmann::json::parse(line)["event"].get<std::string>());
    }
    EXPECT_EQ(events, (std::vector<std::string>{"runner.timeout", "runner.network_error"}));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(AuditLogTest, RecordsMessagesWithInvalidUtf8) {
    const auto dir = std::filesystem::temp_directory_path() / ("gradebox-audit-" + gradebox::utils::GenerateRequestId());
    const auto path = dir / "audit.log";
    {
        LogAuditSink sink(path);
        AuditEvent event;
        event.event = "runner.http_error";
        event.level = AuditLevel::kError;
        event.message = std::string("bad byte \xff and half \xE2\x82");
        EXPECT_NO_THROW(sink.Record(event));
    }

    std::ifstream input(path);
    ASSERT_TRUE(input.is_open());
    std::string line;
    ASSERT_TRUE(std::getline(input, line));
    const auto json = nlohmann::json::parse(line);
    EXPECT_EQ(json["event"], "runner.http_error");
    EXPECT_EQ(json["message"].get<std::string>().rfind("bad byte \xEF\xBF\xBD", 0), 0u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
