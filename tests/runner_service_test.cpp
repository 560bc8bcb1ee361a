#include <gtest/gtest.h>

#include "runner/runner_service.hpp"
#include "test_support.hpp"

#include "httplib.h"

using gradebox::config::RunnerConfig;
using gradebox::runner::RunnerService;

namespace {

RunnerConfig SmallConfig() {
    RunnerConfig config;
    config.max_code_bytes = 64;
    config.timeout_ms = 2000;
    return config;
}

}  // namespace

TEST(RunnerServiceTest, RejectsMalformedRequests) {
    const RunnerService service(SmallConfig());

    auto reply = service.HandleRun("not json");
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["error"], "Invalid JSON");
    EXPECT_EQ(reply.body["success"], false);

    EXPECT_EQ(service.HandleRun("{}").body["error"], "Invalid JSON");
    EXPECT_EQ(service.HandleRun(R"({"code": ""})").body["error"], "No code provided");
    EXPECT_EQ(service.HandleRun(R"({"code": 42})").body["error"], "No code provided");

    const nlohmann::json oversized = {{"code", std::string(65, 'x')}};
    reply = service.HandleRun(oversized.dump());
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["error"], "Code exceeds maximum size (64 bytes)");
}

TEST(RunnerServiceTest, RejectsUnsafeDatasets) {
    const RunnerService service(SmallConfig());
    const nlohmann::json body = {
        {"code", "print(1)"},
        {"dataset", {{"files", {{{"name", "../escape.csv"}, {"content", "1"}}}}}}
    };
    const auto reply = service.HandleRun(body.dump());
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body["error"].get<std::string>().rfind("Invalid dataset: ", 0), 0u);
}

TEST(RunnerServiceTest, ReportsHealth) {
    const RunnerService service(SmallConfig());
    const auto reply = service.HandleHealth();
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["status"], "healthy");
    EXPECT_EQ(reply.body["service"], gradebox::runner::kServiceName);
}

TEST(RunnerServiceTest, MissingInterpreterIsAServerError) {
    auto config = SmallConfig();
    config.interpreter = "gradebox-no-such-interpreter";
    const RunnerService service(config);
    const auto reply = service.HandleRun(R"({"code": "print(1)"})");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body["success"], false);
}

TEST(RunnerServiceTest, RunsProgramAndEvaluatesTests) {
    if (!gradebox::testing::HasInterpreter("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const RunnerService service(RunnerConfig{});
    const nlohmann::json body = {
        {"code", "total = 6\nprint('Hello, World!')"},
        {"tests", {
            {{"id", "t1"}, {"type", "output"}, {"expected", "Hello, World!"}},
            {{"id", "t2"}, {"type", "variable_value"}, {"variable", "total"}, {"expected", 6}}
        }}
    };
    const auto reply = service.HandleRun(body.dump(), "req-1");
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["success"], true);
    EXPECT_EQ(reply.body["stdout"], "Hello, World!");
    EXPECT_EQ(reply.body["allPassed"], true);
    EXPECT_EQ(reply.body["testResults"].size(), 2u);
}

TEST(RunnerServiceTest, ReadsDatasetFilesFromWorkingDirectory) {
    if (!gradebox::testing::HasInterpreter("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const RunnerService service(RunnerConfig{});
    const nlohmann::json body = {
        {"code", "print(sum(int(x) for x in open('data.csv').read().split(',')))"},
        {"dataset", {{"files", {{{"name", "data.csv"}, {"content", "1,2,3"}}}}}}
    };
    const auto reply = service.HandleRun(body.dump());
    ASSERT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["stdout"], "6");
    EXPECT_EQ(reply.body["allPassed"], true);
}

TEST(RunnerServiceTest, ServesOutputThatIsNotValidUtf8) {
    if (!gradebox::testing::HasInterpreter("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    const RunnerService service(RunnerConfig{});
    gradebox::testing::LocalServer server;
    service.Register(server.Server());
    server.Start();

    httplib::Client client("127.0.0.1", server.Port());
    const nlohmann::json body = {{"code", R"(import sys
sys.stdout.buffer.write(b'ok\xff'))"}};
    const auto res = client.Post("/run", body.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto reply = nlohmann::json::parse(res->body);
    EXPECT_EQ(reply["success"], true);
    EXPECT_EQ(reply["stdout"], "ok\xEF\xBF\xBD");
}
