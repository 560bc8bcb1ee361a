#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config/config_loader.hpp"
#include "test_support.hpp"
#include "utils/common.hpp"

using gradebox::config::Config;
using gradebox::config::EnforceDeadlineFloor;
using gradebox::config::LoadConfig;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("gradebox-config-" + gradebox::utils::GenerateRequestId());
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path Write(const std::string& content) {
        const auto path = dir_ / "config.json";
        std::ofstream output(path);
        output << content;
        return path;
    }

    std::filesystem::path dir_;
};

}  // namespace

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    const auto config = LoadConfig(dir_ / "absent.json");
    EXPECT_EQ(config.runner.timeout_ms, 2000);
    EXPECT_EQ(config.runner.max_output_bytes, 1024 * 1024);
    EXPECT_EQ(config.gateway.request_timeout_ms, 10000);
    EXPECT_EQ(config.gateway.rate_limit_max, 20);
    EXPECT_EQ(config.gateway.rate_limit_window_ms, 60000);
    EXPECT_FALSE(config.audit.to_file);
}

TEST_F(ConfigLoaderTest, ReadsCamelCaseSections) {
    const auto path = Write(R"({
        "runner": {"port": 9090, "timeoutMs": 3000, "interpreter": "/usr/bin/python3"},
        "gateway": {"runnerUrl": "http://runner:9090", "rateLimitMax": 5,
                    "apiTokens": {"secret-token-1": "ada"}},
        "audit": {"toFile": true, "path": "/tmp/audit.log"},
        "logging": {"level": "debug"}
    })");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.runner.port, 9090);
    EXPECT_EQ(config.runner.timeout_ms, 3000);
    EXPECT_EQ(config.runner.interpreter, "/usr/bin/python3");
    EXPECT_EQ(config.gateway.runner_url, "http://runner:9090");
    EXPECT_EQ(config.gateway.rate_limit_max, 5);
    EXPECT_EQ(config.gateway.api_tokens.at("secret-token-1"), "ada");
    EXPECT_TRUE(config.audit.to_file);
    EXPECT_EQ(config.audit.path, "/tmp/audit.log");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, InvalidJsonKeepsDefaults) {
    const auto config = LoadConfig(Write("{ not json"));
    EXPECT_EQ(config.gateway.port, 3000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFileAndLegacyNames) {
    const auto path = Write(R"({"gateway": {"rateLimitMax": 5}})");
    gradebox::testing::ScopedEnv limit("GRADEBOX_GATEWAY__RATE_LIMIT_MAX", "7");
    gradebox::testing::ScopedEnv url("RUNNER_SERVICE_URL", "http://legacy-runner:8080");
    gradebox::testing::ScopedEnv tokens("GRADEBOX_GATEWAY__API_TOKENS", "tok-a:ada, tok-b:bob");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.gateway.rate_limit_max, 7);
    EXPECT_EQ(config.gateway.runner_url, "http://legacy-runner:8080");
    EXPECT_EQ(config.gateway.api_tokens.size(), 2u);
    EXPECT_EQ(config.gateway.api_tokens.at("tok-b"), "bob");
}

TEST(DeadlineFloorTest, RaisesCallerDeadlineAboveExecutorTimeout) {
    Config config{};
    config.runner.timeout_ms = 5000;
    config.gateway.request_timeout_ms = 3000;
    EXPECT_TRUE(EnforceDeadlineFloor(config));
    EXPECT_EQ(config.gateway.request_timeout_ms, 6000);
    EXPECT_FALSE(EnforceDeadlineFloor(config));
}
