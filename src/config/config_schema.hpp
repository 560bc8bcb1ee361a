#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace gradebox::config {

struct RunnerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string interpreter = "python3";
    std::string scratch_dir;
    int timeout_ms = 2000;
    long long max_output_bytes = 1024 * 1024;
    long long max_code_bytes = 100 * 1024;
    int memory_limit_mb = 256;
    int max_processes = 64;
};

struct GatewayConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::string runner_url = "http://127.0.0.1:8080";
    std::string exercises_dir = "content/exercises";
    int request_timeout_ms = 10000;
    long long max_code_chars = 30000;
    long long max_stdout_bytes = 64 * 1024;
    long long max_stderr_bytes = 64 * 1024;
    int rate_limit_window_ms = 60000;
    int rate_limit_max = 20;
    std::size_t rate_limit_cleanup_threshold = 5000;
    // token -> submitter identity
    std::unordered_map<std::string, std::string> api_tokens;
};

struct AuditConfig {
    bool to_file = false;
    std::string path = "logs/audit-runner-errors.log";
};

struct LoggingConfig {
    std::string level = "info";
};

struct RedactionConfig {
    std::vector<std::string> secret_env_keys = {
        "DATABASE_URL",
        "DIRECT_URL",
        "NEXTAUTH_SECRET",
        "AUTH_SECRET",
        "RUNNER_SERVICE_URL",
        "OPENAI_API_KEY",
        "SENTRY_AUTH_TOKEN",
        "GRADEBOX_GATEWAY__API_TOKENS"
    };
};

struct Config {
    RunnerConfig runner;
    GatewayConfig gateway;
    AuditConfig audit;
    LoggingConfig logging;
    RedactionConfig redaction;
};

// Margin the caller deadline must keep above the executor timeout so a slow
// program is told apart from an unreachable runner.
constexpr int kDeadlineMarginMs = 1000;

}  // namespace gradebox::config
