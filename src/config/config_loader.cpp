#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gradebox::config {
namespace {

using utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty() || secondary == nullptr) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// "token:user,token:user"
std::unordered_map<std::string, std::string> ParseTokenTable(const std::string& value) {
    std::unordered_map<std::string, std::string> table;
    for (const auto& entry : SplitCsv(value)) {
        const auto colon = entry.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= entry.size()) {
            utils::LogWarn("config", "ignoring malformed api token entry");
            continue;
        }
        table[entry.substr(0, colon)] = entry.substr(colon + 1);
    }
    return table;
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

template <typename T>
void ApplyInteger(T& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<T>();
    }
}

void ApplyRunnerConfig(RunnerConfig& runner, const nlohmann::json& source) {
    ApplyString(runner.host, source, "host");
    ApplyInteger(runner.port, source, "port");
    ApplyString(runner.interpreter, source, "interpreter");
    ApplyString(runner.scratch_dir, source, "scratchDir");
    ApplyInteger(runner.timeout_ms, source, "timeoutMs");
    ApplyInteger(runner.max_output_bytes, source, "maxOutputBytes");
    ApplyInteger(runner.max_code_bytes, source, "maxCodeBytes");
    ApplyInteger(runner.memory_limit_mb, source, "memoryLimitMb");
    ApplyInteger(runner.max_processes, source, "maxProcesses");
}

void ApplyGatewayConfig(GatewayConfig& gateway, const nlohmann::json& source) {
    ApplyString(gateway.host, source, "host");
    ApplyInteger(gateway.port, source, "port");
    ApplyString(gateway.runner_url, source, "runnerUrl");
    ApplyString(gateway.exercises_dir, source, "exercisesDir");
    ApplyInteger(gateway.request_timeout_ms, source, "requestTimeoutMs");
    ApplyInteger(gateway.max_code_chars, source, "maxCodeChars");
    ApplyInteger(gateway.max_stdout_bytes, source, "maxStdoutBytes");
    ApplyInteger(gateway.max_stderr_bytes, source, "maxStderrBytes");
    ApplyInteger(gateway.rate_limit_window_ms, source, "rateLimitWindowMs");
    ApplyInteger(gateway.rate_limit_max, source, "rateLimitMax");
    ApplyInteger(gateway.rate_limit_cleanup_threshold, source, "rateLimitCleanupThreshold");
    if (source.contains("apiTokens") && source["apiTokens"].is_object()) {
        gateway.api_tokens.clear();
        for (const auto& item : source["apiTokens"].items()) {
            if (item.value().is_string()) {
                gateway.api_tokens[item.key()] = item.value().get<std::string>();
            }
        }
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("GRADEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".gradebox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("runner") && data["runner"].is_object()) {
        ApplyRunnerConfig(config.runner, data["runner"]);
    }
    if (data.contains("gateway") && data["gateway"].is_object()) {
        ApplyGatewayConfig(config.gateway, data["gateway"]);
    }
    if (data.contains("audit") && data["audit"].is_object()) {
        const auto& audit = data["audit"];
        if (audit.contains("toFile") && audit["toFile"].is_boolean()) {
            config.audit.to_file = audit["toFile"].get<bool>();
        }
        ApplyString(config.audit.path, audit, "path");
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
    if (data.contains("redaction") && data["redaction"].is_object()) {
        const auto& redaction = data["redaction"];
        if (redaction.contains("secretEnvKeys") && redaction["secretEnvKeys"].is_array()) {
            for (const auto& item : redaction["secretEnvKeys"]) {
                if (item.is_string()) {
                    config.redaction.secret_env_keys.push_back(item.get<std::string>());
                }
            }
        }
    }
}

void ApplyEnvironment(Config& config) {
    auto& runner = config.runner;
    auto& gateway = config.gateway;

    const auto runner_host = GetEnv("GRADEBOX_RUNNER__HOST");
    if (!runner_host.empty()) {
        runner.host = runner_host;
    }
    const auto runner_port = GetEnv("GRADEBOX_RUNNER__PORT");
    if (!runner_port.empty()) {
        runner.port = ParseInt(runner_port, runner.port);
    }
    const auto interpreter = GetEnv("GRADEBOX_RUNNER__INTERPRETER");
    if (!interpreter.empty()) {
        runner.interpreter = interpreter;
    }
    const auto scratch_dir = GetEnv("GRADEBOX_RUNNER__SCRATCH_DIR");
    if (!scratch_dir.empty()) {
        runner.scratch_dir = scratch_dir;
    }
    const auto runner_timeout = GetEnv("GRADEBOX_RUNNER__TIMEOUT_MS");
    if (!runner_timeout.empty()) {
        runner.timeout_ms = ParseInt(runner_timeout, runner.timeout_ms);
    }
    const auto max_output = GetEnv("GRADEBOX_RUNNER__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        runner.max_output_bytes = ParseLong(max_output, runner.max_output_bytes);
    }
    const auto max_code_bytes = GetEnv("GRADEBOX_RUNNER__MAX_CODE_BYTES");
    if (!max_code_bytes.empty()) {
        runner.max_code_bytes = ParseLong(max_code_bytes, runner.max_code_bytes);
    }
    const auto memory_limit = GetEnv("GRADEBOX_RUNNER__MEMORY_LIMIT_MB");
    if (!memory_limit.empty()) {
        runner.memory_limit_mb = ParseInt(memory_limit, runner.memory_limit_mb);
    }

    const auto gateway_host = GetEnv("GRADEBOX_GATEWAY__HOST");
    if (!gateway_host.empty()) {
        gateway.host = gateway_host;
    }
    const auto gateway_port = GetEnv("GRADEBOX_GATEWAY__PORT");
    if (!gateway_port.empty()) {
        gateway.port = ParseInt(gateway_port, gateway.port);
    }
    const auto runner_url = GetEnvFallback("GRADEBOX_GATEWAY__RUNNER_URL", "RUNNER_SERVICE_URL");
    if (!runner_url.empty()) {
        gateway.runner_url = runner_url;
    }
    const auto exercises_dir = GetEnv("GRADEBOX_GATEWAY__EXERCISES_DIR");
    if (!exercises_dir.empty()) {
        gateway.exercises_dir = exercises_dir;
    }
    const auto request_timeout = GetEnv("GRADEBOX_GATEWAY__REQUEST_TIMEOUT_MS");
    if (!request_timeout.empty()) {
        gateway.request_timeout_ms = ParseInt(request_timeout, gateway.request_timeout_ms);
    }
    const auto max_code_chars = GetEnvFallback("GRADEBOX_GATEWAY__MAX_CODE_CHARS", "RUN_CODE_MAX_CHARS");
    if (!max_code_chars.empty()) {
        gateway.max_code_chars = ParseLong(max_code_chars, gateway.max_code_chars);
    }
    const auto max_stdout = GetEnvFallback("GRADEBOX_GATEWAY__MAX_STDOUT_BYTES", "RUN_STDOUT_MAX_BYTES");
    if (!max_stdout.empty()) {
        gateway.max_stdout_bytes = ParseLong(max_stdout, gateway.max_stdout_bytes);
    }
    const auto max_stderr = GetEnvFallback("GRADEBOX_GATEWAY__MAX_STDERR_BYTES", "RUN_STDERR_MAX_BYTES");
    if (!max_stderr.empty()) {
        gateway.max_stderr_bytes = ParseLong(max_stderr, gateway.max_stderr_bytes);
    }
    const auto window = GetEnvFallback("GRADEBOX_GATEWAY__RATE_LIMIT_WINDOW_MS", "RUN_RATE_LIMIT_WINDOW_MS");
    if (!window.empty()) {
        gateway.rate_limit_window_ms = ParseInt(window, gateway.rate_limit_window_ms);
    }
    const auto rate_max = GetEnvFallback("GRADEBOX_GATEWAY__RATE_LIMIT_MAX", "RUN_RATE_LIMIT_MAX");
    if (!rate_max.empty()) {
        gateway.rate_limit_max = ParseInt(rate_max, gateway.rate_limit_max);
    }
    const auto api_tokens = GetEnv("GRADEBOX_GATEWAY__API_TOKENS");
    if (!api_tokens.empty()) {
        gateway.api_tokens = ParseTokenTable(api_tokens);
    }

    const auto audit_to_file = GetEnvFallback("GRADEBOX_AUDIT__TO_FILE", "AUDIT_LOG_TO_FILE");
    if (!audit_to_file.empty()) {
        config.audit.to_file = ParseBool(audit_to_file);
    }
    const auto audit_path = GetEnvFallback("GRADEBOX_AUDIT__PATH", "AUDIT_LOG_PATH");
    if (!audit_path.empty()) {
        config.audit.path = audit_path;
    }

    const auto log_level = GetEnv("GRADEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

bool EnforceDeadlineFloor(Config& config) {
    const int floor = config.runner.timeout_ms + kDeadlineMarginMs;
    if (config.gateway.request_timeout_ms >= floor) {
        return false;
    }
    utils::LogWarn("config", "request timeout " + std::to_string(config.gateway.request_timeout_ms) +
                   "ms is below executor timeout plus margin, raising to " + std::to_string(floor) + "ms");
    config.gateway.request_timeout_ms = floor;
    return true;
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn("config", "failed to parse " + config_path.string() + ", keeping defaults");
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    EnforceDeadlineFloor(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace gradebox::config
