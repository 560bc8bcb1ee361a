#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "audit/audit_log.hpp"
#include "config/config_loader.hpp"
#include "exercise/exercise_catalog.hpp"
#include "exercise/exercise_codec.hpp"
#include "gateway/grading_api.hpp"
#include "grading/grading_dispatcher.hpp"
#include "runner/runner_service.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "security/rate_limiter.hpp"
#include "transport/redaction.hpp"
#include "transport/runner_client.hpp"
#include "utils/common.hpp"
#include "utils/json_text.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

gradebox::config::Config LoadAndPrepareConfig() {
    auto config = gradebox::config::LoadConfig();
    gradebox::utils::SetLogConfig(gradebox::utils::LogConfig{
        gradebox::utils::ParseLogLevel(config.logging.level, gradebox::utils::LogLevel::kInfo)});
    gradebox::config::EnforceDeadlineFloor(config);
    return config;
}

std::unique_ptr<gradebox::audit::LogAuditSink> MakeAuditSink(const gradebox::config::Config& config) {
    if (config.audit.to_file) {
        return std::make_unique<gradebox::audit::LogAuditSink>(std::filesystem::path(config.audit.path));
    }
    return std::make_unique<gradebox::audit::LogAuditSink>();
}

// Serves until SIGINT/SIGTERM, then stops the listener and joins it.
int Serve(httplib::Server& server, const std::string& host, int port, const std::string& name) {
    InstallSignalHandlers();
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&server, &listen_failed, host, port, name]() {
        const bool ok = server.listen(host, port);
        if (!ok) {
            std::cerr << "[" << name << "] http server failed to listen on "
                      << host << ":" << port << std::endl;
            listen_failed = true;
        }
    });

    std::cout << "gradebox " << name << " listening on " << host << ":" << port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunRunner() {
    const auto config = LoadAndPrepareConfig();
    if (!gradebox::sandbox::NetworkIsolationAvailable()) {
        gradebox::utils::LogError("runner",
                                  "network isolation unavailable: submitted programs keep network access");
    }
    gradebox::runner::RunnerService service(config.runner);
    httplib::Server server;
    service.Register(server);
    return Serve(server, config.runner.host, config.runner.port, "runner");
}

gradebox::transport::Redactor MakeRedactor(const gradebox::config::Config& config) {
    return gradebox::transport::Redactor(config.redaction.secret_env_keys);
}

int RunGateway() {
    const auto config = LoadAndPrepareConfig();
    if (config.gateway.api_tokens.empty()) {
        std::cerr << "[gateway] no api tokens configured; every request will be rejected" << std::endl;
    }

    gradebox::exercise::ExerciseCatalog catalog;
    catalog.LoadDirectory(config.gateway.exercises_dir);

    auto audit = MakeAuditSink(config);
    gradebox::transport::RunnerClient runner(config.gateway.runner_url, *audit, MakeRedactor(config));
    gradebox::security::RateLimiter limiter(config.gateway.rate_limit_cleanup_threshold);
    gradebox::gateway::GradingApi api(config.gateway, catalog, runner, limiter, *audit);

    httplib::Server server;
    api.Register(server);
    return Serve(server, config.gateway.host, config.gateway.port, "gateway");
}

bool ReadText(const std::filesystem::path& path, std::string& out) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<gradebox::exercise::SubmissionPayload> PayloadFor(gradebox::exercise::ExerciseType type,
                                                                const std::string& answer) {
    using gradebox::exercise::ExerciseType;
    switch (type) {
        case ExerciseType::kCode:
        case ExerciseType::kDebugFix:
            return gradebox::exercise::CodeAnswer{answer};
        case ExerciseType::kPredictOutput:
            return gradebox::exercise::PredictedOutput{answer};
        case ExerciseType::kExplain:
            return gradebox::exercise::ExplanationText{answer};
        case ExerciseType::kTraceReading: {
            const auto data = nlohmann::json::parse(answer, nullptr, false);
            if (data.is_discarded() || !data.is_object()) {
                return std::nullopt;
            }
            gradebox::exercise::AnswerMap map{};
            for (auto it = data.begin(); it != data.end(); ++it) {
                if (it.value().is_string()) {
                    map.answers[it.key()] = it.value().get<std::string>();
                }
            }
            return map;
        }
    }
    return std::nullopt;
}

int RunGrade(const std::string& exercise_path, const std::string& answer_path) {
    const auto config = LoadAndPrepareConfig();

    std::string exercise_text;
    if (!ReadText(exercise_path, exercise_text)) {
        std::cout << "Cannot read exercise file: " << exercise_path << std::endl;
        return 1;
    }
    const auto parsed = gradebox::exercise::ParseExercise(nlohmann::json::parse(exercise_text, nullptr, false));
    if (!parsed.Ok()) {
        std::cout << "Invalid exercise: " << gradebox::exercise::DescribeErrors(parsed.errors) << std::endl;
        return 1;
    }
    const auto& exercise = *parsed.value;

    std::string answer;
    if (!ReadText(answer_path, answer)) {
        std::cout << "Cannot read answer file: " << answer_path << std::endl;
        return 1;
    }
    auto payload = PayloadFor(exercise.type, answer);
    if (!payload) {
        std::cout << "Answer file for a trace_reading exercise must be a JSON object of answers." << std::endl;
        return 1;
    }

    auto audit = MakeAuditSink(config);
    gradebox::transport::RunnerClient runner(config.gateway.runner_url, *audit, MakeRedactor(config));
    gradebox::grading::GradingDispatcher dispatcher(runner);

    gradebox::transport::ExecuteOptions options;
    options.request_id = gradebox::utils::GenerateRequestId();
    options.route = "cli:grade";
    options.user_id = "cli";
    options.exercise_id = exercise.id;
    options.timeout_ms = config.gateway.request_timeout_ms;
    options.max_stdout_bytes = static_cast<std::size_t>(config.gateway.max_stdout_bytes);
    options.max_stderr_bytes = static_cast<std::size_t>(config.gateway.max_stderr_bytes);

    gradebox::exercise::Submission submission{exercise.id, "cli", "local", std::move(*payload)};
    const auto outcome = dispatcher.Grade(exercise, submission, options);
    if (!outcome.Ok()) {
        std::cout << "Grading failed: " << outcome.failure->message << std::endl;
        return 1;
    }
    std::cout << gradebox::utils::DumpJson(gradebox::grading::GradeResultToJson(*outcome.result), 2) << std::endl;
    return outcome.result->passed ? 0 : 2;
}

void PrintUsage() {
    std::cout << "Usage: gradebox runner | gradebox gateway | gradebox grade <exercise.json> <answer-file>"
              << " | gradebox version" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "runner") {
        return RunRunner();
    }
    if (command == "gateway") {
        return RunGateway();
    }
    if (command == "grade") {
        if (argc < 4) {
            PrintUsage();
            return 1;
        }
        return RunGrade(argv[2], argv[3]);
    }
    if (command == "version") {
        std::cout << "gradebox " << kVersion << std::endl;
        return 0;
    }
    PrintUsage();
    return 1;
}
