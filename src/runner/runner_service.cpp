#include "runner/runner_service.hpp"

#include <algorithm>

#include "exercise/exercise_codec.hpp"
#include "grading/assertions.hpp"
#include "utils/json_text.hpp"
#include "utils/logging.hpp"

namespace gradebox::runner {
namespace {

ServiceReply Failure(int status, const std::string& error) {
    return ServiceReply{status, {{"success", false}, {"error", error}}};
}

void WriteReply(httplib::Response& res, const ServiceReply& reply) {
    res.status = reply.status;
    res.set_content(utils::DumpJson(reply.body), "application/json");
}

}  // namespace

RunnerService::RunnerService(config::RunnerConfig config)
    : config_(std::move(config)) {}

sandbox::SandboxLimits RunnerService::Limits() const {
    return sandbox::SandboxLimits{
        .timeout_ms = config_.timeout_ms,
        .max_output_bytes = config_.max_output_bytes,
        .max_code_bytes = config_.max_code_bytes,
        .memory_limit_mb = config_.memory_limit_mb,
        .max_processes = config_.max_processes};
}

ServiceReply RunnerService::HandleRun(const std::string& body, const std::string& request_id) const {
    try {
        const auto data = nlohmann::json::parse(body, nullptr, false);
        if (data.is_discarded() || !data.is_object() || data.empty()) {
            return Failure(400, "Invalid JSON");
        }

        std::string code;
        if (data.contains("code") && data["code"].is_string()) {
            code = data["code"].get<std::string>();
        }
        if (code.empty()) {
            return Failure(400, "No code provided");
        }
        if (static_cast<long long>(code.size()) > config_.max_code_bytes) {
            return Failure(400, "Code exceeds maximum size (" + std::to_string(config_.max_code_bytes) + " bytes)");
        }

        std::vector<exercise::TestSpec> tests;
        if (data.contains("tests")) {
            tests = exercise::ParseTestSpecs(data["tests"]);
        }

        sandbox::ExecRequest request;
        request.interpreter = config_.interpreter;
        request.scratch_root = config_.scratch_dir;
        request.source = code;
        request.limits = Limits();
        if (data.contains("dataset")) {
            if (auto error = exercise::ParseDataset(data["dataset"], request.dataset)) {
                return Failure(400, "Invalid dataset: " + *error);
            }
        }

        const auto exec = sandbox::SandboxExecutor::Run(request);
        if (exec.rejected) {
            utils::LogError("runner", "run rejected request_id=" + request_id + ": " + exec.stderr_text);
            return Failure(500, exec.stderr_text);
        }

        const auto outcomes = grading::EvaluateAssertions(code, exec.stdout_text, exec.stderr_text, tests);
        nlohmann::json test_results = nlohmann::json::array();
        for (const auto& outcome : outcomes) {
            test_results.push_back(grading::TestOutcomeToJson(outcome));
        }
        const bool all_passed = std::all_of(outcomes.begin(), outcomes.end(),
                                            [](const grading::TestOutcome& o) { return o.passed; });

        utils::Log(utils::LogMessage{
            utils::LogLevel::kInfo, "runner", "run finished",
            {{"requestId", request_id},
             {"exitCode", std::to_string(exec.exit_code)},
             {"timedOut", exec.timed_out ? "true" : "false"},
             {"outputExceeded", exec.output_exceeded ? "true" : "false"},
             {"ms", std::to_string(exec.wall_time_ms)}}});

        return ServiceReply{200, {
            {"success", true},
            {"stdout", exec.stdout_text},
            {"stderr", exec.stderr_text},
            {"testResults", test_results},
            {"executionTimeMs", exec.wall_time_ms},
            {"allPassed", all_passed}
        }};
    } catch (const std::exception& ex) {
        utils::LogError("runner", std::string("run failed: ") + ex.what());
        return Failure(500, ex.what());
    }
}

ServiceReply RunnerService::HandleHealth() const {
    return ServiceReply{200, {
        {"status", "healthy"},
        {"service", kServiceName},
        {"version", kServiceVersion}
    }};
}

void RunnerService::Register(httplib::Server& server) const {
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        WriteReply(res, HandleHealth());
    });
    server.Post("/run", [this](const httplib::Request& req, httplib::Response& res) {
        WriteReply(res, HandleRun(req.body, req.get_header_value("X-Request-Id")));
    });
}

}  // namespace gradebox::runner
