#include "transport/runner_client.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "exercise/exercise_codec.hpp"
#include "utils/json_text.hpp"
#include "utils/logging.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace gradebox::transport {
namespace {

constexpr const char* kTimeoutStderr = "Runner service did not respond in time";

struct ParsedUrl {
    bool https = false;
    std::string host;
    int port = 80;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            utils::LogWarn("runner-client", "invalid port in runner url, using default");
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string StringField(const nlohmann::json& body, const char* key) {
    if (body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return {};
}

// Echoed text in a test result is program output too: redact it and hold it
// to the stdout ceiling. Sets `truncated` when any value was cut.
nlohmann::json ScrubEchoedValue(const nlohmann::json& value, const Redactor& redactor, std::size_t max_bytes,
                                bool& truncated) {
    if (value.is_array() || value.is_object()) {
        auto copy = value;
        for (auto& element : copy) {
            element = ScrubEchoedValue(element, redactor, max_bytes, truncated);
        }
        return copy;
    }
    if (!value.is_string()) {
        return value;
    }
    auto cut = TruncateByBytes(redactor.Redact(value.get<std::string>()), max_bytes);
    truncated = truncated || cut.truncated;
    return cut.value;
}

std::vector<grading::TestOutcome> ParseTestResults(const nlohmann::json& body,
                                                   const Redactor& redactor,
                                                   std::size_t max_bytes,
                                                   bool& truncated) {
    std::vector<grading::TestOutcome> outcomes;
    if (!body.contains("testResults") || !body["testResults"].is_array()) {
        return outcomes;
    }
    for (const auto& item : body["testResults"]) {
        if (!item.is_object()) {
            continue;
        }
        grading::TestOutcome outcome;
        outcome.id = StringField(item, "id");
        outcome.description = StringField(item, "description");
        outcome.passed = item.contains("passed") && item["passed"].is_boolean() && item["passed"].get<bool>();
        if (item.contains("expected")) {
            outcome.expected = ScrubEchoedValue(item["expected"], redactor, max_bytes, truncated);
        }
        if (item.contains("actual")) {
            outcome.actual = ScrubEchoedValue(item["actual"], redactor, max_bytes, truncated);
        }
        auto message = TruncateByBytes(redactor.Redact(StringField(item, "message")), max_bytes);
        truncated = truncated || message.truncated;
        outcome.message = std::move(message.value);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

}  // namespace

const char* ToString(TransportStatus status) {
    switch (status) {
        case TransportStatus::kOk: return "ok";
        case TransportStatus::kTimeout: return "timeout";
        case TransportStatus::kHttpError: return "http_error";
        case TransportStatus::kNetworkError: return "network_error";
    }
    return "ok";
}

RunnerClient::RunnerClient(std::string runner_url, audit::AuditSink& audit, Redactor redactor)
    : runner_url_(std::move(runner_url)),
      audit_(audit),
      redactor_(std::move(redactor)) {
    const auto parsed = ParseUrl(runner_url_);
    scheme_host_port_ = parsed.https ? "https://" : "http://";
    scheme_host_port_ += parsed.host + ":" + std::to_string(parsed.port);
    base_path_ = parsed.base_path;
}

audit::AuditEvent RunnerClient::BaseEvent(const ExecuteOptions& options) const {
    audit::AuditEvent event;
    event.request_id = options.request_id;
    event.route = options.route;
    event.user_id = options.user_id;
    event.ip = options.ip;
    event.user_agent = options.user_agent;
    event.exercise_id = options.exercise_id;
    return event;
}

ExecutionResult RunnerClient::Fail(TransportStatus status,
                                   const std::string& error_code,
                                   const std::string& message,
                                   const ExecuteOptions& options,
                                   std::optional<int> runner_status) {
    auto event = BaseEvent(options);
    event.level = audit::AuditLevel::kError;
    switch (status) {
        case TransportStatus::kTimeout: event.event = "runner.timeout"; break;
        case TransportStatus::kHttpError: event.event = "runner.http_error"; break;
        case TransportStatus::kNetworkError:
        case TransportStatus::kOk: event.event = "runner.network_error"; break;
    }
    event.runner_status = runner_status;
    event.error_code = error_code;
    event.message = message;
    audit_.Record(event);

    ExecutionResult result;
    result.status = status;
    result.success = false;
    result.all_passed = false;
    result.stderr_text = status == TransportStatus::kTimeout ? kTimeoutStderr : message;
    result.wall_time_ms = status == TransportStatus::kTimeout ? options.timeout_ms : 0;
    result.error = message;
    result.runner_status = runner_status;
    result.error_code = error_code;
    return result;
}

ExecutionResult RunnerClient::Execute(const std::string& code,
                                      const std::vector<exercise::TestSpec>& tests,
                                      const exercise::Dataset& dataset,
                                      const ExecuteOptions& options) {
    nlohmann::json payload = {
        {"code", code},
        {"tests", exercise::TestSpecsToJson(tests)}
    };
    if (!dataset.Empty()) {
        payload["dataset"] = exercise::DatasetToJson(dataset);
    }

    const auto deadline = std::chrono::milliseconds(std::max(options.timeout_ms, 1));
    httplib::Client client(scheme_host_port_);
    client.set_connection_timeout(deadline);
    client.set_read_timeout(deadline);
    client.set_write_timeout(deadline);

    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::atomic<bool> aborted{false};
    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(mutex);
        if (!done_cv.wait_for(lock, deadline, [&]() { return done; })) {
            aborted = true;
            client.stop();
        }
    });

    const auto started = std::chrono::steady_clock::now();
    const std::string endpoint = base_path_ + "/run";
    httplib::Headers headers{{"X-Request-Id", options.request_id}};
    auto response = client.Post(endpoint.c_str(), headers, utils::DumpJson(payload), "application/json");
    {
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
    }
    done_cv.notify_all();
    watchdog.join();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!response) {
        if (aborted || elapsed >= deadline) {
            return Fail(TransportStatus::kTimeout, kRunnerTimeout, "Runner service timeout", options);
        }
        const auto err = response.error();
        const auto message = redactor_.Redact("Runner request failed: " + httplib::to_string(err));
        return Fail(TransportStatus::kNetworkError, kRunnerNetworkError, message, options);
    }

    nlohmann::json body = nlohmann::json::parse(response->body, nullptr, false);
    if (response->status >= 400) {
        const auto error_text = body.is_object() ? StringField(body, "error") : std::string();
        const auto message = redactor_.Redact(
            error_text.empty() ? "Runner service error (HTTP " + std::to_string(response->status) + ")"
                               : error_text);
        return Fail(TransportStatus::kHttpError, kRunnerHttpError, message, options, response->status);
    }
    if (body.is_discarded() || !body.is_object()) {
        return Fail(TransportStatus::kHttpError, kRunnerHttpError,
                    "Runner service returned an invalid response", options, response->status);
    }

    const auto raw_stdout = redactor_.Redact(StringField(body, "stdout"));
    const auto raw_stderr = redactor_.Redact(StringField(body, "stderr"));
    auto stdout_trunc = TruncateByBytes(raw_stdout, options.max_stdout_bytes);
    auto stderr_trunc = TruncateByBytes(raw_stderr, options.max_stderr_bytes);
    bool results_truncated = false;
    auto test_results = ParseTestResults(body, redactor_, options.max_stdout_bytes, results_truncated);

    if (stdout_trunc.truncated || stderr_trunc.truncated || results_truncated) {
        auto event = BaseEvent(options);
        event.level = audit::AuditLevel::kWarn;
        event.event = "runner.output_truncated";
        event.error_code = kOutputTruncated;
        event.meta = {
            {"stdoutBytes", raw_stdout.size()},
            {"stderrBytes", raw_stderr.size()},
            {"maxStdoutBytes", options.max_stdout_bytes},
            {"maxStderrBytes", options.max_stderr_bytes},
            {"testResultsTruncated", results_truncated}
        };
        audit_.Record(event);
    }

    ExecutionResult result;
    result.status = TransportStatus::kOk;
    result.success = body.contains("success") && body["success"].is_boolean() && body["success"].get<bool>();
    result.all_passed = body.contains("allPassed") && body["allPassed"].is_boolean() && body["allPassed"].get<bool>();
    result.stdout_text = std::move(stdout_trunc.value);
    result.stderr_text = std::move(stderr_trunc.value);
    result.truncated_stdout = stdout_trunc.truncated || results_truncated;
    result.truncated_stderr = stderr_trunc.truncated;
    result.test_results = std::move(test_results);
    if (body.contains("executionTimeMs") && body["executionTimeMs"].is_number()) {
        result.wall_time_ms = body["executionTimeMs"].get<long long>();
    }
    result.error = redactor_.Redact(StringField(body, "error"));
    result.runner_status = response->status;
    return result;
}

}  // namespace gradebox::transport
