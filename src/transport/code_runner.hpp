#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exercise/exercise_types.hpp"
#include "grading/grade_types.hpp"

namespace gradebox::transport {

enum class TransportStatus {
    kOk,
    kTimeout,
    kHttpError,
    kNetworkError
};

const char* ToString(TransportStatus status);

constexpr const char* kRunnerHttpError = "RUNNER_HTTP_ERROR";
constexpr const char* kRunnerTimeout = "RUNNER_TIMEOUT";
constexpr const char* kRunnerNetworkError = "RUNNER_NETWORK_ERROR";
constexpr const char* kOutputTruncated = "OUTPUT_TRUNCATED";

struct ExecuteOptions {
    std::string request_id;
    std::string route;
    std::string user_id;
    std::string ip;
    std::string user_agent;
    std::string exercise_id;

    int timeout_ms = 10000;
    std::size_t max_stdout_bytes = 64 * 1024;
    std::size_t max_stderr_bytes = 64 * 1024;
};

struct ExecutionResult {
    TransportStatus status = TransportStatus::kOk;
    bool success = false;
    bool all_passed = false;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<grading::TestOutcome> test_results;
    long long wall_time_ms = 0;
    bool truncated_stdout = false;
    bool truncated_stderr = false;
    std::string error;
    std::optional<int> runner_status;
    std::string error_code;

    bool TransportError() const { return status != TransportStatus::kOk; }
};

// Seam between the evaluators and the sandbox: one call, one execution.
class CodeRunner {
public:
    virtual ~CodeRunner() = default;
    virtual ExecutionResult Execute(const std::string& code,
                                    const std::vector<exercise::TestSpec>& tests,
                                    const exercise::Dataset& dataset,
                                    const ExecuteOptions& options) = 0;
};

}  // namespace gradebox::transport
