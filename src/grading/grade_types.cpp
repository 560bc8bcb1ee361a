#include "grading/grade_types.hpp"

#include <algorithm>

namespace gradebox::grading {

int ClampScore(long long score) {
    return static_cast<int>(std::clamp<long long>(score, 0, 100));
}

nlohmann::json TestOutcomeToJson(const TestOutcome& outcome) {
    nlohmann::json json = {
        {"id", outcome.id},
        {"description", outcome.description},
        {"passed", outcome.passed}
    };
    if (!outcome.expected.is_null()) {
        json["expected"] = outcome.expected;
    }
    if (!outcome.actual.is_null()) {
        json["actual"] = outcome.actual;
    }
    if (!outcome.message.empty()) {
        json["message"] = outcome.message;
    }
    return json;
}

nlohmann::json GradeResultToJson(const GradeResult& result) {
    nlohmann::json breakdown = nlohmann::json::array();
    for (const auto& outcome : result.per_test_breakdown) {
        breakdown.push_back(TestOutcomeToJson(outcome));
    }

    const auto& diag = result.diagnostics;
    nlohmann::json diagnostics = {
        {"stdout", diag.stdout_text},
        {"stderr", diag.stderr_text},
        {"truncatedStdout", diag.truncated_stdout},
        {"truncatedStderr", diag.truncated_stderr},
        {"executionTimeMs", diag.execution_time_ms}
    };
    if (diag.changed_lines) {
        diagnostics["changedLines"] = *diag.changed_lines;
    }
    if (diag.max_changed_lines) {
        diagnostics["maxChangedLines"] = *diag.max_changed_lines;
    }
    if (!diag.transport_error_code.empty()) {
        diagnostics["errorCode"] = diag.transport_error_code;
    }

    return {
        {"score", result.score},
        {"passed", result.passed},
        {"feedback", result.feedback},
        {"perTestBreakdown", breakdown},
        {"diagnostics", diagnostics}
    };
}

}  // namespace gradebox::grading
