#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace gradebox::grading {

struct TestOutcome {
    std::string id;
    std::string description;
    bool passed = false;
    nlohmann::json expected;
    nlohmann::json actual;
    std::string message;
};

struct Diagnostics {
    std::string stdout_text;
    std::string stderr_text;
    bool truncated_stdout = false;
    bool truncated_stderr = false;
    std::optional<int> changed_lines;
    std::optional<int> max_changed_lines;
    long long execution_time_ms = 0;
    // Set when the grading service, not the learner's code, failed.
    std::string transport_error_code;
};

struct GradeResult {
    int score = 0;
    bool passed = false;
    std::string feedback;
    std::vector<TestOutcome> per_test_breakdown;
    Diagnostics diagnostics;
};

enum class FailureKind {
    kValidation,
    kGrading
};

struct GradingFailure {
    FailureKind kind = FailureKind::kGrading;
    std::string message;
};

struct GradeOutcome {
    std::optional<GradeResult> result;
    std::optional<GradingFailure> failure;

    bool Ok() const { return result.has_value(); }
};

int ClampScore(long long score);

nlohmann::json TestOutcomeToJson(const TestOutcome& outcome);
nlohmann::json GradeResultToJson(const GradeResult& result);

}  // namespace gradebox::grading
