#include "grading/evaluators.hpp"

#include <algorithm>
#include <cmath>

#include "grading/assertions.hpp"
#include "grading/diff_penalty.hpp"
#include "utils/common.hpp"

namespace gradebox::grading {
namespace {

constexpr const char* kTimeoutMarker = "Execution timeout";

GradeOutcome Graded(GradeResult result) {
    return GradeOutcome{std::move(result), std::nullopt};
}

GradeOutcome GradingError(const std::string& message) {
    return GradeOutcome{std::nullopt, GradingFailure{FailureKind::kGrading, message}};
}

int RoundedPercent(double earned, double total) {
    if (total <= 0.0) {
        return 0;
    }
    return ClampScore(std::llround(earned / total * 100.0));
}

void CopyExecution(const transport::ExecutionResult& execution, Diagnostics& diagnostics) {
    diagnostics.stdout_text = execution.stdout_text;
    diagnostics.stderr_text = execution.stderr_text;
    diagnostics.truncated_stdout = execution.truncated_stdout;
    diagnostics.truncated_stderr = execution.truncated_stderr;
    diagnostics.execution_time_ms = execution.wall_time_ms;
}

// The learner's code was never judged; say so instead of blaming it.
GradeResult ServiceUnavailable(const transport::ExecutionResult& execution) {
    GradeResult result{};
    result.score = 0;
    result.passed = false;
    if (execution.status == transport::TransportStatus::kTimeout) {
        result.feedback = "The grading service did not respond in time (" + execution.error_code +
            "). Your code was not graded; please try again.";
    } else {
        result.feedback = "The grading service is unavailable (" + execution.error_code +
            "). Your code was not graded; please try again.";
    }
    CopyExecution(execution, result.diagnostics);
    result.diagnostics.transport_error_code = execution.error_code;
    return result;
}

std::string TestSuiteFeedback(int passed, int total, const transport::ExecutionResult& execution) {
    if (execution.stderr_text.find(kTimeoutMarker) != std::string::npos) {
        return "Your program hit the execution timeout and was stopped. " +
            std::to_string(passed) + " of " + std::to_string(total) + " tests passed.";
    }
    std::string feedback = passed == total
        ? "All " + std::to_string(total) + " tests passed."
        : std::to_string(passed) + " of " + std::to_string(total) + " tests passed.";
    if (!execution.stderr_text.empty()) {
        feedback += "\nError output:\n" + execution.stderr_text;
    }
    return feedback;
}

}  // namespace

int PassThreshold(exercise::ExerciseType type) {
    switch (type) {
        case exercise::ExerciseType::kCode:
        case exercise::ExerciseType::kDebugFix:
        case exercise::ExerciseType::kPredictOutput:
            return 100;
        case exercise::ExerciseType::kExplain:
        case exercise::ExerciseType::kTraceReading:
            return 80;
    }
    return 100;
}

std::string NormalizeOutput(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (const char ch : text) {
        if (ch == '\n') {
            // Every CR run ending a line goes, not just the last one.
            while (!normalized.empty() && normalized.back() == '\r') {
                normalized.pop_back();
            }
        }
        normalized.push_back(ch);
    }
    return utils::Trim(normalized);
}

GradeOutcome EvaluateTestSuite(const exercise::Exercise& exercise,
                               const std::string& code,
                               transport::CodeRunner& runner,
                               const transport::ExecuteOptions& options) {
    if (exercise.tests.empty()) {
        return GradingError("exercise '" + exercise.id + "' has no tests");
    }

    const auto execution = runner.Execute(code, exercise.tests, exercise.dataset, options);
    if (execution.TransportError()) {
        return Graded(ServiceUnavailable(execution));
    }

    GradeResult result{};
    result.per_test_breakdown = EvaluateAssertions(code, execution.stdout_text, execution.stderr_text, exercise.tests);
    const auto total = static_cast<int>(result.per_test_breakdown.size());
    const auto passed = static_cast<int>(std::count_if(
        result.per_test_breakdown.begin(), result.per_test_breakdown.end(),
        [](const TestOutcome& outcome) { return outcome.passed; }));

    result.score = RoundedPercent(passed, total);
    result.passed = result.score >= PassThreshold(exercise.type);
    result.feedback = TestSuiteFeedback(passed, total, execution);
    CopyExecution(execution, result.diagnostics);
    return Graded(std::move(result));
}

GradeOutcome EvaluateDebugFix(const exercise::Exercise& exercise,
                              const std::string& code,
                              transport::CodeRunner& runner,
                              const transport::ExecuteOptions& options) {
    if (exercise.max_changed_lines < 1) {
        return GradingError("exercise '" + exercise.id + "' has an invalid changed-line budget");
    }
    auto outcome = EvaluateTestSuite(exercise, code, runner, options);
    if (!outcome.Ok()) {
        return outcome;
    }

    auto& result = *outcome.result;
    const int changed = ChangedLines(exercise.starter_code, code);
    result.diagnostics.changed_lines = changed;
    result.diagnostics.max_changed_lines = exercise.max_changed_lines;
    if (!result.diagnostics.transport_error_code.empty()) {
        return outcome;
    }

    const bool all_tests_pass = std::all_of(result.per_test_breakdown.begin(), result.per_test_breakdown.end(),
                                            [](const TestOutcome& test) { return test.passed; });
    if (all_tests_pass && changed > exercise.max_changed_lines) {
        result.score = DiffPenaltyScore(changed, exercise.max_changed_lines);
        result.feedback += "\nThe fix changed " + std::to_string(changed) + " lines; aim for at most " +
            std::to_string(exercise.max_changed_lines) + ".";
    }
    result.passed = result.score >= PassThreshold(exercise.type);
    return outcome;
}

GradeOutcome EvaluateOutputMatch(const exercise::Exercise& exercise,
                                 const std::string& predicted,
                                 transport::CodeRunner& runner,
                                 const transport::ExecuteOptions& options) {
    if (utils::Trim(exercise.reference_solution).empty()) {
        return GradingError("exercise '" + exercise.id + "' has no reference solution");
    }

    const auto execution = runner.Execute(exercise.reference_solution, {}, exercise.dataset, options);
    if (execution.TransportError()) {
        return Graded(ServiceUnavailable(execution));
    }
    if (!execution.stderr_text.empty() && execution.stdout_text.empty()) {
        return GradingError("reference solution for '" + exercise.id + "' failed: " + execution.stderr_text);
    }

    GradeResult result{};
    const bool match = NormalizeOutput(execution.stdout_text) == NormalizeOutput(predicted);
    result.score = match ? 100 : 0;
    result.passed = result.score >= PassThreshold(exercise.type);
    result.feedback = match ? "Your prediction matches the program output."
                            : "Your prediction does not match the program output.";
    CopyExecution(execution, result.diagnostics);
    return Graded(std::move(result));
}

GradeOutcome EvaluateRubric(const exercise::Exercise& exercise, const std::string& explanation) {
    if (exercise.rubric.empty()) {
        return GradingError("exercise '" + exercise.id + "' has no rubric");
    }
    double total = 0.0;
    for (const auto& group : exercise.rubric) {
        if (group.keywords.empty()) {
            return GradingError("exercise '" + exercise.id + "' has a rubric group without keywords");
        }
        total += group.weight;
    }
    if (total <= 0.0) {
        return GradingError("exercise '" + exercise.id + "' has a non-positive rubric weight");
    }

    const auto text = utils::ToLower(explanation);
    double earned = 0.0;
    std::vector<std::string> missing;
    for (const auto& group : exercise.rubric) {
        const bool met = std::all_of(group.keywords.begin(), group.keywords.end(), [&](const std::string& keyword) {
            return text.find(utils::ToLower(keyword)) != std::string::npos;
        });
        if (met) {
            earned += group.weight;
        } else {
            missing.push_back(group.description.empty() ? "mention " + utils::Join(group.keywords, ", ")
                                                        : group.description);
        }
    }

    GradeResult result{};
    result.score = RoundedPercent(earned, total);
    result.passed = result.score >= PassThreshold(exercise.type);
    if (missing.empty()) {
        result.feedback = "Your explanation covers every key point.";
    } else {
        result.feedback = "Your explanation is missing:\n- " + utils::Join(missing, "\n- ");
    }
    return Graded(std::move(result));
}

GradeOutcome EvaluateQuiz(const exercise::Exercise& exercise, const exercise::AnswerMap& answers) {
    if (exercise.questions.empty()) {
        return GradingError("exercise '" + exercise.id + "' has no questions");
    }
    int total = 0;
    for (const auto& question : exercise.questions) {
        total += std::max(question.points, 0);
    }
    if (total <= 0) {
        return GradingError("exercise '" + exercise.id + "' has no points to award");
    }

    GradeResult result{};
    int earned = 0;
    std::vector<std::string> lines;
    for (const auto& question : exercise.questions) {
        const auto it = answers.answers.find(question.id);
        TestOutcome outcome{};
        outcome.id = question.id;
        outcome.description = question.prompt;
        if (it == answers.answers.end() || utils::Trim(it->second).empty()) {
            outcome.message = "no answer";
            lines.push_back("Question " + question.id + ": no answer given.");
            result.per_test_breakdown.push_back(std::move(outcome));
            continue;
        }

        const auto answer = utils::ToLower(utils::Trim(it->second));
        bool correct = false;
        switch (question.type) {
            case exercise::QuestionType::kMultipleChoice:
                correct = answer == utils::ToLower(utils::Trim(question.correct_answer));
                break;
            case exercise::QuestionType::kShortText:
                if (question.keywords.empty()) {
                    correct = answer == utils::ToLower(utils::Trim(question.correct_answer));
                } else {
                    correct = std::any_of(question.keywords.begin(), question.keywords.end(),
                                          [&](const std::string& keyword) {
                                              const auto needle = utils::ToLower(utils::Trim(keyword));
                                              return !needle.empty() && answer.find(needle) != std::string::npos;
                                          });
                }
                break;
        }

        outcome.passed = correct;
        outcome.actual = it->second;
        if (correct) {
            earned += std::max(question.points, 0);
            lines.push_back("Question " + question.id + ": correct.");
        } else {
            lines.push_back("Question " + question.id + ": incorrect.");
        }
        result.per_test_breakdown.push_back(std::move(outcome));
    }

    result.score = RoundedPercent(earned, total);
    result.passed = result.score >= PassThreshold(exercise.type);
    result.feedback = utils::Join(lines, "\n");
    return Graded(std::move(result));
}

}  // namespace gradebox::grading
