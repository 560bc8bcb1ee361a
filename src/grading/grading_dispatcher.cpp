#include "grading/grading_dispatcher.hpp"

#include <variant>

#include "grading/evaluators.hpp"

namespace gradebox::grading {
namespace {

GradeOutcome WrongPayload(const exercise::Exercise& exercise, const char* expected) {
    return GradeOutcome{
        std::nullopt,
        GradingFailure{FailureKind::kValidation,
                       std::string(exercise::ToString(exercise.type)) + " exercises expect " + expected}};
}

}  // namespace

GradingDispatcher::GradingDispatcher(transport::CodeRunner& runner)
    : runner_(runner) {}

GradeOutcome GradingDispatcher::Grade(const exercise::Exercise& exercise,
                                      const exercise::Submission& submission,
                                      const transport::ExecuteOptions& options) const {
    const auto& payload = submission.payload;
    switch (exercise.type) {
        case exercise::ExerciseType::kCode: {
            const auto* answer = std::get_if<exercise::CodeAnswer>(&payload);
            if (!answer) {
                return WrongPayload(exercise, "code");
            }
            return EvaluateTestSuite(exercise, answer->code, runner_, options);
        }
        case exercise::ExerciseType::kDebugFix: {
            const auto* answer = std::get_if<exercise::CodeAnswer>(&payload);
            if (!answer) {
                return WrongPayload(exercise, "code");
            }
            return EvaluateDebugFix(exercise, answer->code, runner_, options);
        }
        case exercise::ExerciseType::kPredictOutput: {
            const auto* answer = std::get_if<exercise::PredictedOutput>(&payload);
            if (!answer) {
                return WrongPayload(exercise, "predictedOutput");
            }
            return EvaluateOutputMatch(exercise, answer->text, runner_, options);
        }
        case exercise::ExerciseType::kExplain: {
            const auto* answer = std::get_if<exercise::ExplanationText>(&payload);
            if (!answer) {
                return WrongPayload(exercise, "explanationText");
            }
            return EvaluateRubric(exercise, answer->text);
        }
        case exercise::ExerciseType::kTraceReading: {
            const auto* answer = std::get_if<exercise::AnswerMap>(&payload);
            if (!answer) {
                return WrongPayload(exercise, "answers");
            }
            return EvaluateQuiz(exercise, *answer);
        }
    }
    return GradeOutcome{std::nullopt, GradingFailure{FailureKind::kGrading, "unsupported exercise type"}};
}

}  // namespace gradebox::grading
