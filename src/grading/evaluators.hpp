#pragma once

#include <string>

#include "exercise/exercise_types.hpp"
#include "grading/grade_types.hpp"
#include "transport/code_runner.hpp"

namespace gradebox::grading {

// Minimum score at which an exercise of the given type counts as passed.
int PassThreshold(exercise::ExerciseType type);

// CR runs before LF dropped, then surrounding whitespace trimmed. Idempotent.
std::string NormalizeOutput(const std::string& text);

GradeOutcome EvaluateTestSuite(const exercise::Exercise& exercise,
                               const std::string& code,
                               transport::CodeRunner& runner,
                               const transport::ExecuteOptions& options);

// Test-Suite first; the changed-line budget only matters once every test passes.
GradeOutcome EvaluateDebugFix(const exercise::Exercise& exercise,
                              const std::string& code,
                              transport::CodeRunner& runner,
                              const transport::ExecuteOptions& options);

// Runs the exercise's reference solution, never learner text.
GradeOutcome EvaluateOutputMatch(const exercise::Exercise& exercise,
                                 const std::string& predicted,
                                 transport::CodeRunner& runner,
                                 const transport::ExecuteOptions& options);

GradeOutcome EvaluateRubric(const exercise::Exercise& exercise, const std::string& explanation);

GradeOutcome EvaluateQuiz(const exercise::Exercise& exercise, const exercise::AnswerMap& answers);

}  // namespace gradebox::grading
