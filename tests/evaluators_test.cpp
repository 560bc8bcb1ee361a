#include <gtest/gtest.h>

#include "grading/evaluators.hpp"
#include "test_support.hpp"

using namespace gradebox;
using gradebox::testing::FakeCodeRunner;
using gradebox::testing::HelloWorldExercise;
using gradebox::testing::OutputTest;

namespace {

transport::ExecuteOptions Options() {
    transport::ExecuteOptions options;
    options.request_id = "req-1";
    options.route = "/api/grade";
    return options;
}

std::string NumberedLines(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        text += "line_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    }
    return text;
}

}  // namespace

TEST(EvaluatorsTest, PassThresholds) {
    EXPECT_EQ(grading::PassThreshold(exercise::ExerciseType::kCode), 100);
    EXPECT_EQ(grading::PassThreshold(exercise::ExerciseType::kDebugFix), 100);
    EXPECT_EQ(grading::PassThreshold(exercise::ExerciseType::kPredictOutput), 100);
    EXPECT_EQ(grading::PassThreshold(exercise::ExerciseType::kExplain), 80);
    EXPECT_EQ(grading::PassThreshold(exercise::ExerciseType::kTraceReading), 80);
}

TEST(EvaluatorsTest, NormalizeOutputIsIdempotent) {
    const auto once = grading::NormalizeOutput("  a\r\nb\r\n\n");
    EXPECT_EQ(once, "a\nb");
    EXPECT_EQ(grading::NormalizeOutput(once), once);

    const auto stacked = grading::NormalizeOutput("a\r\r\nb");
    EXPECT_EQ(stacked, "a\nb");
    EXPECT_EQ(grading::NormalizeOutput(stacked), stacked);
    EXPECT_EQ(grading::NormalizeOutput("x\r\ry\r\n"), "x\r\ry");
}

TEST(EvaluatorsTest, HelloWorldPasses) {
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("Hello, World!\n");

    const auto outcome = grading::EvaluateTestSuite(HelloWorldExercise(), "print('Hello, World!')", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 100);
    EXPECT_TRUE(outcome.result->passed);
    EXPECT_EQ(outcome.result->feedback, "All 1 tests passed.");
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].code, "print('Hello, World!')");
    EXPECT_EQ(runner.calls[0].options.request_id, "req-1");
}

TEST(EvaluatorsTest, PartialCreditIsRounded) {
    auto exercise = HelloWorldExercise();
    exercise.tests = {OutputTest("t1", "1"), OutputTest("t2", "2"), OutputTest("t3", "1")};
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("1");

    const auto outcome = grading::EvaluateTestSuite(exercise, "print(1)", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 67);
    EXPECT_FALSE(outcome.result->passed);
    EXPECT_EQ(outcome.result->feedback, "2 of 3 tests passed.");
}

TEST(EvaluatorsTest, StderrIsAppendedToFeedback) {
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("", "NameError: name 'x' is not defined");

    const auto outcome = grading::EvaluateTestSuite(HelloWorldExercise(), "print(x)", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 0);
    EXPECT_NE(outcome.result->feedback.find("Error output:\nNameError"), std::string::npos);
}

TEST(EvaluatorsTest, ExecutionTimeoutGetsDedicatedFeedback) {
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("", "Error: Execution timeout (2 seconds exceeded)");

    const auto outcome = grading::EvaluateTestSuite(HelloWorldExercise(), "while True: pass", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 0);
    EXPECT_NE(outcome.result->feedback.find("execution timeout"), std::string::npos);
}

TEST(EvaluatorsTest, TransportFailureScoresZeroAndIsFlagged) {
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Failed(transport::TransportStatus::kNetworkError, transport::kRunnerNetworkError);

    const auto outcome = grading::EvaluateTestSuite(HelloWorldExercise(), "print('Hello, World!')", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 0);
    EXPECT_FALSE(outcome.result->passed);
    EXPECT_EQ(outcome.result->diagnostics.transport_error_code, transport::kRunnerNetworkError);
    EXPECT_NE(outcome.result->feedback.find("unavailable"), std::string::npos);
}

TEST(EvaluatorsTest, NoTestsIsAGradingError) {
    auto exercise = HelloWorldExercise();
    exercise.tests.clear();
    FakeCodeRunner runner;

    const auto outcome = grading::EvaluateTestSuite(exercise, "print(1)", runner, Options());
    ASSERT_FALSE(outcome.Ok());
    EXPECT_EQ(outcome.failure->kind, grading::FailureKind::kGrading);
    EXPECT_TRUE(runner.calls.empty());
}

TEST(EvaluatorsTest, DebugFixOverBudgetIsPenalized) {
    auto exercise = HelloWorldExercise();
    exercise.type = exercise::ExerciseType::kDebugFix;
    exercise.starter_code = NumberedLines(10);
    exercise.max_changed_lines = 6;
    exercise.tests = {OutputTest("t1", "ok")};

    auto fixed = exercise.starter_code;
    for (int i = 0; i < 4; ++i) {
        const auto from = "line_" + std::to_string(i) + " = ";
        fixed.replace(fixed.find(from), from.size(), "fixed_" + std::to_string(i) + " = ");
    }

    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("ok");
    const auto outcome = grading::EvaluateDebugFix(exercise, fixed, runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->diagnostics.changed_lines, 8);
    EXPECT_EQ(outcome.result->diagnostics.max_changed_lines, 6);
    EXPECT_EQ(outcome.result->score, 75);
    EXPECT_FALSE(outcome.result->passed);
    EXPECT_NE(outcome.result->feedback.find("changed 8 lines"), std::string::npos);
}

TEST(EvaluatorsTest, DebugFixWithinBudgetKeepsFullScore) {
    auto exercise = HelloWorldExercise();
    exercise.type = exercise::ExerciseType::kDebugFix;
    exercise.starter_code = "total = 0\nprint(totl)\n";
    exercise.tests = {OutputTest("t1", "0")};

    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("0\n");
    const auto outcome = grading::EvaluateDebugFix(exercise, "total = 0\nprint(total)\n", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 100);
    EXPECT_TRUE(outcome.result->passed);
    EXPECT_EQ(outcome.result->diagnostics.changed_lines, 2);
}

TEST(EvaluatorsTest, OutputMatchRunsReferenceSolution) {
    exercise::Exercise exercise;
    exercise.id = "predict-sum";
    exercise.type = exercise::ExerciseType::kPredictOutput;
    exercise.reference_solution = "print(sum([1, 2, 3]))";

    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("6\r\n");
    const auto outcome = grading::EvaluateOutputMatch(exercise, " 6 \n", runner, Options());
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 100);
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].code, exercise.reference_solution);
    EXPECT_TRUE(runner.calls[0].tests.empty());

    const auto wrong = grading::EvaluateOutputMatch(exercise, "7", runner, Options());
    ASSERT_TRUE(wrong.Ok());
    EXPECT_EQ(wrong.result->score, 0);
}

TEST(EvaluatorsTest, BrokenReferenceSolutionIsAGradingError) {
    exercise::Exercise exercise;
    exercise.id = "predict-broken";
    exercise.type = exercise::ExerciseType::kPredictOutput;
    exercise.reference_solution = "print(undefined)";

    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("", "NameError");
    const auto outcome = grading::EvaluateOutputMatch(exercise, "anything", runner, Options());
    ASSERT_FALSE(outcome.Ok());
    EXPECT_EQ(outcome.failure->kind, grading::FailureKind::kGrading);
}

TEST(EvaluatorsTest, RubricScoresWeightedGroups) {
    exercise::Exercise exercise;
    exercise.id = "explain-loop";
    exercise.type = exercise::ExerciseType::kExplain;
    exercise.rubric = {
        exercise::RubricGroup{{"loop", "range"}, 3.0, "describes the loop"},
        exercise::RubricGroup{{"sum"}, 1.0, ""},
    };

    const auto full = grading::EvaluateRubric(exercise, "The LOOP walks a range and builds a sum.");
    ASSERT_TRUE(full.Ok());
    EXPECT_EQ(full.result->score, 100);
    EXPECT_EQ(full.result->feedback, "Your explanation covers every key point.");

    const auto partial = grading::EvaluateRubric(exercise, "a loop over a range");
    ASSERT_TRUE(partial.Ok());
    EXPECT_EQ(partial.result->score, 75);
    EXPECT_FALSE(partial.result->passed);
    EXPECT_NE(partial.result->feedback.find("- mention sum"), std::string::npos);

    const auto empty = grading::EvaluateRubric(exercise, "");
    ASSERT_TRUE(empty.Ok());
    EXPECT_EQ(empty.result->score, 0);
}

TEST(EvaluatorsTest, RubricWithoutGroupsIsAGradingError) {
    exercise::Exercise exercise;
    exercise.id = "explain-empty";
    exercise.type = exercise::ExerciseType::kExplain;
    EXPECT_FALSE(grading::EvaluateRubric(exercise, "text").Ok());
}

TEST(EvaluatorsTest, QuizScoresEachQuestion) {
    exercise::Exercise exercise;
    exercise.id = "trace-index";
    exercise.type = exercise::ExerciseType::kTraceReading;

    exercise::QuizQuestion which_line;
    which_line.id = "q1";
    which_line.correct_answer = "Line 4";
    exercise::QuizQuestion why;
    why.id = "q2";
    why.type = exercise::QuestionType::kShortText;
    why.correct_answer = "the index is out of range";
    why.keywords = {"index", "out of range"};
    exercise::QuizQuestion fallback;
    fallback.id = "q3";
    fallback.type = exercise::QuestionType::kShortText;
    fallback.correct_answer = "IndexError";
    fallback.points = 2;
    exercise.questions = {which_line, why, fallback};

    exercise::AnswerMap answers;
    answers.answers = {{"q1", "  line 4 "}, {"q2", "The Index was too big"}, {"q3", "indexerror"}};
    const auto outcome = grading::EvaluateQuiz(exercise, answers);
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 100);
    ASSERT_EQ(outcome.result->per_test_breakdown.size(), 3u);

    answers.answers = {{"q1", "line 5"}, {"q3", "IndexError"}};
    const auto partial = grading::EvaluateQuiz(exercise, answers);
    ASSERT_TRUE(partial.Ok());
    EXPECT_EQ(partial.result->score, 50);
    EXPECT_FALSE(partial.result->passed);
    EXPECT_EQ(partial.result->feedback,
              "Question q1: incorrect.\nQuestion q2: no answer given.\nQuestion q3: correct.");
}
