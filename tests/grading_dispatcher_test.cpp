#include <gtest/gtest.h>

#include "grading/grading_dispatcher.hpp"
#include "test_support.hpp"

using namespace gradebox;
using gradebox::testing::FakeCodeRunner;
using gradebox::testing::HelloWorldExercise;

namespace {

exercise::Submission SubmissionOf(exercise::SubmissionPayload payload) {
    return exercise::Submission{"hello-world", "learner", "127.0.0.1", std::move(payload)};
}

}  // namespace

TEST(GradingDispatcherTest, RoutesCodeToTheTestSuite) {
    FakeCodeRunner runner;
    runner.next = FakeCodeRunner::Printed("Hello, World!");
    grading::GradingDispatcher dispatcher(runner);

    const auto outcome = dispatcher.Grade(HelloWorldExercise(),
                                          SubmissionOf(exercise::CodeAnswer{"print('Hello, World!')"}), {});
    ASSERT_TRUE(outcome.Ok());
    EXPECT_TRUE(outcome.result->passed);
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST(GradingDispatcherTest, MismatchedPayloadIsAValidationFailure) {
    FakeCodeRunner runner;
    grading::GradingDispatcher dispatcher(runner);

    const auto outcome = dispatcher.Grade(HelloWorldExercise(),
                                          SubmissionOf(exercise::ExplanationText{"it prints"}), {});
    ASSERT_FALSE(outcome.Ok());
    EXPECT_EQ(outcome.failure->kind, grading::FailureKind::kValidation);
    EXPECT_EQ(outcome.failure->message, "code exercises expect code");
    EXPECT_TRUE(runner.calls.empty());
}

TEST(GradingDispatcherTest, ExplainNeverTouchesTheRunner) {
    FakeCodeRunner runner;
    grading::GradingDispatcher dispatcher(runner);

    exercise::Exercise exercise;
    exercise.id = "explain-print";
    exercise.type = exercise::ExerciseType::kExplain;
    exercise.rubric = {exercise::RubricGroup{{"print"}, 1.0, ""}};

    const auto outcome = dispatcher.Grade(exercise, SubmissionOf(exercise::ExplanationText{"It calls print."}), {});
    ASSERT_TRUE(outcome.Ok());
    EXPECT_EQ(outcome.result->score, 100);
    EXPECT_TRUE(runner.calls.empty());
}
