#include <gtest/gtest.h>

#include "exercise/exercise_codec.hpp"

using gradebox::exercise::ExerciseType;
using gradebox::exercise::IsSafeDatasetName;
using gradebox::exercise::IsValidExerciseId;
using gradebox::exercise::ParseExercise;
using gradebox::exercise::TestKind;

TEST(ExerciseCodecTest, ParsesCodeExercise) {
    const auto parsed = ParseExercise(nlohmann::json::parse(R"({
        "id": "hello-world",
        "title": "Hello",
        "type": "code",
        "starterCode": "# print here",
        "tests": [{"id": "t1", "type": "output", "expected": "Hello, World!", "description": "prints"}],
        "hints": [{"level": 2, "text": "second"}, {"level": 1, "text": "first"}]
    })"));
    ASSERT_TRUE(parsed.Ok());
    const auto& exercise = *parsed.value;
    EXPECT_EQ(exercise.type, ExerciseType::kCode);
    ASSERT_EQ(exercise.tests.size(), 1u);
    EXPECT_EQ(exercise.tests[0].kind, TestKind::kOutput);
    EXPECT_EQ(exercise.hints.front().text, "first");
    EXPECT_EQ(exercise.hint_unlock_attempts, 2);
}

TEST(ExerciseCodecTest, DebugFixDefaultsAndBounds) {
    const auto parsed = ParseExercise(nlohmann::json::parse(R"({
        "id": "fix-average", "type": "debug_fix", "starterCode": "x = 1",
        "tests": [{"type": "output", "expected": "1"}]
    })"));
    ASSERT_TRUE(parsed.Ok());
    EXPECT_EQ(parsed.value->max_changed_lines, 6);

    const auto too_large = ParseExercise(nlohmann::json::parse(R"({
        "id": "fix-average", "type": "debug_fix", "debugFix": {"maxChangedLines": 201},
        "tests": [{"type": "output", "expected": "1"}]
    })"));
    EXPECT_FALSE(too_large.Ok());
}

TEST(ExerciseCodecTest, RejectsStructurallyInvalidExercises) {
    EXPECT_FALSE(ParseExercise(nlohmann::json::parse(R"({"id": "Bad_Id", "type": "code",
        "tests": [{"type": "output", "expected": "x"}]})")).Ok());
    EXPECT_FALSE(ParseExercise(nlohmann::json::parse(R"({"id": "no-tests", "type": "code"})")).Ok());
    EXPECT_FALSE(ParseExercise(nlohmann::json::parse(R"({"id": "no-rubric", "type": "explain"})")).Ok());
    EXPECT_FALSE(ParseExercise(nlohmann::json::parse(R"({"id": "no-ref", "type": "predict_output"})")).Ok());
    EXPECT_FALSE(ParseExercise(nlohmann::json::parse(R"({"id": "odd", "type": "essay"})")).Ok());
}

TEST(ExerciseCodecTest, ParsesTraceReadingAndRubric) {
    const auto quiz = ParseExercise(nlohmann::json::parse(R"({
        "id": "trace-1", "type": "trace_reading",
        "traceReading": {"stackTrace": "Traceback...", "questions": [
            {"id": "q1", "type": "multiple_choice", "prompt": "Which line?", "options": ["1", "2"], "correctAnswer": "2"},
            {"id": "q2", "type": "short_text", "prompt": "Why?", "correctAnswer": "index", "keywords": ["index"], "points": 2}
        ]}
    })"));
    ASSERT_TRUE(quiz.Ok());
    EXPECT_EQ(quiz.value->questions.size(), 2u);
    EXPECT_EQ(quiz.value->questions[1].points, 2);

    const auto explain = ParseExercise(nlohmann::json::parse(R"({
        "id": "explain-loop", "type": "explain",
        "explainRubric": [{"keywords": ["loop", "range"], "weight": 2, "description": "mentions the loop"}]
    })"));
    ASSERT_TRUE(explain.Ok());
    EXPECT_DOUBLE_EQ(explain.value->rubric[0].weight, 2.0);
}

TEST(ExerciseCodecTest, DatasetRules) {
    EXPECT_TRUE(IsSafeDatasetName("data.csv"));
    EXPECT_FALSE(IsSafeDatasetName("../etc/passwd"));
    EXPECT_FALSE(IsSafeDatasetName("dir/data.csv"));
    EXPECT_FALSE(IsSafeDatasetName(""));

    const auto parsed = ParseExercise(nlohmann::json::parse(R"({
        "id": "csv-sum", "type": "code", "tests": [{"type": "output", "expected": "6"}],
        "dataset": {"files": [{"name": "../x.csv", "content": "1,2,3"}]}
    })"));
    EXPECT_FALSE(parsed.Ok());
}

TEST(ExerciseCodecTest, ExerciseIdFormat) {
    EXPECT_TRUE(IsValidExerciseId("loops-101"));
    EXPECT_FALSE(IsValidExerciseId("Loops"));
    EXPECT_FALSE(IsValidExerciseId(std::string(129, 'a')));
}
