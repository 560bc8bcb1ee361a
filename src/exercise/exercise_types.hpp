#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace gradebox::exercise {

enum class ExerciseType {
    kCode,
    kDebugFix,
    kPredictOutput,
    kExplain,
    kTraceReading
};

enum class TestKind {
    kOutput,
    kVariableExists,
    kVariableType,
    kVariableValue,
    kFunctionCall,
    kListContains,
    kListLength,
    kUnknown
};

struct TestSpec {
    std::string id;
    TestKind kind = TestKind::kOutput;
    // Original wire name, kept so an unknown kind can be reported verbatim.
    std::string kind_name;
    std::string description;
    std::string expected_behavior;
    nlohmann::json expected;
    std::string variable;
    std::string expected_type;
    std::string function;
    nlohmann::json args = nlohmann::json::array();
};

struct DatasetFile {
    std::string name;
    std::string content;
};

struct Dataset {
    std::vector<DatasetFile> files;

    bool Empty() const { return files.empty(); }
};

struct RubricGroup {
    std::vector<std::string> keywords;
    double weight = 1.0;
    std::string description;
};

enum class QuestionType {
    kMultipleChoice,
    kShortText
};

struct QuizQuestion {
    std::string id;
    QuestionType type = QuestionType::kMultipleChoice;
    std::string prompt;
    std::vector<std::string> options;
    std::string correct_answer;
    std::vector<std::string> keywords;
    int points = 1;
};

struct Hint {
    int level = 1;
    std::string text;
};

struct Exercise {
    std::string id;
    std::string title;
    ExerciseType type = ExerciseType::kCode;
    std::string starter_code;
    std::string reference_solution;
    std::vector<TestSpec> tests;
    std::vector<RubricGroup> rubric;
    std::vector<QuizQuestion> questions;
    std::string stack_trace;
    int max_changed_lines = 6;
    std::vector<Hint> hints;
    int hint_unlock_attempts = 2;
    Dataset dataset;
};

struct CodeAnswer {
    std::string code;
};

struct PredictedOutput {
    std::string text;
};

struct ExplanationText {
    std::string text;
};

struct AnswerMap {
    std::unordered_map<std::string, std::string> answers;
};

using SubmissionPayload = std::variant<CodeAnswer, PredictedOutput, ExplanationText, AnswerMap>;

struct Submission {
    std::string exercise_id;
    std::string submitter;
    std::string origin;
    SubmissionPayload payload;
};

const char* ToString(ExerciseType type);
std::optional<ExerciseType> ExerciseTypeFromString(const std::string& value);

const char* ToString(TestKind kind);
TestKind TestKindFromString(const std::string& value);

}  // namespace gradebox::exercise
