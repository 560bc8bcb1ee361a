#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exercise/exercise_types.hpp"

#include "nlohmann/json.hpp"

namespace gradebox::exercise {

struct ParseError {
    std::string field;
    std::string message;
};

template <typename T>
struct Parsed {
    std::optional<T> value;
    std::vector<ParseError> errors;

    bool Ok() const { return value.has_value() && errors.empty(); }
};

// Accepts both the structured layout ("explainRubric", "traceReading",
// "debugFix") and flat keys ("rubric", "questions", "maxChangedLines").
Parsed<Exercise> ParseExercise(const nlohmann::json& data);

// Lenient: missing optional fields keep their defaults, unknown kinds become
// TestKind::kUnknown and fail at evaluation time.
TestSpec ParseTestSpec(const nlohmann::json& data);
std::vector<TestSpec> ParseTestSpecs(const nlohmann::json& data);
nlohmann::json TestSpecToJson(const TestSpec& spec);
nlohmann::json TestSpecsToJson(const std::vector<TestSpec>& specs);

// Returns an error message when a dataset entry breaks the size or naming rules.
std::optional<std::string> ParseDataset(const nlohmann::json& data, Dataset& out);
nlohmann::json DatasetToJson(const Dataset& dataset);
bool IsSafeDatasetName(const std::string& name);

bool IsValidExerciseId(const std::string& id);

std::string DescribeErrors(const std::vector<ParseError>& errors);

constexpr std::size_t kMaxExerciseIdLength = 128;
constexpr std::size_t kMaxDatasetFiles = 5;
constexpr std::size_t kMaxDatasetFileNameLength = 128;
constexpr std::size_t kMaxDatasetFileBytes = 64 * 1024;
constexpr std::size_t kMaxQuizQuestions = 10;
constexpr int kMaxChangedLinesCeiling = 200;

}  // namespace gradebox::exercise
