#include "exercise/exercise_codec.hpp"

#include <algorithm>
#include <regex>

#include "utils/common.hpp"

namespace gradebox::exercise {
namespace {

std::string StringField(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return {};
}

std::vector<std::string> StringArray(const nlohmann::json& data, const char* key) {
    std::vector<std::string> items;
    if (!data.contains(key) || !data[key].is_array()) {
        return items;
    }
    for (const auto& item : data[key]) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

const nlohmann::json* FindObject(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_object()) {
        return &data[key];
    }
    return nullptr;
}

const nlohmann::json* FindArray(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_array()) {
        return &data[key];
    }
    return nullptr;
}

void ParseRubric(const nlohmann::json& groups, Exercise& exercise, std::vector<ParseError>& errors) {
    std::size_t index = 0;
    for (const auto& group_json : groups) {
        const auto field = "rubric[" + std::to_string(index++) + "]";
        if (!group_json.is_object()) {
            errors.push_back({field, "must be an object"});
            continue;
        }
        RubricGroup group{};
        group.keywords = StringArray(group_json, "keywords");
        group.description = StringField(group_json, "description");
        if (group_json.contains("weight")) {
            if (!group_json["weight"].is_number()) {
                errors.push_back({field + ".weight", "must be a number"});
                continue;
            }
            group.weight = group_json["weight"].get<double>();
        }
        if (group.keywords.empty()) {
            errors.push_back({field + ".keywords", "at least one keyword is required"});
            continue;
        }
        if (group.weight <= 0.0 || group.weight > 10.0) {
            errors.push_back({field + ".weight", "must be in (0, 10]"});
            continue;
        }
        exercise.rubric.push_back(std::move(group));
    }
}

void ParseQuestions(const nlohmann::json& questions, Exercise& exercise, std::vector<ParseError>& errors) {
    std::size_t index = 0;
    for (const auto& question_json : questions) {
        const auto field = "questions[" + std::to_string(index++) + "]";
        if (!question_json.is_object()) {
            errors.push_back({field, "must be an object"});
            continue;
        }
        QuizQuestion question{};
        question.id = StringField(question_json, "id");
        const auto type = StringField(question_json, "type");
        if (type == "short_text") {
            question.type = QuestionType::kShortText;
        } else if (type.empty() || type == "multiple_choice") {
            question.type = QuestionType::kMultipleChoice;
        } else {
            errors.push_back({field + ".type", "unknown question type '" + type + "'"});
            continue;
        }
        question.prompt = StringField(question_json, "prompt");
        if (question.prompt.empty()) {
            question.prompt = StringField(question_json, "question");
        }
        question.options = StringArray(question_json, "options");
        question.correct_answer = StringField(question_json, "correctAnswer");
        question.keywords = StringArray(question_json, "keywords");
        if (question_json.contains("points") && question_json["points"].is_number_integer()) {
            question.points = question_json["points"].get<int>();
        }
        if (question.id.empty()) {
            errors.push_back({field + ".id", "is required"});
            continue;
        }
        if (question.correct_answer.empty()) {
            errors.push_back({field + ".correctAnswer", "is required"});
            continue;
        }
        if (question.points <= 0) {
            errors.push_back({field + ".points", "must be positive"});
            continue;
        }
        exercise.questions.push_back(std::move(question));
    }
}

}  // namespace

const char* ToString(ExerciseType type) {
    switch (type) {
        case ExerciseType::kCode: return "code";
        case ExerciseType::kDebugFix: return "debug_fix";
        case ExerciseType::kPredictOutput: return "predict_output";
        case ExerciseType::kExplain: return "explain";
        case ExerciseType::kTraceReading: return "trace_reading";
    }
    return "code";
}

std::optional<ExerciseType> ExerciseTypeFromString(const std::string& value) {
    if (value == "code") {
        return ExerciseType::kCode;
    }
    if (value == "debug_fix") {
        return ExerciseType::kDebugFix;
    }
    if (value == "predict_output") {
        return ExerciseType::kPredictOutput;
    }
    if (value == "explain") {
        return ExerciseType::kExplain;
    }
    if (value == "trace_reading") {
        return ExerciseType::kTraceReading;
    }
    return std::nullopt;
}

const char* ToString(TestKind kind) {
    switch (kind) {
        case TestKind::kOutput: return "output";
        case TestKind::kVariableExists: return "variable_exists";
        case TestKind::kVariableType: return "variable_type";
        case TestKind::kVariableValue: return "variable_value";
        case TestKind::kFunctionCall: return "function_call";
        case TestKind::kListContains: return "list_contains";
        case TestKind::kListLength: return "list_length";
        case TestKind::kUnknown: return "unknown";
    }
    return "unknown";
}

TestKind TestKindFromString(const std::string& value) {
    static const std::pair<const char*, TestKind> kKinds[] = {
        {"output", TestKind::kOutput},
        {"variable_exists", TestKind::kVariableExists},
        {"variable_type", TestKind::kVariableType},
        {"variable_value", TestKind::kVariableValue},
        {"function_call", TestKind::kFunctionCall},
        {"list_contains", TestKind::kListContains},
        {"list_length", TestKind::kListLength},
    };
    for (const auto& [name, kind] : kKinds) {
        if (value == name) {
            return kind;
        }
    }
    return TestKind::kUnknown;
}

bool IsValidExerciseId(const std::string& id) {
    static const std::regex kIdPattern("^[a-z0-9-]+$");
    return !id.empty() && id.size() <= kMaxExerciseIdLength && std::regex_match(id, kIdPattern);
}

bool IsSafeDatasetName(const std::string& name) {
    if (name.empty() || name.size() > kMaxDatasetFileNameLength) {
        return false;
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name.find('\0') != std::string::npos) {
        return false;
    }
    return true;
}

TestSpec ParseTestSpec(const nlohmann::json& data) {
    TestSpec spec{};
    if (!data.is_object()) {
        spec.kind = TestKind::kUnknown;
        return spec;
    }
    spec.id = StringField(data, "id");
    spec.kind_name = StringField(data, "type");
    if (spec.kind_name.empty()) {
        spec.kind_name = StringField(data, "kind");
    }
    spec.kind = TestKindFromString(spec.kind_name);
    spec.description = StringField(data, "description");
    spec.expected_behavior = StringField(data, "expectedBehavior");
    if (data.contains("expected")) {
        spec.expected = data["expected"];
    }
    spec.variable = StringField(data, "variable");
    spec.expected_type = StringField(data, "expectedType");
    spec.function = StringField(data, "function");
    if (data.contains("args") && data["args"].is_array()) {
        spec.args = data["args"];
    }
    return spec;
}

std::vector<TestSpec> ParseTestSpecs(const nlohmann::json& data) {
    std::vector<TestSpec> specs;
    if (!data.is_array()) {
        return specs;
    }
    specs.reserve(data.size());
    for (const auto& item : data) {
        specs.push_back(ParseTestSpec(item));
    }
    return specs;
}

nlohmann::json TestSpecToJson(const TestSpec& spec) {
    nlohmann::json json = {
        {"id", spec.id},
        {"type", spec.kind == TestKind::kUnknown ? spec.kind_name : std::string(ToString(spec.kind))},
        {"description", spec.description},
        {"expectedBehavior", spec.expected_behavior}
    };
    if (!spec.expected.is_null()) {
        json["expected"] = spec.expected;
    }
    if (!spec.variable.empty()) {
        json["variable"] = spec.variable;
    }
    if (!spec.expected_type.empty()) {
        json["expectedType"] = spec.expected_type;
    }
    if (!spec.function.empty()) {
        json["function"] = spec.function;
    }
    if (!spec.args.empty()) {
        json["args"] = spec.args;
    }
    return json;
}

nlohmann::json TestSpecsToJson(const std::vector<TestSpec>& specs) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& spec : specs) {
        json.push_back(TestSpecToJson(spec));
    }
    return json;
}

std::optional<std::string> ParseDataset(const nlohmann::json& data, Dataset& out) {
    out.files.clear();
    if (data.is_null()) {
        return std::nullopt;
    }
    if (!data.is_object() || !data.contains("files") || !data["files"].is_array()) {
        return std::string("dataset must be an object with a files array");
    }
    const auto& files = data["files"];
    if (files.empty() || files.size() > kMaxDatasetFiles) {
        return "dataset must contain between 1 and " + std::to_string(kMaxDatasetFiles) + " files";
    }
    for (const auto& file : files) {
        if (!file.is_object()) {
            return std::string("dataset file must be an object");
        }
        DatasetFile entry{StringField(file, "name"), StringField(file, "content")};
        if (!IsSafeDatasetName(entry.name)) {
            return "invalid dataset file name '" + entry.name + "'";
        }
        if (entry.content.size() > kMaxDatasetFileBytes) {
            return "dataset file '" + entry.name + "' exceeds " +
                std::to_string(kMaxDatasetFileBytes) + " bytes";
        }
        out.files.push_back(std::move(entry));
    }
    return std::nullopt;
}

nlohmann::json DatasetToJson(const Dataset& dataset) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : dataset.files) {
        files.push_back({{"name", file.name}, {"content", file.content}});
    }
    return {{"files", files}};
}

Parsed<Exercise> ParseExercise(const nlohmann::json& data) {
    Parsed<Exercise> parsed{};
    auto& errors = parsed.errors;
    if (!data.is_object()) {
        errors.push_back({"", "exercise must be a JSON object"});
        return parsed;
    }

    Exercise exercise{};
    exercise.id = StringField(data, "id");
    if (!IsValidExerciseId(exercise.id)) {
        errors.push_back({"id", "must match ^[a-z0-9-]+$ and be at most 128 characters"});
    }
    exercise.title = StringField(data, "title");

    const auto type_name = data.contains("type") ? StringField(data, "type") : std::string("code");
    const auto type = ExerciseTypeFromString(type_name);
    if (!type) {
        errors.push_back({"type", "unknown exercise type '" + type_name + "'"});
        return parsed;
    }
    exercise.type = *type;

    exercise.starter_code = StringField(data, "starterCode");
    exercise.reference_solution = StringField(data, "referenceSolution");
    if (exercise.reference_solution.empty()) {
        exercise.reference_solution = StringField(data, "solutionHidden");
    }

    if (const auto* tests = FindArray(data, "tests")) {
        exercise.tests = ParseTestSpecs(*tests);
        for (std::size_t i = 0; i < exercise.tests.size(); ++i) {
            if (exercise.tests[i].kind == TestKind::kUnknown) {
                errors.push_back({"tests[" + std::to_string(i) + "].type",
                                  "unknown test type '" + exercise.tests[i].kind_name + "'"});
            }
        }
    }

    const nlohmann::json* rubric = FindArray(data, "explainRubric");
    if (!rubric) {
        rubric = FindArray(data, "rubric");
    }
    if (rubric) {
        ParseRubric(*rubric, exercise, errors);
    }

    const nlohmann::json* questions = FindArray(data, "questions");
    if (const auto* trace = FindObject(data, "traceReading")) {
        exercise.stack_trace = StringField(*trace, "stackTrace");
        if (const auto* nested = FindArray(*trace, "questions")) {
            questions = nested;
        }
    }
    if (questions) {
        ParseQuestions(*questions, exercise, errors);
    }

    if (const auto* debug_fix = FindObject(data, "debugFix")) {
        if (debug_fix->contains("maxChangedLines") && (*debug_fix)["maxChangedLines"].is_number_integer()) {
            exercise.max_changed_lines = (*debug_fix)["maxChangedLines"].get<int>();
        }
    } else if (data.contains("maxChangedLines") && data["maxChangedLines"].is_number_integer()) {
        exercise.max_changed_lines = data["maxChangedLines"].get<int>();
    }

    if (const auto* hints = FindArray(data, "hints")) {
        for (const auto& hint_json : *hints) {
            if (!hint_json.is_object()) {
                continue;
            }
            Hint hint{};
            if (hint_json.contains("level") && hint_json["level"].is_number_integer()) {
                hint.level = hint_json["level"].get<int>();
            }
            hint.text = StringField(hint_json, "text");
            exercise.hints.push_back(std::move(hint));
        }
        std::stable_sort(exercise.hints.begin(), exercise.hints.end(), [](const Hint& a, const Hint& b) {
            return a.level < b.level;
        });
    }
    if (data.contains("hintUnlockAttempts") && data["hintUnlockAttempts"].is_number_integer()) {
        exercise.hint_unlock_attempts = data["hintUnlockAttempts"].get<int>();
    }

    if (data.contains("dataset")) {
        if (auto dataset_error = ParseDataset(data["dataset"], exercise.dataset)) {
            errors.push_back({"dataset", *dataset_error});
        }
    }

    switch (exercise.type) {
        case ExerciseType::kCode:
            if (exercise.tests.empty()) {
                errors.push_back({"tests", "code exercises need at least one test"});
            }
            break;
        case ExerciseType::kDebugFix:
            if (exercise.tests.empty()) {
                errors.push_back({"tests", "debug_fix exercises need at least one test"});
            }
            if (exercise.max_changed_lines < 1 || exercise.max_changed_lines > kMaxChangedLinesCeiling) {
                errors.push_back({"debugFix.maxChangedLines", "must be between 1 and 200"});
            }
            break;
        case ExerciseType::kPredictOutput:
            if (utils::Trim(exercise.reference_solution).empty()) {
                errors.push_back({"referenceSolution", "predict_output exercises need a reference solution"});
            }
            break;
        case ExerciseType::kExplain:
            if (exercise.rubric.empty()) {
                errors.push_back({"explainRubric", "explain exercises need at least one rubric group"});
            }
            break;
        case ExerciseType::kTraceReading:
            if (exercise.questions.empty() || exercise.questions.size() > kMaxQuizQuestions) {
                errors.push_back({"traceReading.questions", "trace_reading exercises need 1 to 10 questions"});
            }
            break;
    }

    if (errors.empty()) {
        parsed.value = std::move(exercise);
    }
    return parsed;
}

std::string DescribeErrors(const std::vector<ParseError>& errors) {
    std::vector<std::string> parts;
    parts.reserve(errors.size());
    for (const auto& error : errors) {
        parts.push_back(error.field.empty() ? error.message : error.field + ": " + error.message);
    }
    return utils::Join(parts, "; ");
}

}  // namespace gradebox::exercise
