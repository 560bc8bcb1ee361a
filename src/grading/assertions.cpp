#include "grading/assertions.hpp"

#include <regex>

#include "utils/common.hpp"

namespace gradebox::grading {
namespace {

using exercise::TestKind;
using exercise::TestSpec;

std::string EscapeRegex(const std::string& value) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{}-/)";
    std::string out;
    out.reserve(value.size() * 2);
    for (char ch : value) {
        if (kSpecial.find(ch) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

std::string NormalizeTypeName(const std::string& name) {
    const auto lowered = utils::ToLower(utils::Trim(name));
    if (lowered == "string") {
        return "str";
    }
    if (lowered == "integer") {
        return "int";
    }
    if (lowered == "dictionary") {
        return "dict";
    }
    return lowered;
}

std::optional<std::string> FindListLiteral(const std::string& source, const std::string& name) {
    const std::regex pattern("\\b" + EscapeRegex(name) + "\\s*=\\s*\\[(.+?)\\]");
    std::smatch match;
    if (!std::regex_search(source, match, pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

TestOutcome Begin(const TestSpec& spec) {
    TestOutcome outcome{};
    outcome.id = spec.id;
    outcome.description = spec.description.empty() ? std::string("Test") : spec.description;
    return outcome;
}

TestOutcome CheckOutput(const std::string& stdout_text, const TestSpec& spec) {
    auto outcome = Begin(spec);
    const auto expected = utils::Trim(ExpectedAsText(spec.expected));
    const auto actual = utils::Trim(stdout_text);
    outcome.passed = actual == expected;
    outcome.expected = expected;
    outcome.actual = actual;
    return outcome;
}

TestOutcome CheckVariableExists(const std::string& source, const TestSpec& spec) {
    auto outcome = Begin(spec);
    const std::regex pattern("\\b" + EscapeRegex(spec.variable) + "\\s*=");
    outcome.passed = !spec.variable.empty() && std::regex_search(source, pattern);
    outcome.expected = "Variable '" + spec.variable + "' should exist";
    outcome.actual = outcome.passed ? "Found" : "Not found";
    return outcome;
}

TestOutcome CheckVariableType(const std::string& source, const TestSpec& spec) {
    auto outcome = Begin(spec);
    outcome.expected = spec.expected_type;
    const auto literal = FindLastAssignment(source, spec.variable);
    if (!literal) {
        outcome.actual = "Variable not found";
        return outcome;
    }
    const auto actual_type = InferLiteralType(*literal);
    outcome.actual = actual_type;
    outcome.passed = actual_type == NormalizeTypeName(spec.expected_type);
    return outcome;
}

TestOutcome CheckVariableValue(const std::string& source, const TestSpec& spec) {
    auto outcome = Begin(spec);
    outcome.expected = spec.expected;
    const auto literal = FindLastAssignment(source, spec.variable);
    if (!literal) {
        outcome.actual = "Variable not found";
        return outcome;
    }
    const auto expected = ExpectedAsText(spec.expected);
    outcome.actual = *literal;
    outcome.passed = *literal == expected ||
        *literal == "\"" + expected + "\"" ||
        *literal == "'" + expected + "'";
    return outcome;
}

TestOutcome CheckFunctionCall(const std::string& stdout_text, const TestSpec& spec) {
    auto outcome = Begin(spec);
    const auto expected = utils::Trim(ExpectedAsText(spec.expected));
    outcome.expected = expected;
    outcome.actual = stdout_text;
    for (const auto& line : utils::SplitLines(stdout_text)) {
        if (utils::Trim(line) == expected) {
            outcome.passed = true;
            break;
        }
    }
    return outcome;
}

TestOutcome CheckListContains(const std::string& source, const TestSpec& spec) {
    auto outcome = Begin(spec);
    const auto item = ExpectedAsText(spec.expected);
    outcome.expected = "List should contain " + item;
    const auto content = FindListLiteral(source, spec.variable);
    if (!content) {
        outcome.actual = "List not found";
        return outcome;
    }
    outcome.actual = *content;
    outcome.passed = content->find(spec.expected.dump()) != std::string::npos ||
        content->find("'" + item + "'") != std::string::npos ||
        content->find("\"" + item + "\"") != std::string::npos;
    return outcome;
}

TestOutcome CheckListLength(const std::string& source, const TestSpec& spec) {
    auto outcome = Begin(spec);
    outcome.expected = spec.expected;
    const auto content = FindListLiteral(source, spec.variable);
    if (!content) {
        outcome.actual = "List not found";
        return outcome;
    }
    long long count = 0;
    std::size_t start = 0;
    while (start <= content->size()) {
        auto comma = content->find(',', start);
        if (comma == std::string::npos) {
            comma = content->size();
        }
        if (!utils::Trim(content->substr(start, comma - start)).empty()) {
            ++count;
        }
        start = comma + 1;
    }
    outcome.actual = count;
    outcome.passed = spec.expected.is_number_integer() && spec.expected.get<long long>() == count;
    return outcome;
}

}  // namespace

std::string ExpectedAsText(const nlohmann::json& expected) {
    if (expected.is_string()) {
        return expected.get<std::string>();
    }
    if (expected.is_null()) {
        return {};
    }
    if (expected.is_boolean()) {
        return expected.get<bool>() ? "True" : "False";
    }
    return expected.dump();
}

std::optional<std::string> FindLastAssignment(const std::string& source, const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    // "==" is a comparison, not an assignment.
    const std::regex pattern("(?:^|[^A-Za-z0-9_.])" + EscapeRegex(name) + "\\s*=(?!=)\\s*(.+)$");
    std::optional<std::string> last;
    for (const auto& line : utils::SplitLines(source)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            last = utils::Trim(match[1].str());
        }
    }
    return last;
}

std::string InferLiteralType(const std::string& literal) {
    static const std::regex kInt("^\\d+$");
    static const std::regex kFloat("^\\d+\\.\\d+$");
    const auto value = utils::Trim(literal);
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
        return "str";
    }
    if (std::regex_match(value, kInt)) {
        return "int";
    }
    if (std::regex_match(value, kFloat)) {
        return "float";
    }
    if (!value.empty() && value.front() == '[' && value.back() == ']') {
        return "list";
    }
    if (!value.empty() && value.front() == '{' && value.back() == '}') {
        return "dict";
    }
    return "unknown";
}

TestOutcome EvaluateAssertion(const std::string& source,
                              const std::string& stdout_text,
                              const std::string& stderr_text,
                              const TestSpec& spec) {
    if (!stderr_text.empty() && stdout_text.empty()) {
        auto outcome = Begin(spec);
        outcome.actual = "Execution error";
        outcome.message = stderr_text;
        return outcome;
    }

    switch (spec.kind) {
        case TestKind::kOutput:
            return CheckOutput(stdout_text, spec);
        case TestKind::kVariableExists:
            return CheckVariableExists(source, spec);
        case TestKind::kVariableType:
            return CheckVariableType(source, spec);
        case TestKind::kVariableValue:
            return CheckVariableValue(source, spec);
        case TestKind::kFunctionCall:
            return CheckFunctionCall(stdout_text, spec);
        case TestKind::kListContains:
            return CheckListContains(source, spec);
        case TestKind::kListLength:
            return CheckListLength(source, spec);
        case TestKind::kUnknown:
            break;
    }
    auto outcome = Begin(spec);
    outcome.message = "Unknown test type: " + spec.kind_name;
    return outcome;
}

std::vector<TestOutcome> EvaluateAssertions(const std::string& source,
                                            const std::string& stdout_text,
                                            const std::string& stderr_text,
                                            const std::vector<exercise::TestSpec>& specs) {
    std::vector<TestOutcome> outcomes;
    outcomes.reserve(specs.size());
    for (const auto& spec : specs) {
        outcomes.push_back(EvaluateAssertion(source, stdout_text, stderr_text, spec));
    }
    return outcomes;
}

}  // namespace gradebox::grading
