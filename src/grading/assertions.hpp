#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exercise/exercise_types.hpp"
#include "grading/grade_types.hpp"

namespace gradebox::grading {

// Static, text-level checks. A test passes when the program's printed
// behaviour and the literal structure of its source satisfy the assertion;
// nothing here inspects a live interpreter.
TestOutcome EvaluateAssertion(const std::string& source,
                              const std::string& stdout_text,
                              const std::string& stderr_text,
                              const exercise::TestSpec& spec);

std::vector<TestOutcome> EvaluateAssertions(const std::string& source,
                                            const std::string& stdout_text,
                                            const std::string& stderr_text,
                                            const std::vector<exercise::TestSpec>& specs);

// Right-hand side of the last "name = ..." assignment, trimmed.
std::optional<std::string> FindLastAssignment(const std::string& source, const std::string& name);

// "str", "int", "float", "list", "dict" or "unknown".
std::string InferLiteralType(const std::string& literal);

// Expected value rendered the way it would appear in Python source.
std::string ExpectedAsText(const nlohmann::json& expected);

}  // namespace gradebox::grading
