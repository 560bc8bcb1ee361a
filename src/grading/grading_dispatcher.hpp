#pragma once

#include "exercise/exercise_types.hpp"
#include "grading/grade_types.hpp"
#include "transport/code_runner.hpp"

namespace gradebox::grading {

// Routes a submission to the evaluator its exercise type calls for.
class GradingDispatcher {
public:
    explicit GradingDispatcher(transport::CodeRunner& runner);

    GradeOutcome Grade(const exercise::Exercise& exercise,
                       const exercise::Submission& submission,
                       const transport::ExecuteOptions& options) const;

private:
    transport::CodeRunner& runner_;
};

}  // namespace gradebox::grading
