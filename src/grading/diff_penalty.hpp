#pragma once

#include <string>
#include <vector>

namespace gradebox::grading {

// Minimum number of inserted plus deleted lines turning a into b:
// lenA + lenB - 2 * LCS(a, b). Symmetric, zero for identical input.
int ChangedLines(const std::vector<std::string>& a, const std::vector<std::string>& b);
int ChangedLines(const std::string& before, const std::string& after);

// Score for a fix whose tests all pass. 100 within budget; otherwise scaled
// by max/changed and kept strictly between 0 and 100.
int DiffPenaltyScore(int changed_lines, int max_changed_lines);

}  // namespace gradebox::grading
