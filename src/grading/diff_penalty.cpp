#include "grading/diff_penalty.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace gradebox::grading {
namespace {

std::vector<std::string> NormalizedLines(const std::string& text) {
    auto lines = utils::SplitLines(text);
    // A trailing newline does not count as an extra empty line.
    if (lines.size() > 1 && lines.back().empty()) {
        lines.pop_back();
    }
    if (lines.size() == 1 && lines.front().empty()) {
        lines.clear();
    }
    return lines;
}

}  // namespace

int ChangedLines(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const auto& shorter = a.size() <= b.size() ? a : b;
    const auto& longer = a.size() <= b.size() ? b : a;

    // Two rolling rows over the shorter sequence.
    std::vector<int> previous(shorter.size() + 1, 0);
    std::vector<int> current(shorter.size() + 1, 0);
    for (std::size_t i = 1; i <= longer.size(); ++i) {
        for (std::size_t j = 1; j <= shorter.size(); ++j) {
            if (longer[i - 1] == shorter[j - 1]) {
                current[j] = previous[j - 1] + 1;
            } else {
                current[j] = std::max(previous[j], current[j - 1]);
            }
        }
        std::swap(previous, current);
    }
    const int lcs = previous[shorter.size()];
    return static_cast<int>(a.size() + b.size()) - 2 * lcs;
}

int ChangedLines(const std::string& before, const std::string& after) {
    return ChangedLines(NormalizedLines(before), NormalizedLines(after));
}

int DiffPenaltyScore(int changed_lines, int max_changed_lines) {
    if (changed_lines <= max_changed_lines) {
        return 100;
    }
    if (max_changed_lines <= 0) {
        return 1;
    }
    const int scaled = static_cast<int>(100LL * max_changed_lines / changed_lines);
    return std::clamp(scaled, 1, 99);
}

}  // namespace gradebox::grading
