#include "oracle/fallback_oracle.hpp"

#include <algorithm>

namespace gamemind {

std::vector<std::string> FallbackOracle::generateSubgoals(
    const std::string& goal, const Observation*) const {
    const auto& subgoals = table_.lookup(goal);
    size_t n = std::min(subgoals.size(), kMaxSubgoals);
    return std::vector<std::string>(subgoals.begin(), subgoals.begin() + n);
}

TaskAnalysis FallbackOracle::analyzeTask(const std::string& task) const {
    TaskAnalysis analysis;
    analysis.task = task;
    analysis.rationale = "Basic task analysis";
    analysis.complexity = Complexity::MEDIUM;
    analysis.estimated_steps = 3;
    return analysis;
}

} // namespace gamemind
