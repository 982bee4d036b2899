#pragma once

#include "oracle/subgoal_oracle.hpp"

#include <string>
#include <vector>

namespace gamemind {

/// Parse free-text backend output into subgoals.
/// One subgoal per non-blank line; a leading "12.", "-", "*" or "•" marker
/// is stripped; fragments shorter than 4 characters are dropped; the
/// result is truncated to `max_items`.
std::vector<std::string> parseSubgoals(const std::string& response,
                                       size_t max_items = kMaxSubgoals);

/// Word count of `rationale`: < 10 simple, < 20 medium, else complex.
Complexity estimateComplexity(const std::string& rationale);

/// Number of action words (collect, craft, place, defeat, find, move, use)
/// that occur in `rationale`, clamped to [2, 6].
int estimateSteps(const std::string& rationale);

std::string toLower(std::string s);
std::string trim(const std::string& s);

} // namespace gamemind
