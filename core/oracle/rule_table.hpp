#pragma once

#include <string>
#include <vector>

namespace gamemind {

struct SubgoalRule {
    std::string key;                    // matched as a substring of the goal
    std::vector<std::string> subgoals;
};

// ─── Rule Table ────────────────────────────────────────────────
// Ordered keyword → subgoal list mapping used when no backend answer
// is available. Lookup is case-insensitive and the first matching
// rule wins.

class RuleTable {
public:
    RuleTable(std::vector<SubgoalRule> rules, std::vector<std::string> default_subgoals);

    const std::vector<std::string>& lookup(const std::string& goal) const;

    const std::vector<SubgoalRule>& rules() const { return rules_; }
    const std::vector<std::string>& defaultSubgoals() const { return default_; }

    /// Four-step decompositions used behind the remote oracle.
    static RuleTable generatorRules();

    /// Short three-step decompositions used when subgoal generation is off.
    static RuleTable basicRules();

private:
    std::vector<SubgoalRule> rules_;    // keys stored lower-case
    std::vector<std::string> default_;
};

} // namespace gamemind
