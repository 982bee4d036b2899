#include "oracle/rule_table.hpp"
#include "oracle/response_parser.hpp"

namespace gamemind {

RuleTable::RuleTable(std::vector<SubgoalRule> rules, std::vector<std::string> default_subgoals)
    : rules_(std::move(rules)), default_(std::move(default_subgoals)) {
    for (auto& rule : rules_) {
        rule.key = toLower(rule.key);
    }
}

const std::vector<std::string>& RuleTable::lookup(const std::string& goal) const {
    std::string lower = toLower(goal);
    for (const auto& rule : rules_) {
        if (lower.find(rule.key) != std::string::npos) {
            return rule.subgoals;
        }
    }
    return default_;
}

RuleTable RuleTable::generatorRules() {
    return RuleTable({
        {"survive",           {"find food", "find shelter", "avoid enemies", "maintain health"}},
        {"collect wood",      {"find trees", "chop wood", "gather resources", "return to base"}},
        {"make wood_pickaxe", {"collect wood", "find workbench", "craft pickaxe", "test tool"}},
        {"place furnace",     {"collect stone", "find location", "place building", "verify placement"}},
        {"defeat zombie",     {"find weapon", "approach enemy", "attack", "retreat if needed"}},
        {"explore",           {"move around", "map area", "find resources", "avoid danger"}},
    }, {"explore environment", "gather resources", "avoid danger", "complete objective"});
}

RuleTable RuleTable::basicRules() {
    return RuleTable({
        {"survive",           {"find food", "find shelter", "avoid enemies"}},
        {"collect wood",      {"find trees", "chop wood", "gather resources"}},
        {"make wood_pickaxe", {"collect wood", "craft pickaxe", "use workbench"}},
        {"place furnace",     {"collect stone", "find location", "place building"}},
        {"defeat zombie",     {"find weapon", "approach enemy", "attack"}},
    }, {"explore", "gather resources", "survive"});
}

} // namespace gamemind
