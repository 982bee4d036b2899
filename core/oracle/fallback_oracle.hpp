#pragma once

#include "oracle/subgoal_oracle.hpp"
#include "oracle/rule_table.hpp"

namespace gamemind {

/// Deterministic, rule-table oracle. Never touches the network and is
/// immutable after construction, so one instance may be shared freely
/// between threads.
class FallbackOracle : public SubgoalOracle {
public:
    explicit FallbackOracle(RuleTable table = RuleTable::generatorRules())
        : table_(std::move(table)) {}

    std::vector<std::string> generateSubgoals(
        const std::string& goal, const Observation* current_state) const override;

    /// Fixed answer: medium complexity, three steps.
    TaskAnalysis analyzeTask(const std::string& task) const override;

    std::string name() const override { return "fallback"; }

    const RuleTable& table() const { return table_; }

private:
    RuleTable table_;
};

} // namespace gamemind
