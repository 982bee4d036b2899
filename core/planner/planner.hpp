#pragma once

#include "planner/planner_config.hpp"
#include "oracle/subgoal_oracle.hpp"
#include "oracle/oracle_config.hpp"
#include "search/mcts.hpp"
#include "common/observation.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gamemind {

/// Goal used when a negative reward triggers replanning.
constexpr const char* kRecoveryGoal = "recover from failure";

// ─── Planner ───────────────────────────────────────────────────
// Hierarchical planner: the oracle proposes subgoals, MCTS orders them,
// the most-visited path is returned as the plan.
//
// plan() and updatePlan() never throw; an empty plan means "no plan
// available, keep the previous behaviour". Each call builds and drops
// its own search tree. A Planner is not safe for concurrent calls
// (it advances a seed sequence); use one per agent.

class Planner {
public:
    /// Throws ConfigError if `config` is invalid or `oracle` is null.
    Planner(PlannerConfig config, std::shared_ptr<const SubgoalOracle> oracle);

    /// Build the planner together with its oracle (see makeSubgoalOracle).
    static Planner fromConfig(const PlannerConfig& planning, const OracleConfig& oracle);

    /// Ordered actions for reaching `goal` from `observation`.
    std::vector<std::string> plan(const Observation& observation, const std::string& goal);

    /// Replan with kRecoveryGoal after a negative reward; std::nullopt
    /// means keep executing the current plan.
    std::optional<std::vector<std::string>> updatePlan(const Observation& current_state,
                                                       const std::string& executed_action,
                                                       double reward);

    /// Value estimator for the search. Empty restores the random rollout.
    void setEvaluator(Evaluator fn) { evaluator_ = std::move(fn); }

    const PlannerConfig& config() const { return config_; }
    const SubgoalOracle& oracle() const { return *oracle_; }

    /// Statistics of the most recent search, if one ran.
    const std::optional<SearchResult>& lastSearch() const { return last_search_; }

private:
    const PlannerConfig config_;
    std::shared_ptr<const SubgoalOracle> oracle_;
    Evaluator evaluator_;
    uint64_t next_seed_;
    std::optional<SearchResult> last_search_;

    std::vector<std::string> generateSubgoals(const Observation& observation,
                                              const std::string& goal) const;

    std::vector<std::string> refineWithMcts(const Observation& observation,
                                            const std::vector<std::string>& subgoals);
};

} // namespace gamemind
