#include "planner/planner_config.hpp"
#include "common/errors.hpp"

#include <string>

namespace gamemind {

void PlannerConfig::validate() const {
    if (max_subgoals < 1) {
        throw ConfigError("max_subgoals must be >= 1, got " + std::to_string(max_subgoals));
    }
    searchConfig(seed).validate();
}

SearchConfig PlannerConfig::searchConfig(uint64_t run_seed) const {
    SearchConfig sc;
    sc.simulations = mcts_simulations;
    sc.max_depth = max_depth;
    sc.exploration_constant = exploration_constant;
    sc.rollout_steps = rollout_steps;
    sc.seed = run_seed;
    return sc;
}

} // namespace gamemind
