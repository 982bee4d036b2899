#pragma once

#include "search/search_state.hpp"

#include <cstdint>

namespace gamemind {

/// Planner settings. Validated once when the Planner is built and held
/// as a const copy afterwards.
struct PlannerConfig {
    bool enabled = true;
    int mcts_simulations = 100;
    int max_depth = 10;
    double exploration_constant = 1.0;
    bool subgoal_generation_enabled = true;
    int max_subgoals = 5;
    int rollout_steps = 10;
    uint64_t seed = 42;

    /// Throws ConfigError on an out-of-range value.
    void validate() const;

    /// Search parameters for one plan() call seeded with `seed`.
    SearchConfig searchConfig(uint64_t seed) const;
};

} // namespace gamemind
