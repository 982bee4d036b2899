#include "search/search_state.hpp"
#include "common/errors.hpp"

namespace gamemind {

void SearchConfig::validate() const {
    if (simulations < 1) {
        throw ConfigError("mcts_simulations must be >= 1, got " + std::to_string(simulations));
    }
    if (max_depth < 1) {
        throw ConfigError("max_depth must be >= 1, got " + std::to_string(max_depth));
    }
    if (!(exploration_constant >= 0.0)) {
        throw ConfigError("exploration_constant must be >= 0, got " +
                          std::to_string(exploration_constant));
    }
    if (rollout_steps < 1) {
        throw ConfigError("rollout_steps must be >= 1, got " + std::to_string(rollout_steps));
    }
}

} // namespace gamemind
