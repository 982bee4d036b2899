#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gamemind {

/// Search configuration parameters.
struct SearchConfig {
    int simulations = 100;              // fixed iteration budget
    int max_depth = 10;                 // nodes at this depth are never expanded
    double exploration_constant = 1.0;  // C in UCB1
    int rollout_steps = 10;             // length of the default random rollout
    uint64_t seed = 42;

    /// Throws ConfigError on an out-of-range value.
    void validate() const;
};

/// Result of a search run.
struct SearchResult {
    std::vector<std::string> plan;  // most-visited path from the root
    int simulations = 0;
    size_t tree_size = 0;
    int max_depth_reached = 0;
    int root_visits = 0;
    bool degenerate = false;        // root never expanded; plan = candidate list
    double elapsed_seconds = 0.0;
};

} // namespace gamemind
