#pragma once

#include "search/search_state.hpp"
#include "search/search_tree.hpp"
#include "search/budget_manager.hpp"
#include "common/observation.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace gamemind {

// ─── Evaluator ─────────────────────────────────────────────────
// Strategy for the simulate step: returns a scalar value estimate for
// a freshly selected or expanded node. Real deployments plug in a
// domain simulator or a learned value estimator here.

using Evaluator = std::function<double(const SearchNode&)>;

/// Default evaluator: sum of `steps` standard-normal samples.
/// Carries no domain knowledge; it only keeps the search running.
class RandomRollout {
public:
    explicit RandomRollout(int steps = 10, uint64_t seed = 42)
        : steps_(steps), rng_(seed) {}

    double operator()(const SearchNode& node);

private:
    int steps_;
    std::mt19937_64 rng_;
    std::normal_distribution<double> noise_{0.0, 1.0};
};

// ─── MCTS Search ───────────────────────────────────────────────
// UCB1 tree search over an opaque state and a candidate action set:
// - selection descends only through nodes fully expanded w.r.t. the
//   current action set
// - expansion adds one random untried action per iteration
// - simulation calls the injected Evaluator
// - extraction follows the most-visited children from the root
//
// One instance owns one tree; search() rebuilds it from scratch.

class MCTSSearch {
public:
    /// Throws ConfigError if `config` is invalid.
    explicit MCTSSearch(SearchConfig config);

    /// Replace the evaluator. An empty function restores the default rollout.
    void setEvaluator(Evaluator fn);

    /// Run exactly config.simulations iterations from `root_state`.
    /// Duplicate actions are collapsed (first occurrence kept).
    SearchResult search(const Observation& root_state,
                        const std::vector<std::string>& actions);

    /// Tree of the last search() call.
    const SearchTree& tree() const { return tree_; }

    /// Descend from `from` while the node has children and no untried action.
    static NodeId selectLeaf(const SearchTree& tree, NodeId from,
                             const std::vector<std::string>& actions,
                             double exploration_constant);

    /// Most-visited path from the root. Falls back to `candidates` when the
    /// root was never expanded.
    static std::vector<std::string> extractPlan(const SearchTree& tree,
                                                const std::vector<std::string>& candidates);

private:
    SearchConfig config_;
    SearchTree tree_;
    Evaluator evaluator_;
    std::mt19937_64 rng_;

    /// Expansion: attach one random untried action, or return `node_id`
    /// unchanged when capped by depth or nothing is left to try.
    NodeId expand(NodeId node_id, const std::vector<std::string>& actions);

    /// Backpropagate the estimate up to and including the root.
    void backpropagate(NodeId node_id, double value);
};

} // namespace gamemind
