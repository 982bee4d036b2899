#include "search/mcts.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace gamemind {

double RandomRollout::operator()(const SearchNode&) {
    double total = 0.0;
    for (int i = 0; i < steps_; i++) {
        total += noise_(rng_);
    }
    return total;
}

MCTSSearch::MCTSSearch(SearchConfig config)
    : config_(config), rng_(config.seed) {
    config_.validate();
    setEvaluator(nullptr);
}

void MCTSSearch::setEvaluator(Evaluator fn) {
    if (fn) {
        evaluator_ = std::move(fn);
    } else {
        // different stream from the expansion rng
        evaluator_ = RandomRollout(config_.rollout_steps, config_.seed + 1);
    }
}

NodeId MCTSSearch::selectLeaf(const SearchTree& tree, NodeId from,
                              const std::vector<std::string>& actions,
                              double exploration_constant) {
    NodeId current = from;

    while (!tree.node(current).children.empty() &&
           tree.isFullyExpanded(current, actions)) {
        current = tree.bestUcbChild(current, exploration_constant);
    }

    return current;
}

NodeId MCTSSearch::expand(NodeId node_id, const std::vector<std::string>& actions) {
    if (tree_.node(node_id).depth >= config_.max_depth) return node_id;

    auto untried = tree_.untriedActions(node_id, actions);
    if (untried.empty()) return node_id;

    std::uniform_int_distribution<size_t> dist(0, untried.size() - 1);
    return tree_.addChild(node_id, untried[dist(rng_)]);
}

void MCTSSearch::backpropagate(NodeId node_id, double value) {
    NodeId current = node_id;
    while (current != kNoParent) {
        SearchNode& n = tree_.node(current);
        n.visits++;
        n.value += value;
        current = n.parent;
    }
}

std::vector<std::string> MCTSSearch::extractPlan(const SearchTree& tree,
                                                 const std::vector<std::string>& candidates) {
    if (tree.empty() || tree.node(tree.root()).children.empty()) {
        return candidates;
    }

    std::vector<std::string> plan;
    NodeId current = tree.mostVisitedChild(tree.root());
    while (current != kNoParent) {
        const SearchNode& n = tree.node(current);
        if (n.action) plan.push_back(*n.action);
        current = tree.mostVisitedChild(current);
    }
    return plan;
}

SearchResult MCTSSearch::search(const Observation& root_state,
                                const std::vector<std::string>& actions) {
    std::vector<std::string> unique_actions;
    std::unordered_set<std::string> seen;
    for (const auto& a : actions) {
        if (seen.insert(a).second) unique_actions.push_back(a);
    }

    NodeId root = tree_.createRoot(root_state);

    BudgetManager budget(config_.simulations);
    budget.start();

    while (budget.canContinue()) {
        // 1. Selection
        NodeId selected = selectLeaf(tree_, root, unique_actions,
                                     config_.exploration_constant);

        // 2. Expansion
        NodeId leaf = expand(selected, unique_actions);

        // 3. Simulation
        double value = evaluator_(tree_.node(leaf));

        // 4. Backpropagation
        backpropagate(leaf, value);
        budget.recordSimulation();
    }

    SearchResult result;
    result.plan = extractPlan(tree_, actions);
    result.simulations = budget.simulations();
    result.tree_size = tree_.size();
    result.max_depth_reached = tree_.maxDepth();
    result.root_visits = tree_.node(root).visits;
    result.degenerate = tree_.node(root).children.empty();
    result.elapsed_seconds = budget.elapsedSeconds();

    logger()->debug("mcts: {} simulations, {} nodes, depth {}, plan length {}{}",
                    result.simulations, result.tree_size, result.max_depth_reached,
                    result.plan.size(), result.degenerate ? " (degenerate)" : "");
    return result;
}

} // namespace gamemind
