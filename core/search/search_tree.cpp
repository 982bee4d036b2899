#include "search/search_tree.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gamemind {

NodeId SearchTree::createRoot(const Observation& state) {
    nodes_.clear();

    SearchNode root;
    root.id = 0;
    root.state = state;
    nodes_.push_back(std::move(root));
    return 0;
}

NodeId SearchTree::addChild(NodeId parent, const std::string& action) {
    if (parent >= nodes_.size()) {
        throw std::out_of_range("Parent node not found: " + std::to_string(parent));
    }

    SearchNode child;
    child.id = nodes_.size();
    child.parent = parent;
    child.action = action;
    child.state = nodes_[parent].state;
    child.depth = nodes_[parent].depth + 1;

    NodeId id = child.id;
    nodes_.push_back(std::move(child));
    nodes_[parent].children.push_back(id);
    return id;
}

double SearchTree::ucb(NodeId child, double exploration_constant) const {
    const SearchNode& c = nodes_.at(child);
    if (c.visits == 0) return std::numeric_limits<double>::infinity();

    int parent_visits = c.isRoot() ? c.visits : nodes_[c.parent].visits;
    double exploitation = c.value / c.visits;
    double exploration = exploration_constant *
        std::sqrt(std::log(static_cast<double>(parent_visits)) / c.visits);
    return exploitation + exploration;
}

NodeId SearchTree::bestUcbChild(NodeId parent, double exploration_constant) const {
    NodeId best = kNoParent;
    double best_ucb = -std::numeric_limits<double>::infinity();

    for (NodeId child : nodes_.at(parent).children) {
        double score = ucb(child, exploration_constant);
        // strict comparison keeps the earliest child on ties
        if (best == kNoParent || score > best_ucb) {
            best_ucb = score;
            best = child;
        }
    }
    return best;
}

NodeId SearchTree::mostVisitedChild(NodeId parent) const {
    NodeId best = kNoParent;
    int best_visits = -1;

    for (NodeId child : nodes_.at(parent).children) {
        if (nodes_[child].visits > best_visits) {
            best_visits = nodes_[child].visits;
            best = child;
        }
    }
    return best;
}

bool SearchTree::hasChildWithAction(NodeId id, const std::string& action) const {
    const auto& children = nodes_.at(id).children;
    return std::any_of(children.begin(), children.end(), [&](NodeId c) {
        return nodes_[c].action && *nodes_[c].action == action;
    });
}

std::vector<std::string> SearchTree::untriedActions(
    NodeId id, const std::vector<std::string>& actions) const {
    std::vector<std::string> result;
    for (const auto& action : actions) {
        if (!hasChildWithAction(id, action)) {
            result.push_back(action);
        }
    }
    return result;
}

bool SearchTree::isFullyExpanded(NodeId id, const std::vector<std::string>& actions) const {
    return std::all_of(actions.begin(), actions.end(), [&](const std::string& a) {
        return hasChildWithAction(id, a);
    });
}

int SearchTree::maxDepth() const {
    int depth = 0;
    for (const auto& n : nodes_) {
        depth = std::max(depth, n.depth);
    }
    return depth;
}

bool SearchTree::checkInvariants() const {
    for (const auto& n : nodes_) {
        if (n.isRoot()) {
            if (n.depth != 0 || n.action.has_value()) return false;
            continue;
        }
        if (n.parent >= nodes_.size()) return false;
        const SearchNode& p = nodes_[n.parent];
        if (n.depth != p.depth + 1 || !n.action.has_value()) return false;
        if (std::find(p.children.begin(), p.children.end(), n.id) == p.children.end()) {
            return false;
        }
    }
    return true;
}

} // namespace gamemind
