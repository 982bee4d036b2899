#pragma once

#include "search/search_node.hpp"

#include <string>
#include <vector>

namespace gamemind {

// ─── Search Tree ───────────────────────────────────────────────
// Dense arena of SearchNodes for a single search invocation.
// Node ids are positions in the arena and stay valid until clear().

class SearchTree {
public:
    /// Reset the arena and allocate a root holding a copy of `state`.
    NodeId createRoot(const Observation& state);

    /// Attach a child produced by `action`. The child's state is a copy
    /// of the parent's; the tree never computes transitions.
    NodeId addChild(NodeId parent, const std::string& action);

    const SearchNode& node(NodeId id) const { return nodes_.at(id); }
    SearchNode& node(NodeId id) { return nodes_.at(id); }

    NodeId root() const { return 0; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    void clear() { nodes_.clear(); }

    /// UCB1 score of `child` relative to its parent.
    /// Unvisited children score +infinity.
    double ucb(NodeId child, double exploration_constant) const;

    /// Child of `parent` with the highest UCB1 score; first inserted wins ties.
    /// Returns kNoParent if `parent` has no children.
    NodeId bestUcbChild(NodeId parent, double exploration_constant) const;

    /// Child of `parent` with the most visits; first inserted wins ties.
    /// Returns kNoParent if `parent` has no children.
    NodeId mostVisitedChild(NodeId parent) const;

    /// Actions from `actions` (in their order) with no child of `id` yet.
    std::vector<std::string> untriedActions(NodeId id,
                                            const std::vector<std::string>& actions) const;

    /// True when every action in `actions` is represented among the
    /// children of `id`. Vacuously true for an empty action set.
    bool isFullyExpanded(NodeId id, const std::vector<std::string>& actions) const;

    /// Deepest node depth in the arena.
    int maxDepth() const;

    /// Checks root/parent/depth links of every node.
    bool checkInvariants() const;

private:
    std::vector<SearchNode> nodes_;

    bool hasChildWithAction(NodeId id, const std::string& action) const;
};

} // namespace gamemind
