#pragma once

#include "common/observation.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace gamemind {

/// Arena index of a node inside its SearchTree.
using NodeId = std::size_t;

/// Parent index of the root.
constexpr NodeId kNoParent = std::numeric_limits<NodeId>::max();

// ─── Search Node ───────────────────────────────────────────────
// One slot of the tree arena. Links are arena indices, so the tree
// owns every node and there are no parent/child ownership cycles.

struct SearchNode {
    NodeId id = 0;
    NodeId parent = kNoParent;
    std::vector<NodeId> children;        // insertion order = tie-break order
    std::optional<std::string> action;   // empty only for the root
    Observation state;
    int visits = 0;
    double value = 0.0;
    int depth = 0;

    bool isRoot() const { return parent == kNoParent; }

    double meanValue() const {
        return visits == 0 ? 0.0 : value / visits;
    }
};

} // namespace gamemind
