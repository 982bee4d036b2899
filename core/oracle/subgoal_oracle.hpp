#pragma once

#include "common/observation.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gamemind {

/// Upper bound on the number of subgoals any oracle returns.
constexpr size_t kMaxSubgoals = 5;

enum class Complexity {
    SIMPLE,
    MEDIUM,
    COMPLEX
};

std::string toString(Complexity c);

// ─── Task Analysis ─────────────────────────────────────────────

struct TaskAnalysis {
    std::string task;
    std::string rationale;
    Complexity complexity = Complexity::MEDIUM;
    int estimated_steps = 3;    // always in [2, 6]
};

// ─── Subgoal Oracle ────────────────────────────────────────────
// Decomposes a goal into an ordered list of short subgoal strings.
// Implementations must never throw from either call: any backend
// failure degrades to a deterministic answer.
//
// Both calls are const; implementations document whether a single
// instance may be shared between threads.

class SubgoalOracle {
public:
    virtual ~SubgoalOracle() = default;

    /// Subgoals for `goal`, at most kMaxSubgoals entries.
    /// `current_state` is optional context and may be null.
    virtual std::vector<std::string> generateSubgoals(
        const std::string& goal, const Observation* current_state) const = 0;

    /// Lightweight structured analysis of a task.
    virtual TaskAnalysis analyzeTask(const std::string& task) const = 0;

    /// Human-readable name of this variant.
    virtual std::string name() const = 0;
};

} // namespace gamemind
