#pragma once

#include <nlohmann/json.hpp>

namespace gamemind {

/// Opaque state snapshot handed to the planner by the agent loop.
/// The search copies it into every node and never looks inside; only the
/// oracle renders it (as JSON text) into prompts.
using Observation = nlohmann::json;

} // namespace gamemind
