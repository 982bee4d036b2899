#include "planner/planner.hpp"
#include "oracle/oracle_factory.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <exception>

namespace gamemind {

namespace {

const PlannerConfig& validated(const PlannerConfig& config) {
    config.validate();
    return config;
}

} // namespace

Planner::Planner(PlannerConfig config, std::shared_ptr<const SubgoalOracle> oracle)
    : config_(validated(config)),
      oracle_(std::move(oracle)),
      next_seed_(config_.seed) {
    if (!oracle_) throw ConfigError("planner needs a subgoal oracle");
}

Planner Planner::fromConfig(const PlannerConfig& planning, const OracleConfig& oracle) {
    planning.validate();
    return Planner(planning, makeSubgoalOracle(oracle, planning.subgoal_generation_enabled));
}

std::vector<std::string> Planner::generateSubgoals(const Observation& observation,
                                                   const std::string& goal) const {
    auto subgoals = oracle_->generateSubgoals(goal, &observation);
    if (subgoals.size() > static_cast<size_t>(config_.max_subgoals)) {
        subgoals.resize(config_.max_subgoals);
    }
    return subgoals;
}

std::vector<std::string> Planner::refineWithMcts(const Observation& observation,
                                                 const std::vector<std::string>& subgoals) {
    MCTSSearch mcts(config_.searchConfig(next_seed_++));
    if (evaluator_) mcts.setEvaluator(evaluator_);

    SearchResult result = mcts.search(observation, subgoals);
    last_search_ = result;
    return result.plan;
}

std::vector<std::string> Planner::plan(const Observation& observation, const std::string& goal) {
    if (!config_.enabled) return {};

    try {
        auto subgoals = generateSubgoals(observation, goal);
        if (subgoals.empty()) {
            logger()->debug("planner: no subgoals for '{}'", goal);
            return {};
        }

        auto result = refineWithMcts(observation, subgoals);
        logger()->debug("planner: plan for '{}' has {} steps", goal, result.size());
        return result;
    } catch (const std::exception& e) {
        logger()->error("planner: planning for '{}' failed: {}", goal, e.what());
        return {};
    }
}

std::optional<std::vector<std::string>> Planner::updatePlan(const Observation& current_state,
                                                            const std::string& executed_action,
                                                            double reward) {
    if (!(reward < 0.0)) return std::nullopt;

    logger()->info("planner: reward {} after '{}', replanning", reward, executed_action);
    return plan(current_state, kRecoveryGoal);
}

} // namespace gamemind
