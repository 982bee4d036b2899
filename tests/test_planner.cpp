#include <gtest/gtest.h>
#include "planner/planner.hpp"
#include "oracle/fallback_oracle.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace gamemind;

namespace {

// Oracle double that returns a fixed list and records what it was asked.
class RecordingOracle : public SubgoalOracle {
public:
    explicit RecordingOracle(std::vector<std::string> answer) : answer_(std::move(answer)) {}

    std::vector<std::string> generateSubgoals(
        const std::string& goal, const Observation* current_state) const override {
        goals.push_back(goal);
        states.push_back(current_state ? *current_state : Observation());
        return answer_;
    }

    TaskAnalysis analyzeTask(const std::string& task) const override {
        TaskAnalysis analysis;
        analysis.task = task;
        return analysis;
    }

    std::string name() const override { return "recording"; }

    mutable std::vector<std::string> goals;
    mutable std::vector<Observation> states;

private:
    std::vector<std::string> answer_;
};

PlannerConfig smallConfig() {
    PlannerConfig config;
    config.mcts_simulations = 50;
    config.max_depth = 3;
    config.exploration_constant = 1.0;
    return config;
}

OracleConfig disabledOracle() {
    OracleConfig config;
    config.enabled = false;
    return config;
}

} // namespace

// ─── plan() ────────────────────────────────────────────────────

TEST(PlannerTest, EndToEndDefeatZombie) {
    PlannerConfig config = smallConfig();
    config.subgoal_generation_enabled = false;
    Planner planner = Planner::fromConfig(config, disabledOracle());

    const std::set<std::string> allowed = {"find weapon", "approach enemy", "attack"};
    auto plan = planner.plan(Observation{{"zombie_near", true}}, "defeat zombie");

    ASSERT_FALSE(plan.empty());
    EXPECT_LE(plan.size(), static_cast<size_t>(config.max_subgoals));
    for (const auto& step : plan) {
        EXPECT_TRUE(allowed.count(step)) << step;
    }

    ASSERT_TRUE(planner.lastSearch().has_value());
    EXPECT_EQ(planner.lastSearch()->root_visits, 50);
    EXPECT_LE(planner.lastSearch()->max_depth_reached, 3);
}

TEST(PlannerTest, DisabledPlannerReturnsEmpty) {
    PlannerConfig config = smallConfig();
    config.enabled = false;
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"attack"});
    Planner planner(config, oracle);

    EXPECT_TRUE(planner.plan(Observation(), "defeat zombie").empty());
    EXPECT_TRUE(oracle->goals.empty());
    EXPECT_FALSE(planner.lastSearch().has_value());
}

TEST(PlannerTest, EmptySubgoalsGiveEmptyPlan) {
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{});
    Planner planner(smallConfig(), oracle);

    EXPECT_TRUE(planner.plan(Observation(), "anything").empty());
    EXPECT_EQ(oracle->goals.size(), 1);
    EXPECT_FALSE(planner.lastSearch().has_value());
}

TEST(PlannerTest, ObservationForwardedToOracleAndSearch) {
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"chop wood"});
    Planner planner(smallConfig(), oracle);

    Observation obs = {{"trees", 3}};
    int evaluations = 0;
    planner.setEvaluator([&](const SearchNode& node) {
        evaluations++;
        EXPECT_EQ(node.state, obs);
        return 1.0;
    });

    planner.plan(obs, "collect wood");
    ASSERT_EQ(oracle->states.size(), 1);
    EXPECT_EQ(oracle->states[0], obs);
    EXPECT_EQ(oracle->goals[0], "collect wood");
    EXPECT_EQ(evaluations, 50);
}

TEST(PlannerTest, MaxSubgoalsBoundsActionSet) {
    PlannerConfig config = smallConfig();
    config.max_subgoals = 2;
    config.max_depth = 1;
    config.mcts_simulations = 30;
    auto oracle = std::make_shared<RecordingOracle>(
        std::vector<std::string>{"first", "second", "third", "fourth", "fifth"});
    Planner planner(config, oracle);

    auto plan = planner.plan(Observation(), "goal");
    ASSERT_EQ(plan.size(), 1);
    EXPECT_TRUE(plan[0] == "first" || plan[0] == "second") << plan[0];
    // only two candidate children under the root
    EXPECT_EQ(planner.lastSearch()->tree_size, 3);
}

TEST(PlannerTest, EvaluatorSteersPlan) {
    PlannerConfig config = smallConfig();
    config.mcts_simulations = 200;
    config.max_depth = 2;
    auto oracle = std::make_shared<RecordingOracle>(
        std::vector<std::string>{"find weapon", "approach enemy", "attack"});
    Planner planner(config, oracle);
    planner.setEvaluator([](const SearchNode& node) {
        return (node.action && *node.action == "find weapon") ? 10.0 : 0.0;
    });

    auto plan = planner.plan(Observation(), "defeat zombie");
    ASSERT_FALSE(plan.empty());
    EXPECT_EQ(plan.front(), "find weapon");
}

TEST(PlannerTest, EvaluatorFailureDegradesToEmptyPlan) {
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"attack"});
    Planner planner(smallConfig(), oracle);
    planner.setEvaluator([](const SearchNode&) -> double {
        throw std::runtime_error("value model offline");
    });

    std::vector<std::string> plan;
    EXPECT_NO_THROW(plan = planner.plan(Observation(), "defeat zombie"));
    EXPECT_TRUE(plan.empty());
}

TEST(PlannerTest, SingleSubgoalPlan) {
    PlannerConfig config = smallConfig();
    config.max_depth = 1;
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"explore"});
    Planner planner(config, oracle);

    EXPECT_EQ(planner.plan(Observation(), "x"), (std::vector<std::string>{"explore"}));
}

// ─── updatePlan() ──────────────────────────────────────────────

TEST(PlannerTest, NegativeRewardTriggersReplan) {
    Planner planner(smallConfig(), std::make_shared<FallbackOracle>());

    auto replanned = planner.updatePlan(Observation{{"hp", 1}}, "attack", -1.0);
    ASSERT_TRUE(replanned.has_value());
    EXPECT_FALSE(replanned->empty());

    const std::set<std::string> recovery = {
        "explore environment", "gather resources", "avoid danger", "complete objective"};
    for (const auto& step : *replanned) {
        EXPECT_TRUE(recovery.count(step)) << step;
    }
}

TEST(PlannerTest, RecoveryUsesRecoveryGoal) {
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"retreat"});
    Planner planner(smallConfig(), oracle);

    planner.updatePlan(Observation(), "attack", -0.01);
    ASSERT_EQ(oracle->goals.size(), 1);
    EXPECT_EQ(oracle->goals[0], kRecoveryGoal);
}

TEST(PlannerTest, NonNegativeRewardKeepsPlan) {
    auto oracle = std::make_shared<RecordingOracle>(std::vector<std::string>{"retreat"});
    Planner planner(smallConfig(), oracle);

    EXPECT_FALSE(planner.updatePlan(Observation(), "attack", 1.0).has_value());
    EXPECT_FALSE(planner.updatePlan(Observation(), "attack", 0.0).has_value());
    EXPECT_TRUE(oracle->goals.empty());
}

TEST(PlannerTest, ReplanWithDisabledPlannerIsEmpty) {
    PlannerConfig config = smallConfig();
    config.enabled = false;
    Planner planner(config, std::make_shared<FallbackOracle>());

    auto replanned = planner.updatePlan(Observation(), "attack", -5.0);
    ASSERT_TRUE(replanned.has_value());
    EXPECT_TRUE(replanned->empty());
}

// ─── Construction ──────────────────────────────────────────────

TEST(PlannerTest, InvalidConfigFailsFast) {
    auto oracle = std::make_shared<FallbackOracle>();

    PlannerConfig no_subgoals = smallConfig();
    no_subgoals.max_subgoals = 0;
    EXPECT_THROW((Planner{no_subgoals, oracle}), ConfigError);

    PlannerConfig no_sims = smallConfig();
    no_sims.mcts_simulations = 0;
    EXPECT_THROW((Planner{no_sims, oracle}), ConfigError);

    PlannerConfig no_depth = smallConfig();
    no_depth.max_depth = 0;
    EXPECT_THROW((Planner{no_depth, oracle}), ConfigError);

    PlannerConfig negative_c = smallConfig();
    negative_c.exploration_constant = -1.0;
    EXPECT_THROW((Planner{negative_c, oracle}), ConfigError);

    EXPECT_THROW((Planner{smallConfig(), nullptr}), ConfigError);
    EXPECT_THROW(Planner::fromConfig(no_sims, disabledOracle()), ConfigError);
}

TEST(PlannerTest, FromConfigPicksOracle) {
    Planner basic = Planner::fromConfig(
        [] { PlannerConfig c; c.subgoal_generation_enabled = false; return c; }(),
        OracleConfig());
    EXPECT_EQ(basic.oracle().name(), "fallback");

    Planner fallback = Planner::fromConfig(PlannerConfig(), disabledOracle());
    EXPECT_EQ(fallback.oracle().generateSubgoals("collect wood", nullptr).back(),
              "return to base");
}
