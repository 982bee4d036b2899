// PyBind11 bindings for the GameMind planning core.
// Exposes configs, oracles, the MCTS search and the Planner to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/config_loader.hpp"
#include "oracle/subgoal_oracle.hpp"
#include "oracle/fallback_oracle.hpp"
#include "oracle/oracle_factory.hpp"
#include "oracle/response_parser.hpp"
#include "planner/planner.hpp"
#include "search/mcts.hpp"

namespace py = pybind11;

namespace {

// Observations cross the boundary as JSON text.
gamemind::Observation parseObservation(const std::string& json_text) {
    if (json_text.empty()) return gamemind::Observation();
    return gamemind::Observation::parse(json_text);
}

} // namespace

PYBIND11_MODULE(gamemind_bindings, m) {
    m.doc() = "GameMind planning core bindings";

    py::register_exception<gamemind::ConfigError>(m, "ConfigError");

    // ── Configs ──
    py::class_<gamemind::LoggingConfig>(m, "LoggingConfig")
        .def(py::init<>())
        .def_readwrite("log_dir", &gamemind::LoggingConfig::log_dir)
        .def_readwrite("log_level", &gamemind::LoggingConfig::log_level)
        .def_readwrite("file", &gamemind::LoggingConfig::file);

    py::class_<gamemind::PlannerConfig>(m, "PlannerConfig")
        .def(py::init<>())
        .def_readwrite("enabled", &gamemind::PlannerConfig::enabled)
        .def_readwrite("mcts_simulations", &gamemind::PlannerConfig::mcts_simulations)
        .def_readwrite("max_depth", &gamemind::PlannerConfig::max_depth)
        .def_readwrite("exploration_constant", &gamemind::PlannerConfig::exploration_constant)
        .def_readwrite("subgoal_generation_enabled",
                       &gamemind::PlannerConfig::subgoal_generation_enabled)
        .def_readwrite("max_subgoals", &gamemind::PlannerConfig::max_subgoals)
        .def_readwrite("rollout_steps", &gamemind::PlannerConfig::rollout_steps)
        .def_readwrite("seed", &gamemind::PlannerConfig::seed)
        .def("validate", &gamemind::PlannerConfig::validate);

    py::class_<gamemind::OracleConfig>(m, "OracleConfig")
        .def(py::init<>())
        .def_readwrite("enabled", &gamemind::OracleConfig::enabled)
        .def_readwrite("model_name", &gamemind::OracleConfig::model_name)
        .def_readwrite("base_url", &gamemind::OracleConfig::base_url)
        .def_readwrite("api_key", &gamemind::OracleConfig::api_key)
        .def_readwrite("max_tokens", &gamemind::OracleConfig::max_tokens)
        .def_readwrite("temperature", &gamemind::OracleConfig::temperature)
        .def_readwrite("connect_timeout_ms", &gamemind::OracleConfig::connect_timeout_ms)
        .def_readwrite("request_timeout_ms", &gamemind::OracleConfig::request_timeout_ms)
        .def_readwrite("probe_on_start", &gamemind::OracleConfig::probe_on_start)
        .def_readwrite("subgoal_prompt", &gamemind::OracleConfig::subgoal_prompt)
        .def_readwrite("task_prompt", &gamemind::OracleConfig::task_prompt);

    py::class_<gamemind::GameMindConfig>(m, "GameMindConfig")
        .def(py::init<>())
        .def_readwrite("planning", &gamemind::GameMindConfig::planning)
        .def_readwrite("llm", &gamemind::GameMindConfig::llm)
        .def_readwrite("logging", &gamemind::GameMindConfig::logging);

    m.def("load_config_file", &gamemind::loadConfigFile, py::arg("path"));
    m.def("parse_config_string", &gamemind::parseConfigString, py::arg("yaml"));
    m.def("init_logging", &gamemind::initLogging, py::arg("config"));

    // ── Oracles ──
    py::enum_<gamemind::Complexity>(m, "Complexity")
        .value("SIMPLE", gamemind::Complexity::SIMPLE)
        .value("MEDIUM", gamemind::Complexity::MEDIUM)
        .value("COMPLEX", gamemind::Complexity::COMPLEX);

    py::class_<gamemind::TaskAnalysis>(m, "TaskAnalysis")
        .def(py::init<>())
        .def_readwrite("task", &gamemind::TaskAnalysis::task)
        .def_readwrite("rationale", &gamemind::TaskAnalysis::rationale)
        .def_readwrite("complexity", &gamemind::TaskAnalysis::complexity)
        .def_readwrite("estimated_steps", &gamemind::TaskAnalysis::estimated_steps);

    py::class_<gamemind::SubgoalOracle, std::shared_ptr<gamemind::SubgoalOracle>>(m, "SubgoalOracle")
        .def("generate_subgoals",
             [](const gamemind::SubgoalOracle& self, const std::string& goal,
                const std::string& state_json) {
                 if (state_json.empty()) return self.generateSubgoals(goal, nullptr);
                 auto state = parseObservation(state_json);
                 return self.generateSubgoals(goal, &state);
             }, py::arg("goal"), py::arg("state_json") = "")
        .def("analyze_task", &gamemind::SubgoalOracle::analyzeTask, py::arg("task"))
        .def("name", &gamemind::SubgoalOracle::name);

    py::class_<gamemind::FallbackOracle, gamemind::SubgoalOracle,
               std::shared_ptr<gamemind::FallbackOracle>>(m, "FallbackOracle")
        .def(py::init<>());

    m.def("make_subgoal_oracle",
          [](const gamemind::OracleConfig& config, bool subgoal_generation_enabled) {
              return std::const_pointer_cast<gamemind::SubgoalOracle>(
                  gamemind::makeSubgoalOracle(config, subgoal_generation_enabled));
          }, py::arg("config"), py::arg("subgoal_generation_enabled") = true);

    m.def("parse_subgoals", &gamemind::parseSubgoals,
          py::arg("response"), py::arg("max_items") = gamemind::kMaxSubgoals);

    // ── Search ──
    py::class_<gamemind::SearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_readwrite("plan", &gamemind::SearchResult::plan)
        .def_readwrite("simulations", &gamemind::SearchResult::simulations)
        .def_readwrite("tree_size", &gamemind::SearchResult::tree_size)
        .def_readwrite("max_depth_reached", &gamemind::SearchResult::max_depth_reached)
        .def_readwrite("root_visits", &gamemind::SearchResult::root_visits)
        .def_readwrite("degenerate", &gamemind::SearchResult::degenerate)
        .def_readwrite("elapsed_seconds", &gamemind::SearchResult::elapsed_seconds);

    // ── Planner ──
    py::class_<gamemind::Planner>(m, "Planner")
        .def(py::init([](const gamemind::PlannerConfig& config,
                         std::shared_ptr<gamemind::SubgoalOracle> oracle) {
                 return gamemind::Planner(config, std::move(oracle));
             }), py::arg("config"), py::arg("oracle"))
        .def_static("from_config",
                    [](const gamemind::GameMindConfig& config) {
                        return gamemind::Planner::fromConfig(config.planning, config.llm);
                    }, py::arg("config"))
        .def("plan",
             [](gamemind::Planner& self, const std::string& observation_json,
                const std::string& goal) {
                 return self.plan(parseObservation(observation_json), goal);
             }, py::arg("observation_json"), py::arg("goal"))
        .def("update_plan",
             [](gamemind::Planner& self, const std::string& state_json,
                const std::string& executed_action, double reward) {
                 return self.updatePlan(parseObservation(state_json), executed_action, reward);
             }, py::arg("state_json"), py::arg("executed_action"), py::arg("reward"))
        .def("set_evaluator",
             [](gamemind::Planner& self, std::function<double(int)> fn) {
                 if (!fn) {
                     self.setEvaluator(nullptr);
                     return;
                 }
                 self.setEvaluator([fn](const gamemind::SearchNode& node) {
                     py::gil_scoped_acquire gil;
                     return fn(node.depth);
                 });
             }, py::arg("evaluator"))
        .def_property_readonly("last_search", &gamemind::Planner::lastSearch);
}
