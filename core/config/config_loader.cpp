#include "config/config_loader.hpp"
#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace gamemind {

namespace {

/// Copy `node[key]` into `out` if present.
template <typename T>
void readKey(const YAML::Node& node, const char* key, T& out, const std::string& section) {
    const YAML::Node value = node[key];
    if (!value) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(section + "." + key + ": " + e.what());
    }
}

YAML::Node section(const YAML::Node& root, const char* name) {
    YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw ConfigError(std::string(name) + " must be a mapping");
    }
    return node;
}

void readPlanning(const YAML::Node& node, PlannerConfig& cfg) {
    if (!node) return;
    readKey(node, "enabled", cfg.enabled, "planning");
    readKey(node, "mcts_simulations", cfg.mcts_simulations, "planning");
    readKey(node, "max_depth", cfg.max_depth, "planning");
    readKey(node, "exploration_constant", cfg.exploration_constant, "planning");
    readKey(node, "rollout_steps", cfg.rollout_steps, "planning");
    readKey(node, "seed", cfg.seed, "planning");

    YAML::Node sub = section(node, "subgoal_generation");
    if (sub) {
        readKey(sub, "enabled", cfg.subgoal_generation_enabled, "planning.subgoal_generation");
        readKey(sub, "max_subgoals", cfg.max_subgoals, "planning.subgoal_generation");
    }
}

void readOracle(const YAML::Node& node, OracleConfig& cfg) {
    if (!node) return;
    readKey(node, "enabled", cfg.enabled, "llm");
    readKey(node, "model_name", cfg.model_name, "llm");
    readKey(node, "base_url", cfg.base_url, "llm");
    readKey(node, "api_key", cfg.api_key, "llm");
    readKey(node, "max_tokens", cfg.max_tokens, "llm");
    readKey(node, "temperature", cfg.temperature, "llm");
    readKey(node, "connect_timeout_ms", cfg.connect_timeout_ms, "llm");
    readKey(node, "request_timeout_ms", cfg.request_timeout_ms, "llm");
    readKey(node, "probe_timeout_ms", cfg.probe_timeout_ms, "llm");
    readKey(node, "probe_on_start", cfg.probe_on_start, "llm");

    YAML::Node prompts = section(node, "prompts");
    if (prompts) {
        readKey(prompts, "subgoal_generation", cfg.subgoal_prompt, "llm.prompts");
        readKey(prompts, "task_analysis", cfg.task_prompt, "llm.prompts");
    }
}

void readLogging(const YAML::Node& node, LoggingConfig& cfg) {
    if (!node) return;
    readKey(node, "log_dir", cfg.log_dir, "logging");
    readKey(node, "log_level", cfg.log_level, "logging");
    readKey(node, "file", cfg.file, "logging");
}

} // namespace

void GameMindConfig::validate() const {
    planning.validate();
    if (planning.subgoal_generation_enabled) llm.validate();
    if (logging.log_level.empty()) throw ConfigError("logging.log_level must not be empty");
}

GameMindConfig parseConfig(const YAML::Node& root) {
    GameMindConfig cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("top level must be a mapping");

    readPlanning(section(root, "planning"), cfg.planning);
    readOracle(section(root, "llm"), cfg.llm);
    readLogging(section(root, "logging"), cfg.logging);

    cfg.validate();
    return cfg;
}

GameMindConfig parseConfigString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML parse failed: ") + e.what());
    }
    return parseConfig(root);
}

GameMindConfig loadConfigFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return parseConfig(root);
}

} // namespace gamemind
