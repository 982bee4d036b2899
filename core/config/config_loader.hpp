#pragma once

#include "planner/planner_config.hpp"
#include "oracle/oracle_config.hpp"
#include "common/logging.hpp"

#include <string>

namespace YAML {
class Node;
}

namespace gamemind {

/// Everything a GameMind agent reads from its config file.
struct GameMindConfig {
    PlannerConfig planning;
    OracleConfig llm;
    LoggingConfig logging;

    /// Validate every section. Throws ConfigError.
    void validate() const;
};

/// Parse a YAML document with optional `planning`, `llm` and `logging`
/// sections. Missing keys keep their defaults. Throws ConfigError on a
/// mistyped or invalid value.
GameMindConfig parseConfig(const YAML::Node& root);

/// Parse YAML text.
GameMindConfig parseConfigString(const std::string& yaml);

/// Load and parse a YAML file. Throws ConfigError if it cannot be read.
GameMindConfig loadConfigFile(const std::string& path);

} // namespace gamemind
