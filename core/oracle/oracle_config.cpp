#include "oracle/oracle_config.hpp"
#include "common/errors.hpp"

namespace gamemind {

void OracleConfig::validate() const {
    if (!enabled) return;

    if (model_name.empty()) throw ConfigError("llm.model_name must not be empty");
    if (base_url.empty()) throw ConfigError("llm.base_url must not be empty");
    if (max_tokens < 1) {
        throw ConfigError("llm.max_tokens must be >= 1, got " + std::to_string(max_tokens));
    }
    if (!(temperature >= 0.0)) {
        throw ConfigError("llm.temperature must be >= 0, got " + std::to_string(temperature));
    }
    if (connect_timeout_ms <= 0 || request_timeout_ms <= 0 || probe_timeout_ms <= 0) {
        throw ConfigError("llm timeouts must be positive");
    }
    if (subgoal_prompt.find("{goal}") == std::string::npos) {
        throw ConfigError("llm.prompts.subgoal_generation needs a {goal} slot");
    }
    if (task_prompt.find("{task}") == std::string::npos) {
        throw ConfigError("llm.prompts.task_analysis needs a {task} slot");
    }
}

} // namespace gamemind
