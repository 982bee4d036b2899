#pragma once

#include <string>

namespace gamemind {

/// Settings for the remote subgoal oracle and its HTTP backend.
struct OracleConfig {
    bool enabled = true;
    std::string model_name = "llama2";
    std::string base_url = "http://localhost:11434";
    std::string api_key;                // sent as a Bearer token when set
    int max_tokens = 128;
    double temperature = 0.7;
    long connect_timeout_ms = 5000;
    long request_timeout_ms = 30000;
    long probe_timeout_ms = 5000;
    bool probe_on_start = true;         // check /api/tags at construction

    // Templates with one named slot each.
    std::string subgoal_prompt = "Generate 3-5 specific subgoals for: {goal}";
    std::string task_prompt =
        "Analyze the current task: {task}. What are the key steps needed?";

    /// Throws ConfigError on an out-of-range value.
    void validate() const;
};

} // namespace gamemind
