#include "oracle/remote_oracle.hpp"
#include "oracle/prompt_builder.hpp"
#include "oracle/response_parser.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <exception>

namespace gamemind {

RemoteOracle::RemoteOracle(std::shared_ptr<const OracleBackend> backend,
                           OracleConfig config,
                           FallbackOracle fallback)
    : backend_(std::move(backend)),
      config_(std::move(config)),
      fallback_(std::move(fallback)) {
    if (!backend_) {
        logger()->warn("oracle: no backend configured, using fallback rules");
        available_ = false;
        return;
    }
    if (config_.probe_on_start) probe();
}

void RemoteOracle::probe() {
    std::vector<std::string> models;
    try {
        if (!backend_->isAvailable()) {
            logger()->warn("oracle: backend at {} is unreachable, using fallback rules",
                           config_.base_url);
            available_ = false;
            return;
        }
        models = backend_->listModels();
    } catch (const std::exception& e) {
        logger()->warn("oracle: probe of {} failed: {}, using fallback rules",
                       config_.base_url, e.what());
        available_ = false;
        return;
    }

    bool served = std::any_of(models.begin(), models.end(), [&](const std::string& m) {
        return m == config_.model_name || m.rfind(config_.model_name + ":", 0) == 0;
    });
    if (!served) {
        logger()->warn("oracle: model '{}' not listed by backend", config_.model_name);
    } else {
        logger()->info("oracle: connected to {} ({})", config_.base_url, config_.model_name);
    }
}

std::optional<std::string> RemoteOracle::ask(const GenerateRequest& request) const {
    try {
        return backend_->generate(request);
    } catch (const std::exception& e) {
        logger()->warn("oracle: backend error: {}", e.what());
        return std::nullopt;
    }
}

std::vector<std::string> RemoteOracle::generateSubgoals(
    const std::string& goal, const Observation* current_state) const {
    if (!available_) return fallback_.generateSubgoals(goal, current_state);

    GenerateRequest request;
    request.prompt = buildSubgoalPrompt(config_.subgoal_prompt, goal, current_state);
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;

    auto response = ask(request);
    if (!response) {
        logger()->warn("oracle: no answer for goal '{}', using fallback rules", goal);
        return fallback_.generateSubgoals(goal, current_state);
    }

    auto subgoals = parseSubgoals(*response, kMaxSubgoals);
    if (subgoals.empty()) {
        logger()->warn("oracle: no subgoals in answer for goal '{}', using fallback rules", goal);
        return fallback_.generateSubgoals(goal, current_state);
    }

    logger()->debug("oracle: {} subgoals for '{}'", subgoals.size(), goal);
    return subgoals;
}

TaskAnalysis RemoteOracle::analyzeTask(const std::string& task) const {
    if (!available_) return fallback_.analyzeTask(task);

    GenerateRequest request;
    request.prompt = buildTaskPrompt(config_.task_prompt, task);
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;

    auto response = ask(request);
    if (!response || trim(*response).empty()) {
        logger()->warn("oracle: task analysis failed for '{}', using fallback", task);
        return fallback_.analyzeTask(task);
    }

    TaskAnalysis analysis;
    analysis.task = task;
    analysis.rationale = *response;
    analysis.complexity = estimateComplexity(*response);
    analysis.estimated_steps = estimateSteps(*response);
    return analysis;
}

} // namespace gamemind
