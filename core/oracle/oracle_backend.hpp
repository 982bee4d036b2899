#pragma once

#include "oracle/prompt_builder.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gamemind {

struct GenerateRequest {
    std::string prompt;
    int max_tokens = 128;
    double temperature = 0.7;
};

// ─── Oracle Backend ────────────────────────────────────────────
// Text-completion service behind the remote oracle. Failures (network,
// timeout, non-success status, unreadable payload) are reported as
// std::nullopt, never as exceptions.

class OracleBackend {
public:
    virtual ~OracleBackend() = default;

    virtual std::optional<std::string> generate(const GenerateRequest& request) const = 0;

    /// Cheap reachability probe.
    virtual bool isAvailable() const = 0;

    /// Models served by the backend; empty when unknown or unreachable.
    virtual std::vector<std::string> listModels() const = 0;

    /// One completion over a flattened conversation.
    std::optional<std::string> chat(const std::vector<ChatMessage>& messages,
                                    int max_tokens = 128,
                                    double temperature = 0.7) const {
        GenerateRequest request;
        request.prompt = buildChatPrompt(messages);
        request.max_tokens = max_tokens;
        request.temperature = temperature;
        return generate(request);
    }
};

} // namespace gamemind
