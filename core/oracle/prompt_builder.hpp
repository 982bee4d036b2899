#pragma once

#include "common/observation.hpp"

#include <string>
#include <vector>

namespace gamemind {

/// Replace every "{slot}" in `tmpl` with `value`.
std::string renderTemplate(const std::string& tmpl, const std::string& slot,
                           const std::string& value);

/// Subgoal prompt; appends the JSON state snapshot when one is given.
std::string buildSubgoalPrompt(const std::string& tmpl, const std::string& goal,
                               const Observation* current_state);

std::string buildTaskPrompt(const std::string& tmpl, const std::string& task);

enum class ChatRole { SYSTEM, USER, ASSISTANT };

struct ChatMessage {
    ChatRole role = ChatRole::USER;
    std::string content;
};

/// Flatten a conversation into "System: ...", "User: ...", "Assistant: ..."
/// blocks separated by blank lines, ending with an open "Assistant: " turn.
std::string buildChatPrompt(const std::vector<ChatMessage>& messages);

} // namespace gamemind
