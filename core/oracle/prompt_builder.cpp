#include "oracle/prompt_builder.hpp"

namespace gamemind {

std::string renderTemplate(const std::string& tmpl, const std::string& slot,
                           const std::string& value) {
    const std::string marker = "{" + slot + "}";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = tmpl.find(marker, pos);
        if (hit == std::string::npos) break;
        out.append(tmpl, pos, hit - pos);
        out += value;
        pos = hit + marker.size();
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string buildSubgoalPrompt(const std::string& tmpl, const std::string& goal,
                               const Observation* current_state) {
    std::string prompt = renderTemplate(tmpl, "goal", goal);
    if (current_state && !current_state->is_null()) {
        // invalid UTF-8 in the snapshot is replaced rather than thrown
        prompt += "\n\nCurrent state: " +
                  current_state->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return prompt;
}

std::string buildTaskPrompt(const std::string& tmpl, const std::string& task) {
    return renderTemplate(tmpl, "task", task);
}

std::string buildChatPrompt(const std::vector<ChatMessage>& messages) {
    std::string prompt;
    for (const auto& message : messages) {
        switch (message.role) {
            case ChatRole::SYSTEM:    prompt += "System: "; break;
            case ChatRole::USER:      prompt += "User: "; break;
            case ChatRole::ASSISTANT: prompt += "Assistant: "; break;
        }
        prompt += message.content;
        prompt += "\n\n";
    }
    prompt += "Assistant: ";
    return prompt;
}

} // namespace gamemind
