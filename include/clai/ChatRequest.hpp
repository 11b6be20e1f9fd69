/**
 * ChatRequest.hpp - Chat messages and the completion request body
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace clai {

struct Message {
    std::string role;    // "system" or "user"
    std::string content;
};

bool operator==(const Message& a, const Message& b);

extern const std::string SYSTEM_PROMPT;

// System prompt, then language hint, then context, then the input
std::vector<Message> buildMessages(const std::string& input_text,
                                   const std::optional<std::string>& language,
                                   const std::optional<std::string>& context);

nlohmann::json buildRequestBody(const std::string& model, const std::vector<Message>& messages);

} // namespace clai
