/**
 * ChatRequest.cpp - Chat messages and the completion request body
 */

#include "clai/ChatRequest.hpp"

using json = nlohmann::json;

namespace clai {

const std::string SYSTEM_PROMPT =
    "You are an expert code assistant that is always concise, and always answers the user's question exactly.\n"
    "You always provide a code block in your answer if your answer contains code, "
    "and the block must have the correct language annotation.";

bool operator==(const Message& a, const Message& b) {
    return a.role == b.role && a.content == b.content;
}

std::vector<Message> buildMessages(const std::string& input_text,
                                   const std::optional<std::string>& language,
                                   const std::optional<std::string>& context) {
    // Order matters to the model
    std::vector<Message> messages;
    messages.push_back({"system", SYSTEM_PROMPT});
    
    if (language) {
        messages.push_back({"user", "My preferred language is " + *language + "."});
    }
    if (context) {
        messages.push_back({"user", "Some context that may help you answer my question is:\n" + *context});
    }
    messages.push_back({"user", input_text});
    
    return messages;
}

json buildRequestBody(const std::string& model, const std::vector<Message>& messages) {
    json contents = json::array();
    for (const auto& message : messages) {
        contents.push_back({
            {"role", message.role},
            {"content", message.content}
        });
    }
    
    return {
        {"model", model},
        {"messages", contents}
    };
}

} // namespace clai
