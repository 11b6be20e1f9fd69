/**
 * OpenAIClient.cpp - Client for the OpenAI chat completions endpoint
 */

#include "clai/OpenAIClient.hpp"
#include "clai/Error.hpp"
#include "clai/HttpTransport.hpp"

#include <ostream>

namespace clai {

const std::string OpenAIClient::API_HOST = "api.openai.com";
const std::string OpenAIClient::COMPLETIONS_PATH = "/v1/chat/completions";
const std::string OpenAIClient::DEFAULT_MODEL = "gpt-4o";

OpenAIClient::OpenAIClient(HttpTransport& transport, const std::string& api_key, std::ostream& err)
    : transport_(transport), api_key_(api_key), err_(err) {}

std::string OpenAIClient::completeChat(const std::vector<Message>& messages) {
    auto request_body = buildRequestBody(DEFAULT_MODEL, messages);
    
    HttpHeaders headers = {
        {"Authorization", "Bearer " + api_key_}
    };
    
    auto res = transport_.post(COMPLETIONS_PATH, headers, request_body.dump(), "application/json");
    
    if (!res.success) {
        throw Error(ErrorKind::NETWORK, res.error);
    }
    
    if (res.status < 200 || res.status >= 300) {
        err_ << res.body << "\n";
        err_.flush();
        throw Error(ErrorKind::HTTP,
                    "API error: HTTP " + std::to_string(res.status), res.status);
    }
    
    return res.body;
}

} // namespace clai
