/**
 * OpenAIClient.hpp - Client for the OpenAI chat completions endpoint
 */

#pragma once

#include "clai/ChatRequest.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace clai {

class HttpTransport;

class OpenAIClient {
public:
    static const std::string API_HOST;
    static const std::string COMPLETIONS_PATH;
    static const std::string DEFAULT_MODEL;
    
    // err receives the raw body of non-success responses
    OpenAIClient(HttpTransport& transport, const std::string& api_key, std::ostream& err);
    
    // Single attempt. Returns the raw response body.
    // Throws ErrorKind::NETWORK when no response arrives, ErrorKind::HTTP on a non-2xx status.
    std::string completeChat(const std::vector<Message>& messages);
    
private:
    HttpTransport& transport_;
    std::string api_key_;
    std::ostream& err_;
};

} // namespace clai
