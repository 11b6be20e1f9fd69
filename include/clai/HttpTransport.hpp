/**
 * HttpTransport.hpp - Blocking HTTPS POST
 */

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace clai {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResult {
    int status = 0;
    std::string body;
    bool success = false; // a response arrived, whatever its status
    std::string error;    // transport failure description
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    
    virtual HttpResult post(const std::string& path, const HttpHeaders& headers,
                            const std::string& body, const std::string& content_type) = 0;
};

// cpp-httplib SSLClient bound to one host
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(const std::string& host, int connection_timeout_sec = 30);
    ~HttplibTransport() override;
    
    HttpResult post(const std::string& path, const HttpHeaders& headers,
                    const std::string& body, const std::string& content_type) override;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace clai
