/**
 * HttpTransport.cpp - Blocking HTTPS POST over cpp-httplib
 */

#include "clai/HttpTransport.hpp"

#include <httplib.h>

namespace clai {

struct HttplibTransport::Impl {
    std::unique_ptr<httplib::SSLClient> client;
    
    Impl(const std::string& host, int connection_timeout_sec) {
        client = std::make_unique<httplib::SSLClient>(host);
        client->set_connection_timeout(connection_timeout_sec);
    }
};

HttplibTransport::HttplibTransport(const std::string& host, int connection_timeout_sec)
    : impl_(std::make_unique<Impl>(host, connection_timeout_sec)) {}

HttplibTransport::~HttplibTransport() = default;

HttpResult HttplibTransport::post(const std::string& path, const HttpHeaders& headers,
                                  const std::string& body, const std::string& content_type) {
    HttpResult result;
    
    httplib::Headers request_headers;
    for (const auto& header : headers) {
        request_headers.emplace(header.first, header.second);
    }
    
    auto res = impl_->client->Post(path, request_headers, body, content_type);
    
    if (!res) {
        result.success = false;
        result.error = "Network error: " + httplib::to_string(res.error());
        return result;
    }
    
    result.success = true;
    result.status = res->status;
    result.body = res->body;
    return result;
}

} // namespace clai
