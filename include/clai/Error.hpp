/**
 * Error.hpp - Error kinds and the exception that carries them
 */

#pragma once

#include <stdexcept>
#include <string>

namespace clai {

enum class ErrorKind {
    USAGE,
    CONFIGURATION,
    IO,
    EXTERNAL_PROCESS,
    NETWORK,
    HTTP,
    DATA
};

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, int http_status = 0)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}
    
    ErrorKind kind() const { return kind_; }
    
    // Only set for ErrorKind::HTTP
    int httpStatus() const { return http_status_; }
    
private:
    ErrorKind kind_;
    int http_status_;
};

// Process exit status for each kind
int exitCode(ErrorKind kind);

} // namespace clai
