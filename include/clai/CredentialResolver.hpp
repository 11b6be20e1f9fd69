/**
 * CredentialResolver.hpp - Locate the API key
 */

#pragma once

#include <optional>
#include <string>

namespace clai {

class Environment;

class CredentialResolver {
public:
    static const std::string DEFAULT_CONFIG_PATH;
    static const std::string API_KEY_VARIABLE;
    
    explicit CredentialResolver(const Environment& env,
                                const std::string& config_path = DEFAULT_CONFIG_PATH);
    
    // Config file first, then the environment variable.
    // Throws ErrorKind::CONFIGURATION when neither yields a key.
    std::string resolve() const;
    
    // Value of the key file contents: OPENAI_API_KEY line if present, else the first key=value line
    static std::optional<std::string> parseKeyFile(const std::string& contents);
    
private:
    const Environment& env_;
    std::string config_path_;
};

} // namespace clai
