/**
 * CredentialResolver.cpp - Locate the API key
 *
 * Lookup order: ~/.clai.env, then $OPENAI_API_KEY.
 */

#include "clai/CredentialResolver.hpp"
#include "clai/Environment.hpp"
#include "clai/Error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace clai {

const std::string CredentialResolver::DEFAULT_CONFIG_PATH = "~/.clai.env";
const std::string CredentialResolver::API_KEY_VARIABLE = "OPENAI_API_KEY";

namespace {

std::string trim(const std::string& s, const char* chars) {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

CredentialResolver::CredentialResolver(const Environment& env, const std::string& config_path)
    : env_(env), config_path_(config_path) {}

std::optional<std::string> CredentialResolver::parseKeyFile(const std::string& contents) {
    std::optional<std::string> first_value;
    std::istringstream stream(contents);
    std::string line;
    
    while (std::getline(stream, line)) {
        std::string stripped = trim(line, " \t\r");
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }
        
        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        
        std::string key = trim(stripped.substr(0, eq), " \t");
        std::string value = trim(stripped.substr(eq + 1), " \t\r\n\"");
        
        if (key == API_KEY_VARIABLE) {
            return value;
        }
        if (!first_value) {
            first_value = value;
        }
    }
    
    return first_value;
}

std::string CredentialResolver::resolve() const {
    std::string path = env_.expandPath(config_path_);
    
    if (std::filesystem::exists(path)) {
        std::ifstream file(path);
        if (!file) {
            throw Error(ErrorKind::CONFIGURATION, "Could not read " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        
        auto key = parseKeyFile(ss.str());
        if (!key) {
            throw Error(ErrorKind::CONFIGURATION, "No KEY=\"value\" line in " + path);
        }
        if (key->empty()) {
            throw Error(ErrorKind::CONFIGURATION, "Empty API key in " + path);
        }
        return *key;
    }
    
    if (auto key = env_.get(API_KEY_VARIABLE)) {
        return *key;
    }
    
    throw Error(ErrorKind::CONFIGURATION,
                "API key not set in " + config_path_ + " or in env var '" + API_KEY_VARIABLE + "'");
}

} // namespace clai
