/**
 * Environment.cpp - Access to environment variables and home-relative paths
 */

#include "clai/Environment.hpp"
#include "clai/Error.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>

namespace clai {

std::optional<std::string> Environment::home() const {
    return get("HOME");
}

std::string Environment::expandPath(const std::string& path) const {
    if (path.empty() || path.front() != '~') {
        return path;
    }
    
    auto home_dir = home();
    if (!home_dir) {
        throw Error(ErrorKind::CONFIGURATION, "HOME is not set, cannot resolve " + path);
    }
    
    size_t start = 1;
    while (start < path.size() && (path[start] == '/' || path[start] == '\\')) {
        ++start;
    }
    
    return (std::filesystem::path(*home_dir) / path.substr(start)).string();
}

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

MapEnvironment::MapEnvironment(std::map<std::string, std::string> vars)
    : vars_(std::move(vars)) {}

std::optional<std::string> MapEnvironment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

void MapEnvironment::set(const std::string& name, const std::string& value) {
    vars_[name] = value;
}

void MapEnvironment::unset(const std::string& name) {
    vars_.erase(name);
}

} // namespace clai
