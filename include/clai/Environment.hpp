/**
 * Environment.hpp - Access to environment variables and home-relative paths
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace clai {

class Environment {
public:
    virtual ~Environment() = default;
    
    // Empty values count as present
    virtual std::optional<std::string> get(const std::string& name) const = 0;
    
    std::optional<std::string> home() const;
    
    // "~/x" -> "$HOME/x". Throws ErrorKind::CONFIGURATION when HOME is unset.
    std::string expandPath(const std::string& path) const;
};

class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
};

// Fixed set of variables, for tests and embedding
class MapEnvironment : public Environment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string> vars);
    
    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);
    
private:
    std::map<std::string, std::string> vars_;
};

} // namespace clai
