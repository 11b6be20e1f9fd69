/**
 * ArgumentParser.hpp - Parse clai command-line arguments
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clai {

struct Invocation {
    std::optional<std::string> input_text; // none = ask the editor
    std::optional<std::string> language;
    std::optional<std::string> context;    // contents of the -f file
    bool show_help = false;
};

class ArgumentParser {
public:
    // args excludes the program name.
    // Throws ErrorKind::USAGE for a flag without value, ErrorKind::IO for an unreadable -f file.
    Invocation parse(const std::vector<std::string>& args) const;
    
    static std::string usage();
    
private:
    static std::string readFile(const std::string& path);
};

} // namespace clai
