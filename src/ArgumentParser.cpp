/**
 * ArgumentParser.cpp - Parse clai command-line arguments
 */

#include "clai/ArgumentParser.hpp"
#include "clai/Error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace clai {

Invocation ArgumentParser::parse(const std::vector<std::string>& args) const {
    Invocation result;
    
    if (args.size() == 1 && (args[0] == "-h" || args[0] == "--help")) {
        result.show_help = true;
        return result;
    }
    
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        
        if (arg == "-l") {
            if (i + 1 >= args.size()) {
                throw Error(ErrorKind::USAGE, "-l requires a language");
            }
            result.language = args[++i];
        } else if (arg == "-f") {
            if (i + 1 >= args.size()) {
                throw Error(ErrorKind::USAGE, "-f requires a file");
            }
            result.context = readFile(args[++i]);
        } else {
            // Last one wins
            result.input_text = arg;
        }
    }
    
    return result;
}

std::string ArgumentParser::usage() {
    return "Usage: clai [-l <LANGUAGE>] [-f <CONTEXT_FILE>] <INPUT>";
}

std::string ArgumentParser::readFile(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw Error(ErrorKind::IO, "Context file is a directory: " + path);
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error(ErrorKind::IO, "Could not read context file: " + path);
    }
    
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw Error(ErrorKind::IO, "Error while reading context file: " + path);
    }
    return ss.str();
}

} // namespace clai
