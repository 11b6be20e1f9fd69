/**
 * App.hpp - The clai pipeline from arguments to printed reply
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace clai {

class Environment;
class HttpTransport;
class TextEditor;

class App {
public:
    App(const Environment& env, TextEditor& editor, HttpTransport& transport,
        std::ostream& out, std::ostream& err);
    
    // Returns the process exit status
    int run(const std::vector<std::string>& args);
    
private:
    void execute(const std::vector<std::string>& args);
    void reportError(const std::string& message);
    
    const Environment& env_;
    TextEditor& editor_;
    HttpTransport& transport_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace clai
