/**
 * App.cpp - The clai pipeline from arguments to printed reply
 */

#include "clai/App.hpp"
#include "clai/ArgumentParser.hpp"
#include "clai/ChatRequest.hpp"
#include "clai/CredentialResolver.hpp"
#include "clai/Editor.hpp"
#include "clai/Environment.hpp"
#include "clai/Error.hpp"
#include "clai/OpenAIClient.hpp"
#include "clai/ResponseFormatter.hpp"

#include <ostream>

namespace clai {

namespace {

const std::string RESET = "\033[0m";
const std::string RED = "\033[31m";

} // anonymous namespace

App::App(const Environment& env, TextEditor& editor, HttpTransport& transport,
         std::ostream& out, std::ostream& err)
    : env_(env), editor_(editor), transport_(transport), out_(out), err_(err) {}

int App::run(const std::vector<std::string>& args) {
    try {
        execute(args);
        return 0;
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::USAGE) {
            out_ << ArgumentParser::usage() << "\n";
        } else {
            reportError(e.what());
        }
        return exitCode(e.kind());
    } catch (const std::exception& e) {
        reportError(e.what());
        return 1;
    }
}

void App::execute(const std::vector<std::string>& args) {
    ArgumentParser parser;
    auto invocation = parser.parse(args);
    
    if (invocation.show_help) {
        out_ << ArgumentParser::usage() << "\n";
        return;
    }
    
    std::string input_text = invocation.input_text
        ? *invocation.input_text
        : promptForInput(editor_);
    
    CredentialResolver credentials(env_);
    std::string api_key = credentials.resolve();
    
    auto messages = buildMessages(input_text, invocation.language, invocation.context);
    
    OpenAIClient client(transport_, api_key, err_);
    std::string body = client.completeChat(messages);
    
    std::string content = extractContent(body);
    printResponse(out_, content, invocation.language);
    out_.flush();
}

void App::reportError(const std::string& message) {
    err_ << RED << "Error: " << message << RESET << "\n";
}

} // namespace clai
