/**
 * main.cpp - clai CLI entry point
 *
 * Usage:
 *   clai "how do I reverse a list?"            # Print the full answer
 *   clai -l python "read a csv file"           # Print only python code blocks
 *   clai -f main.c "why does this segfault?"   # Send a file as context
 *   clai                                        # Write the question in $EDITOR
 *
 * API key: ~/.clai.env (OPENAI_API_KEY="...") or $OPENAI_API_KEY
 */

#include "clai/App.hpp"
#include "clai/Editor.hpp"
#include "clai/Environment.hpp"
#include "clai/HttpTransport.hpp"
#include "clai/OpenAIClient.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    
    clai::ProcessEnvironment env;
    clai::ExternalEditor editor(env);
    clai::HttplibTransport transport(clai::OpenAIClient::API_HOST);
    
    clai::App app(env, editor, transport, std::cout, std::cerr);
    return app.run(args);
}
