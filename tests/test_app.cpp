/**
 * test_app.cpp - End-to-end pipeline tests with fake editor and transport
 */

#include "clai/App.hpp"
#include "clai/ArgumentParser.hpp"
#include "clai/ChatRequest.hpp"
#include "clai/Environment.hpp"
#include "clai/Error.hpp"
#include "testing.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

namespace {

struct Fixture {
    clai_test::TempDir home;
    clai::MapEnvironment env;
    clai_test::FakeEditor editor{"typed in the editor"};
    clai_test::FakeTransport transport;
    std::ostringstream out;
    std::ostringstream err;
    
    Fixture() {
        env.set("HOME", home.path().string());
        env.set("OPENAI_API_KEY", "sk-env456");
    }
    
    int run(const std::vector<std::string>& args) {
        clai::App app(env, editor, transport, out, err);
        return app.run(args);
    }
    
    nlohmann::json sentBody() const {
        assert(transport.requests.size() == 1);
        return nlohmann::json::parse(transport.requests[0].body);
    }
};

const std::string TWO_BLOCKS = R"("abc ```python\nprint(1)\n``` def ```python\nprint(2)\n``` ghi")";

} // anonymous namespace

void test_prints_full_reply() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(TWO_BLOCKS));
    
    int status = f.run({"print two numbers"});
    
    assert(status == 0);
    assert(f.out.str() == "abc ```python\nprint(1)\n``` def ```python\nprint(2)\n``` ghi\n");
    assert(f.err.str().empty());
    assert(f.editor.calls == 0);
    
    auto body = f.sentBody();
    assert(body["messages"].size() == 2);
    assert(body["messages"][1]["content"] == "print two numbers");
    assert(f.transport.requests[0].headers[0].second == "Bearer sk-env456");
    
    std::cout << "[PASS] test_prints_full_reply\n";
}

void test_prints_code_blocks_only() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(TWO_BLOCKS));
    
    int status = f.run({"-l", "python", "print two numbers"});
    
    assert(status == 0);
    assert(f.out.str() == "print(1)\nprint(2)\n");
    
    auto body = f.sentBody();
    assert(body["messages"][1]["content"] == "My preferred language is python.");
    
    std::cout << "[PASS] test_prints_code_blocks_only\n";
}

void test_context_file_is_sent() {
    Fixture f;
    auto file = f.home.write("notes.txt", "uses C++17");
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(R"("ok")"));
    
    int status = f.run({"-l", "L", "-f", file, "question"});
    
    assert(status == 0);
    auto messages = f.sentBody()["messages"];
    assert(messages.size() == 4);
    assert(messages[0]["role"] == "system");
    assert(messages[0]["content"] == clai::SYSTEM_PROMPT);
    assert(messages[1]["content"] == "My preferred language is L.");
    assert(messages[2]["content"] == "Some context that may help you answer my question is:\nuses C++17");
    assert(messages[3]["content"] == "question");
    
    std::cout << "[PASS] test_context_file_is_sent\n";
}

void test_editor_fallback() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(R"("answer")"));
    
    int status = f.run({"-l", "go"});
    
    assert(status == 0);
    assert(f.editor.calls == 1);
    assert(f.sentBody()["messages"].back()["content"] == "typed in the editor");
    
    std::cout << "[PASS] test_editor_fallback\n";
}

void test_empty_editor_content() {
    Fixture f;
    clai_test::FakeEditor blank(" \n ");
    std::ostringstream out, err;
    clai::App app(f.env, blank, f.transport, out, err);
    
    int status = app.run({});
    
    assert(status == clai::exitCode(clai::ErrorKind::EXTERNAL_PROCESS));
    assert(status != 0);
    assert(err.str().find("No content was written") != std::string::npos);
    assert(f.transport.requests.empty());
    
    std::cout << "[PASS] test_empty_editor_content\n";
}

void test_usage_on_trailing_flag() {
    Fixture f;
    
    int status = f.run({"question", "-f"});
    
    assert(status == 1);
    assert(f.out.str() == clai::ArgumentParser::usage() + "\n");
    assert(f.transport.requests.empty());
    assert(f.editor.calls == 0);
    
    std::cout << "[PASS] test_usage_on_trailing_flag\n";
}

void test_help() {
    Fixture f;
    
    int status = f.run({"--help"});
    
    assert(status == 0);
    assert(f.out.str() == clai::ArgumentParser::usage() + "\n");
    assert(f.transport.requests.empty());
    
    std::cout << "[PASS] test_help\n";
}

void test_missing_credential_skips_network() {
    Fixture f;
    f.env.unset("OPENAI_API_KEY");
    
    int status = f.run({"question"});
    
    assert(status == clai::exitCode(clai::ErrorKind::CONFIGURATION));
    assert(f.transport.requests.empty());
    assert(f.out.str().empty());
    assert(f.err.str().find("API key not set") != std::string::npos);
    
    std::cout << "[PASS] test_missing_credential_skips_network\n";
}

void test_config_file_credential() {
    Fixture f;
    f.home.write(".clai.env", "OPENAI_API_KEY=\"sk-test123\"\n");
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(R"("ok")"));
    
    int status = f.run({"question"});
    
    assert(status == 0);
    assert(f.transport.requests[0].headers[0].second == "Bearer sk-test123");
    
    std::cout << "[PASS] test_config_file_credential\n";
}

void test_http_error_stops_before_output() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::status(429, R"({"error":{"message":"Rate limit reached"}})");
    
    int status = f.run({"-l", "python", "question"});
    
    assert(status == clai::exitCode(clai::ErrorKind::HTTP));
    assert(f.out.str().empty());
    assert(f.err.str().find(R"({"error":{"message":"Rate limit reached"}})") == 0);
    assert(f.err.str().find("HTTP 429") != std::string::npos);
    
    std::cout << "[PASS] test_http_error_stops_before_output\n";
}

void test_null_content() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse("null"));
    
    int status = f.run({"question"});
    
    assert(status == clai::exitCode(clai::ErrorKind::DATA));
    assert(f.out.str().empty());
    assert(f.err.str().find("content must not be null") != std::string::npos);
    
    std::cout << "[PASS] test_null_content\n";
}

void test_no_matching_blocks_is_success() {
    Fixture f;
    f.transport.response = clai_test::FakeTransport::ok(clai_test::chatResponse(R"("```js\nx\n```")"));
    
    int status = f.run({"-l", "python", "question"});
    
    assert(status == 0);
    assert(f.out.str().empty());
    assert(f.err.str().empty());
    
    std::cout << "[PASS] test_no_matching_blocks_is_success\n";
}

int main() {
    std::cout << "Running App tests...\n\n";
    
    test_prints_full_reply();
    test_prints_code_blocks_only();
    test_context_file_is_sent();
    test_editor_fallback();
    test_empty_editor_content();
    test_usage_on_trailing_flag();
    test_help();
    test_missing_credential_skips_network();
    test_config_file_credential();
    test_http_error_stops_before_output();
    test_null_content();
    test_no_matching_blocks_is_success();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
