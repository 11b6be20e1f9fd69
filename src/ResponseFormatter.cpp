/**
 * ResponseFormatter.cpp - Extract and print the assistant reply
 */

#include "clai/ResponseFormatter.hpp"
#include "clai/Error.hpp"

#include <cctype>
#include <ostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace clai {

namespace {

const std::string FENCE = "```";

std::string trimWhitespace(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// A tag continues if the next character could still belong to it ("cs" vs "csharp", "c" vs "c++")
bool continuesTag(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '#' || c == '-' || c == '.';
}

} // anonymous namespace

std::string extractContent(const std::string& response_body) {
    json res_json;
    try {
        res_json = json::parse(response_body);
    } catch (const json::parse_error& e) {
        throw Error(ErrorKind::DATA, std::string("JSON parse error: ") + e.what());
    }
    
    if (!res_json.is_object() ||
        !res_json.contains("choices") ||
        !res_json["choices"].is_array() ||
        res_json["choices"].empty() ||
        !res_json["choices"][0].is_object() ||
        !res_json["choices"][0].contains("message") ||
        !res_json["choices"][0]["message"].is_object() ||
        !res_json["choices"][0]["message"].contains("content")) {
        throw Error(ErrorKind::DATA, "Invalid response structure: missing choices[0].message.content");
    }
    
    const auto& content = res_json["choices"][0]["message"]["content"];
    if (content.is_null()) {
        throw Error(ErrorKind::DATA, "content must not be null");
    }
    if (!content.is_string()) {
        throw Error(ErrorKind::DATA, "content must be a string");
    }
    
    return content.get<std::string>();
}

std::vector<std::string> extractCodeBlocks(const std::string& markdown, const std::string& language) {
    std::vector<std::string> blocks;
    const std::string opening = FENCE + language;
    
    size_t pos = 0;
    while ((pos = markdown.find(opening, pos)) != std::string::npos) {
        size_t body_start = pos + opening.size();
        
        if (body_start < markdown.size() && continuesTag(markdown[body_start])) {
            pos += 1;
            continue;
        }
        
        // Shortest interior up to the next fence
        size_t body_end = markdown.find(FENCE, body_start);
        if (body_end == std::string::npos) {
            break;
        }
        
        blocks.push_back(trimWhitespace(markdown.substr(body_start, body_end - body_start)));
        pos = body_end + FENCE.size();
    }
    
    return blocks;
}

void printResponse(std::ostream& out, const std::string& content,
                   const std::optional<std::string>& language) {
    if (!language) {
        out << content << "\n";
        return;
    }
    
    for (const auto& block : extractCodeBlocks(content, *language)) {
        out << block << "\n";
    }
}

} // namespace clai
