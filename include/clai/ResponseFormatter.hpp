/**
 * ResponseFormatter.hpp - Extract and print the assistant reply
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace clai {

// choices[0].message.content. Throws ErrorKind::DATA if absent or null.
std::string extractContent(const std::string& response_body);

// Trimmed interiors of ```<language> ... ``` blocks, in order
std::vector<std::string> extractCodeBlocks(const std::string& markdown, const std::string& language);

void printResponse(std::ostream& out, const std::string& content,
                   const std::optional<std::string>& language);

} // namespace clai
