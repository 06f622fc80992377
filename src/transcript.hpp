#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

#include "util.hpp"

namespace transcript {

struct UserMessage { std::string text; };
struct AssistantMessage { std::string text; };
struct ErrorNote { std::string text; };

using Message = std::variant<UserMessage, AssistantMessage, ErrorNote>;

enum class Role { User, Assistant, Error };

Role role_of(const Message& m);
const std::string& text_of(const Message& m);
const char* role_title(Role role); // "User", "Assistant", "Error"

struct ParseResult {
    std::vector<Message> messages;
    size_t skipped_lines = 0; // malformed JSON or non-object lines
};

// One JSONL line -> zero or one message. Returns false when the line is not
// a JSON object (the caller counts it as skipped).
bool parse_line(const std::string& line, std::vector<Message>& out);

ParseResult parse_stream(std::istream& in);

// Discovery-time scan: stops at the first user-authored text
struct Summary {
    std::string preview;
    util::Timestamp timestamp;
    size_t skipped_lines = 0;
};

Summary scan_summary(std::istream& in, size_t preview_bytes = 100);

} // namespace transcript
