#include "transcript.hpp"

#include <istream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
using std::string;
using std::vector;

namespace transcript {
namespace {

// Text of a message "content": a plain string, or the "text" items of a
// content list joined by a blank line. tool_use / tool_result / thinking
// items are dropped.
bool content_text(const json& content, string& out) {
    if (content.is_string()) {
        out = content.get<string>();
        return true;
    }
    if (!content.is_array()) return false;
    bool any = false;
    for (const auto& item : content) {
        if (!item.is_object()) continue;
        auto type = item.find("type");
        if (type == item.end() || !type->is_string() || type->get<string>() != "text") continue;
        auto text = item.find("text");
        if (text == item.end() || !text->is_string()) continue;
        if (any) out += "\n\n";
        out += text->get<string>();
        any = true;
    }
    return any;
}

enum class EntryKind { Other, User, Assistant };

EntryKind entry_kind(const json& entry) {
    auto type = entry.find("type");
    if (type == entry.end() || !type->is_string()) return EntryKind::Other;
    if (!entry.contains("message") || !entry["message"].is_object()) return EntryKind::Other;
    const string& t = type->get_ref<const string&>();
    if (t == "user") return EntryKind::User;
    if (t == "assistant") return EntryKind::Assistant;
    return EntryKind::Other;
}

bool entry_text(const json& entry, string& out) {
    const json& msg = entry["message"];
    auto content = msg.find("content");
    if (content == msg.end()) return false;
    return content_text(*content, out);
}

util::Timestamp entry_timestamp(const json& entry) {
    auto ts = entry.find("timestamp");
    if (ts == entry.end()) return std::nullopt;
    if (ts->is_string()) return util::parse_iso8601(ts->get<string>());
    if (ts->is_number()) return util::from_epoch_millis(ts->get<double>());
    return std::nullopt;
}

bool blank(const string& line) { return line.find_first_not_of(" \t\r\n") == string::npos; }

} // namespace

Role role_of(const Message& m) {
    if (std::holds_alternative<UserMessage>(m)) return Role::User;
    if (std::holds_alternative<AssistantMessage>(m)) return Role::Assistant;
    return Role::Error;
}

const string& text_of(const Message& m) {
    return std::visit([](const auto& v) -> const string& { return v.text; }, m);
}

const char* role_title(Role role) {
    switch (role) {
        case Role::User: return "User";
        case Role::Assistant: return "Assistant";
        case Role::Error: return "Error";
    }
    return "Unknown";
}

bool parse_line(const string& line, vector<Message>& out) {
    json entry = json::parse(line, nullptr, false);
    if (entry.is_discarded() || !entry.is_object()) return false;

    string text;
    switch (entry_kind(entry)) {
        case EntryKind::User:
            if (entry_text(entry, text)) out.push_back(UserMessage{std::move(text)});
            break;
        case EntryKind::Assistant:
            if (entry_text(entry, text)) out.push_back(AssistantMessage{std::move(text)});
            break;
        case EntryKind::Other:
            break;
    }
    return true;
}

ParseResult parse_stream(std::istream& in) {
    ParseResult result;
    string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (blank(line)) continue;
        if (!parse_line(line, result.messages)) {
            ++result.skipped_lines;
            spdlog::debug("transcript: skipping malformed line {}", lineno);
        }
    }
    return result;
}

Summary scan_summary(std::istream& in, size_t preview_bytes) {
    Summary summary;
    util::Timestamp first_seen;
    string line;
    while (std::getline(in, line)) {
        if (blank(line)) continue;
        json entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) {
            ++summary.skipped_lines;
            continue;
        }
        util::Timestamp ts = entry_timestamp(entry);
        if (!first_seen) first_seen = ts;

        string text;
        if (entry_kind(entry) == EntryKind::User && entry_text(entry, text) && !text.empty()) {
            summary.preview = util::utf8_truncate(text, preview_bytes);
            summary.timestamp = ts ? ts : first_seen;
            return summary;
        }
    }
    summary.timestamp = first_seen;
    return summary;
}

} // namespace transcript
