#include "render.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "errors.hpp"

namespace fs = std::filesystem;
using std::string;
using transcript::Message;
using transcript::Role;

namespace render {
namespace {

struct Run {
    Role role;
    string text;
};

// Consecutive messages of one role, joined by a blank line
std::vector<Run> group_runs(const std::vector<Message>& messages, bool user_only) {
    std::vector<Run> runs;
    for (const auto& m : messages) {
        Role role = transcript::role_of(m);
        if (user_only && role != Role::User) continue;
        if (!runs.empty() && runs.back().role == role) {
            runs.back().text += "\n\n";
            runs.back().text += transcript::text_of(m);
        } else {
            runs.push_back({role, transcript::text_of(m)});
        }
    }
    return runs;
}

} // namespace

string render_thread(Session& session, bool user_only) {
    std::ostringstream out;
    out << "Session: " << session.id << "\n";
    out << "Project: " << session.project_path << (session.path_ambiguous ? " (?)" : "") << "\n";
    out << "Date: " << session.date_str() << "\n";
    if (session.tag) out << "Tag: " << *session.tag << "\n";
    if (user_only) out << "Filter: User messages only\n";
    out << "\n";

    auto runs = group_runs(session.messages(), user_only);
    if (runs.empty()) {
        out << "No messages found in this session.\n";
        return out.str();
    }
    for (const auto& run : runs) out << transcript::role_title(run.role) << ":\n" << run.text << "\n\n";
    return out.str();
}

string render_markdown(Session& session, MarkdownStyle style) {
    std::ostringstream out;
    out << (style == MarkdownStyle::Export ? "# Claude Session: " : "# Session: ") << session.id << "\n\n";
    out << "**Project:** `" << session.project_path << "`\n\n";
    out << "**Date:** " << session.date_str() << "\n\n";
    if (session.tag) out << "**Tag:** " << *session.tag << "\n\n";
    out << "---\n\n";

    const auto& messages = session.messages();
    if (messages.empty()) {
        out << "*No messages found in this session.*\n";
        return out.str();
    }
    if (style == MarkdownStyle::Grouped) {
        for (const auto& run : group_runs(messages, false))
            out << "## " << transcript::role_title(run.role) << "\n\n" << run.text << "\n\n";
    } else {
        for (const auto& m : messages)
            out << "## " << transcript::role_title(transcript::role_of(m)) << "\n\n" << transcript::text_of(m) << "\n\n";
    }
    return out.str();
}

string export_file_name(const Session& session) {
    if (!session.tag || session.tag->empty()) return session.id + ".md";
    string tag = *session.tag;
    std::replace_if(tag.begin(), tag.end(), [](char c) {
        return c == '/' || c == '\\' || c == ':' || c == '\0' || static_cast<unsigned char>(c) < 32;
    }, '_');
    return session.id + "-" + tag + ".md";
}

string export_session(Session& session, const string& dir) {
    const fs::path target = fs::path(dir) / export_file_name(session);
    const string content = render_markdown(session, MarkdownStyle::Export);
    std::ofstream out(target, std::ios::trunc);
    if (!out.is_open()) throw IoFailure("cannot write " + target.string());
    out << content;
    out.flush();
    if (!out) throw IoFailure("failed writing " + target.string());
    return target.string();
}

size_t line_of(const string& text, size_t offset) {
    offset = std::min(offset, text.size());
    return static_cast<size_t>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
}

} // namespace render
