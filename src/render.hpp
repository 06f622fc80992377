#pragma once

#include <cstddef>
#include <string>

#include "session.hpp"

namespace render {

// Plain text shown in the thread panel; thread search runs over exactly this
std::string render_thread(Session& session, bool user_only);

enum class MarkdownStyle {
    Grouped, // clipboard copy: consecutive same-role messages merged
    Export,  // file export: one section per message
};

std::string render_markdown(Session& session, MarkdownStyle style);

// <id>.md or <id>-<tag>.md, tag made safe for a file name
std::string export_file_name(const Session& session);

// Writes the Export rendering into dir and returns the path. Throws IoFailure.
std::string export_session(Session& session, const std::string& dir);

size_t line_of(const std::string& text, size_t offset);

} // namespace render
