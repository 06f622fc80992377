#include "session.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

using std::string;

Session::Session(string id_, string project_path_, string file_path_)
    : id(std::move(id_)), project_path(std::move(project_path_)), file_path(std::move(file_path_)) {}

string Session::project_name() const {
    if (project_path.empty()) return "unknown";
    auto name = std::filesystem::path(project_path).filename().string();
    return name.empty() ? project_path : name;
}

string Session::display_name() const {
    if (tag) return "[" + short_id() + "] " + *tag;
    return "[" + short_id() + "]";
}

const std::vector<transcript::Message>& Session::messages() {
    if (state_ == ParseState::Parsed) return messages_;

    messages_.clear();
    skipped_lines_ = 0;
    std::ifstream in(file_path);
    if (!in.is_open()) {
        string reason = std::strerror(errno);
        spdlog::warn("session {}: cannot open {}: {}", id, file_path, reason);
        messages_.push_back(transcript::ErrorNote{"Error loading messages: " + reason});
    } else {
        transcript::ParseResult parsed = transcript::parse_stream(in);
        messages_ = std::move(parsed.messages);
        skipped_lines_ = parsed.skipped_lines;
        if (skipped_lines_) spdlog::debug("session {}: {} malformed lines skipped", id, skipped_lines_);
    }
    state_ = ParseState::Parsed;
    return messages_;
}

void Session::invalidate() {
    state_ = ParseState::Unparsed;
    messages_.clear();
    skipped_lines_ = 0;
}
