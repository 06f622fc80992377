#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "transcript.hpp"
#include "util.hpp"

// One transcript file on disk plus its lazily parsed messages
class Session {
  public:
    Session(std::string id, std::string project_path, std::string file_path);

    std::string id;
    std::string project_path;
    std::string file_path;
    util::Timestamp timestamp;
    std::optional<std::string> tag;
    std::string preview;
    bool path_ambiguous = false;
    bool read_failed = false;

    std::string project_name() const;
    std::string short_id() const { return id.substr(0, 8); }
    std::string display_name() const;
    std::string date_str() const { return util::format_timestamp(timestamp); }

    // Parses on first call, then serves the cache until invalidate()
    const std::vector<transcript::Message>& messages();
    bool parsed() const { return state_ == ParseState::Parsed; }
    size_t skipped_lines() const { return skipped_lines_; }
    void invalidate();

  private:
    enum class ParseState { Unparsed, Parsed };

    ParseState state_ = ParseState::Unparsed;
    std::vector<transcript::Message> messages_;
    size_t skipped_lines_ = 0;
};

using SessionPtr = std::shared_ptr<Session>;
using SessionList = std::vector<SessionPtr>;
