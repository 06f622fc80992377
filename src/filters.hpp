#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "session.hpp"

namespace filters {

// id, tag, project name, preview; message text too with include_content
bool session_matches(Session& session, const std::string& query, bool include_content = false);

// Order-preserving projection. An empty (or blank) query returns `sessions`.
SessionList list_filter(const std::string& query, const SessionList& sessions, bool include_content = false);

// Case-insensitive start offsets, overlapping, ascending
std::vector<size_t> find_matches(const std::string& text, const std::string& query);

// Thread search state: match offsets in one rendered text plus a position
class MatchCursor {
  public:
    // Recomputes matches; the cursor lands on the first one
    void reset(const std::string& query, const std::string& text);
    void clear();

    bool active() const { return !query_.empty(); }
    bool empty() const { return offsets_.empty(); }
    size_t count() const { return offsets_.size(); }
    const std::string& query() const { return query_; }
    const std::vector<size_t>& offsets() const { return offsets_; }

    // Index into offsets(), nullopt when there are no matches
    std::optional<size_t> position() const;
    std::optional<size_t> current() const;
    // Text line (0-based) of the current match
    std::optional<size_t> line() const;

    // Step with wraparound; nullopt (and no movement) without matches
    std::optional<size_t> next();
    std::optional<size_t> previous();
    bool wrapped() const { return wrapped_; }

  private:
    std::string query_;
    std::vector<size_t> offsets_;
    std::vector<size_t> lines_;
    size_t pos_ = 0;
    bool wrapped_ = false;
};

} // namespace filters
