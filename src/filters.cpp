#include "filters.hpp"

#include <algorithm>

#include "util.hpp"

using std::string;
using std::vector;

namespace filters {

bool session_matches(Session& session, const string& query, bool include_content) {
    if (util::contains_icase(session.id, query)) return true;
    if (session.tag && util::contains_icase(*session.tag, query)) return true;
    if (util::contains_icase(session.project_name(), query)) return true;
    if (util::contains_icase(session.preview, query)) return true;
    if (!include_content) return false;
    for (const auto& m : session.messages())
        if (util::contains_icase(transcript::text_of(m), query)) return true;
    return false;
}

SessionList list_filter(const string& query, const SessionList& sessions, bool include_content) {
    const string q = util::trim(query);
    if (q.empty()) return sessions;
    SessionList out;
    out.reserve(sessions.size());
    for (const auto& s : sessions)
        if (session_matches(*s, q, include_content)) out.push_back(s);
    return out;
}

vector<size_t> find_matches(const string& text, const string& query) {
    vector<size_t> out;
    if (query.empty()) return out;
    const string hay = util::tolower_copy(text);
    const string needle = util::tolower_copy(query);
    size_t start = 0;
    while (true) {
        size_t pos = hay.find(needle, start);
        if (pos == string::npos) break;
        out.push_back(pos);
        start = pos + 1;
    }
    return out;
}

// ---------------------------- MatchCursor ----------------------------
void MatchCursor::reset(const string& query, const string& text) {
    query_ = query;
    offsets_ = find_matches(text, query);
    lines_.clear();
    lines_.reserve(offsets_.size());
    size_t line = 0, scanned = 0;
    for (size_t off : offsets_) {
        line += static_cast<size_t>(std::count(text.begin() + scanned, text.begin() + off, '\n'));
        scanned = off;
        lines_.push_back(line);
    }
    pos_ = 0;
    wrapped_ = false;
}

void MatchCursor::clear() {
    query_.clear();
    offsets_.clear();
    lines_.clear();
    pos_ = 0;
    wrapped_ = false;
}

std::optional<size_t> MatchCursor::position() const {
    if (offsets_.empty()) return std::nullopt;
    return pos_;
}

std::optional<size_t> MatchCursor::current() const {
    if (offsets_.empty()) return std::nullopt;
    return offsets_[pos_];
}

std::optional<size_t> MatchCursor::line() const {
    if (lines_.empty()) return std::nullopt;
    return lines_[pos_];
}

std::optional<size_t> MatchCursor::next() {
    wrapped_ = false;
    if (offsets_.empty()) return std::nullopt;
    if (++pos_ >= offsets_.size()) {
        pos_ = 0;
        wrapped_ = true;
    }
    return offsets_[pos_];
}

std::optional<size_t> MatchCursor::previous() {
    wrapped_ = false;
    if (offsets_.empty()) return std::nullopt;
    if (pos_ == 0) {
        pos_ = offsets_.size() - 1;
        wrapped_ = true;
    } else {
        --pos_;
    }
    return offsets_[pos_];
}

} // namespace filters
