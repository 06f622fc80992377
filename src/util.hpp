#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace util {

using Timestamp = std::optional<std::chrono::system_clock::time_point>;

static inline std::string ltrim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}
static inline std::string rtrim(std::string s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}
static inline std::string trim(std::string s) { return rtrim(ltrim(std::move(s))); }

static inline std::string tolower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static inline std::string rjust(std::string_view sv, int width) {
    std::string s(sv);
    if ((int)s.size() < width) s.insert(0, static_cast<size_t>(width - (int)s.size()), ' ');
    return s;
}

static inline bool starts_with(const std::string& s, const std::string& pref) {
    return s.size() >= pref.size() && std::equal(pref.begin(), pref.end(), s.begin());
}

// ASCII case-insensitive substring test; an empty needle always matches
static inline bool contains_icase(std::string_view hay, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
    return it != hay.end();
}

// Cut to at most max_bytes without splitting a UTF-8 sequence
static inline std::string utf8_truncate(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) --end;
    return s.substr(0, end);
}

// Left-justify, truncate to width (bytes, on a character boundary), pad with spaces
static inline std::string ljust(std::string_view sv, int width) {
    if (width <= 0) return {};
    std::string s = utf8_truncate(std::string(sv), static_cast<size_t>(width));
    if ((int)s.size() < width) s.append(static_cast<size_t>(width - (int)s.size()), ' ');
    return s;
}

static inline std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

// Well-formed UTF-8: no stray continuation bytes, overlongs, surrogates or truncated sequences
bool valid_utf8(std::string_view s);

// ISO-8601 ("2025-11-25T12:36:37.257Z", optional fraction, Z or +hh:mm offset)
Timestamp parse_iso8601(const std::string& s);
Timestamp from_epoch_millis(double millis);
// "%Y-%m-%d %H:%M" in UTC, "unknown" when absent
std::string format_timestamp(const Timestamp& ts);

} // namespace util
