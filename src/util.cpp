#include "util.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using std::string;

namespace util {

bool valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        unsigned long cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        static const unsigned long kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

Timestamp parse_iso8601(const string& s) {
    std::tm tm{};
    std::istringstream iss(s);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    long millis = 0;
    long offset_sec = 0;
    string rest;
    std::getline(iss, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 3) millis = millis * 10 + (rest[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (pos < rest.size()) {
        char c = rest[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int hh = 0, mm = 0;
            if (std::sscanf(rest.c_str() + pos + 1, "%2d:%2d", &hh, &mm) < 1) return std::nullopt;
            offset_sec = (hh * 3600L + mm * 60L) * (c == '+' ? 1 : -1);
            pos = rest.size();
        }
    }
    if (pos != rest.size()) return std::nullopt;

    std::time_t secs = timegm(&tm) - offset_sec;
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

Timestamp from_epoch_millis(double millis) {
    if (!std::isfinite(millis) || millis <= 0) return std::nullopt;
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(static_cast<long long>(millis)));
}

string format_timestamp(const Timestamp& ts) {
    if (!ts) return "unknown";
    std::time_t t = std::chrono::system_clock::to_time_t(*ts);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) return "unknown";
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

} // namespace util
