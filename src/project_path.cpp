#include "project_path.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using std::string;
using std::vector;

namespace projects {
namespace {

// Longest run of encoded parts tried as one path component
constexpr size_t kMaxJoinedParts = 5;

vector<string> split_dashes(const string& s) {
    vector<string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find('-', start);
        parts.push_back(s.substr(start, pos == string::npos ? string::npos : pos - start));
        if (pos == string::npos) break;
        start = pos + 1;
    }
    return parts;
}

string join(const vector<string>& parts, size_t from, size_t to, char sep) {
    string out;
    for (size_t k = from; k < to; ++k) {
        if (k > from) out.push_back(sep);
        out += parts[k];
    }
    return out;
}

} // namespace

string encode(const string& path) {
    string out = path;
    std::replace_if(out.begin(), out.end(), [](char c) { return c == '/' || c == '.'; }, '-');
    return out;
}

DecodedPath decode(const string& encoded_name, const string& root, ExistsFn exists) {
    if (!exists) {
        exists = [](const string& p) {
            std::error_code ec;
            return fs::exists(p, ec);
        };
    }
    string body = encoded_name;
    if (!body.empty() && body[0] == '-') body.erase(0, 1);

    DecodedPath result;
    fs::path current = root.empty() ? fs::path("/") : fs::path(root);
    if (body.empty()) {
        result.path = current.string();
        return result;
    }

    const vector<string> parts = split_dashes(body);
    size_t i = 0;
    while (i < parts.size()) {
        // (candidate, index after the consumed parts), in preference order
        vector<std::pair<fs::path, size_t>> found;
        if (!parts[i].empty() && exists((current / parts[i]).string())) found.emplace_back(current / parts[i], i + 1);

        const size_t last = std::min(i + kMaxJoinedParts, parts.size());
        for (size_t j = i + 2; j <= last; ++j) {
            fs::path dotted = current / join(parts, i, j, '.');
            if (exists(dotted.string())) found.emplace_back(dotted, j);
            fs::path dashed = current / join(parts, i, j, '-');
            if (exists(dashed.string())) found.emplace_back(dashed, j);
        }

        if (found.empty()) {
            // Nothing on disk confirms this component; keep it verbatim
            result.ambiguous = true;
            if (!parts[i].empty()) current /= parts[i];
            ++i;
            continue;
        }
        if (found.size() > 1) result.ambiguous = true;
        current = found.front().first;
        i = found.front().second;
    }
    result.path = current.string();
    return result;
}

} // namespace projects
