#pragma once

#include <functional>
#include <string>

// The assistant stores each project's transcripts in a directory named after
// the project path with '/' and '.' replaced by '-'. The mapping is lossy:
// "/a/b-c" and "/a/b/c" share a name. decode() probes the filesystem to
// pick the most plausible original and reports when it had to guess.
namespace projects {

struct DecodedPath {
    std::string path;
    bool ambiguous = false;
};

using ExistsFn = std::function<bool(const std::string&)>;

std::string encode(const std::string& path);

DecodedPath decode(const std::string& encoded_name, const std::string& root = "/", ExistsFn exists = nullptr);

} // namespace projects
