#pragma once

#include <stdexcept>
#include <string>

// Unknown session id
struct NotFoundError : std::runtime_error {
    explicit NotFoundError(const std::string& id) : std::runtime_error("session not found: " + id), id(id) {}
    std::string id;
};

// File delete / write failed; the caller reports it and keeps running
struct IoFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The assistant process could not be started or returned something unusable
struct LaunchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
