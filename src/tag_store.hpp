#pragma once

#include <map>
#include <optional>
#include <string>

// Session id -> tag, persisted as one JSON object.
// Every mutation rewrites the whole file before returning.
class TagStore {
  public:
    explicit TagStore(std::string path);

    // Missing file -> empty store. An unreadable or malformed file is logged
    // and treated as empty; it is only replaced on the next mutation.
    void load();

    // Canonical form: sorted keys, 2-space indent, trailing newline.
    // Throws IoFailure.
    void save() const;

    std::optional<std::string> get(const std::string& id) const;
    std::optional<std::string> find_by_tag(const std::string& tag) const;

    void set(const std::string& id, const std::string& tag);
    bool erase(const std::string& id);

    const std::map<std::string, std::string>& entries() const { return tags_; }
    const std::string& path() const { return path_; }

  private:
    std::string path_;
    std::map<std::string, std::string> tags_;
};
