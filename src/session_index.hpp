#pragma once

#include <optional>
#include <string>
#include <vector>

#include "launcher.hpp"
#include "session.hpp"
#include "tag_store.hpp"

struct DiscoveryReport {
    size_t files = 0;
    size_t unreadable = 0;      // listed with read_failed set
    size_t skipped_lines = 0;   // malformed lines seen while scanning previews
    size_t ambiguous_paths = 0; // project directories decoded by guesswork
    std::vector<std::string> dropped; // transcript files lost to an id collision
};

struct DiscoveryResult {
    SessionList sessions;
    DiscoveryReport report;
};

// Newest first; missing timestamps last; ties by id
void sort_sessions(SessionList& sessions);

// Walks <projects_root>/<encoded-project>/<id>.jsonl, skipping "agent-*"
// files. Per-file failures never abort the walk. Tags are merged when a
// store is given.
DiscoveryResult discover_sessions(const std::string& projects_root, const TagStore* tags = nullptr);

// Owns the session collection and the tag store; the only place that deletes
// transcripts or asks for new sessions.
class SessionIndex {
  public:
    SessionIndex(std::string projects_root, TagStore tags);

    // Full rediscovery; the collection is swapped only once the pass is done
    const DiscoveryReport& refresh();

    const SessionList& sessions() const { return sessions_; }
    SessionPtr find(const std::string& id) const;
    const TagStore& tags() const { return tags_; }

    // Empty (after trimming) clears the tag.
    // Throws NotFoundError, ValidationError (not UTF-8), IoFailure.
    void tag(const std::string& id, const std::string& value);

    // Deletes the transcript, then forgets the record and its tag. Returns
    // false when the transcript is gone but the tag file could not be updated.
    // Throws NotFoundError, IoFailure (record kept).
    bool remove(const std::string& id);

    std::optional<std::string> find_by_tag(const std::string& tag) const { return tags_.find_by_tag(tag); }

    // Creates "Session: <tag>" through the launcher and tags it. `replaces`
    // names a session holding the same tag that should be purged. A temporary
    // session is recorded for cleanup before anything else can fail.
    std::string create(const std::string& tag, bool temporary, launch::ISessionLauncher& launcher,
                       const std::optional<std::string>& replaces = std::nullopt);

    // Removes <id>.jsonl wherever it lives under the root, its empty sibling
    // directory, the tag and the record. Returns false if no file was found.
    bool purge(const std::string& id);

    const std::vector<std::string>& temporary_ids() const { return temporary_; }
    size_t cleanup_temporary();

  private:
    std::string root_;
    TagStore tags_;
    SessionList sessions_;
    DiscoveryReport report_;
    std::vector<std::string> temporary_;
};

// Purges temporary sessions when the entry point unwinds
class TemporarySessionGuard {
  public:
    explicit TemporarySessionGuard(SessionIndex& index) : index_(index) {}
    ~TemporarySessionGuard();
    TemporarySessionGuard(const TemporarySessionGuard&) = delete;
    TemporarySessionGuard& operator=(const TemporarySessionGuard&) = delete;

  private:
    SessionIndex& index_;
};
