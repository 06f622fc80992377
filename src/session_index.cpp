#include "session_index.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "project_path.hpp"

namespace fs = std::filesystem;
using std::string;
using std::vector;

namespace {

const string kTranscriptExt = ".jsonl";
const string kAgentPrefix = "agent-";

fs::file_time_type mtime_of(const string& path) {
    std::error_code ec;
    auto t = fs::last_write_time(path, ec);
    return ec ? fs::file_time_type::min() : t;
}

// true when `a` should be kept over `b` for the same id
bool wins_collision(const Session& a, const Session& b) {
    auto ta = mtime_of(a.file_path);
    auto tb = mtime_of(b.file_path);
    if (ta != tb) return ta > tb;
    return a.file_path < b.file_path;
}

SessionPtr scan_file(const fs::path& file, const projects::DecodedPath& project, DiscoveryReport& report) {
    auto session = std::make_shared<Session>(file.stem().string(), project.path, file.string());
    session->path_ambiguous = project.ambiguous;

    std::ifstream in(file);
    if (!in.is_open()) {
        spdlog::warn("discover: cannot read {}", file.string());
        session->read_failed = true;
        ++report.unreadable;
        return session;
    }
    transcript::Summary summary = transcript::scan_summary(in);
    session->preview = std::move(summary.preview);
    session->timestamp = summary.timestamp;
    report.skipped_lines += summary.skipped_lines;
    return session;
}

} // namespace

// ---------------------------- Discovery ----------------------------
void sort_sessions(SessionList& sessions) {
    std::sort(sessions.begin(), sessions.end(), [](const SessionPtr& a, const SessionPtr& b) {
        if (a->timestamp && b->timestamp && *a->timestamp != *b->timestamp) return *a->timestamp > *b->timestamp;
        if (a->timestamp.has_value() != b->timestamp.has_value()) return a->timestamp.has_value();
        return a->id < b->id;
    });
}

DiscoveryResult discover_sessions(const string& projects_root, const TagStore* tags) {
    DiscoveryResult result;
    std::error_code ec;
    if (!fs::is_directory(projects_root, ec)) {
        spdlog::info("discover: {} does not exist", projects_root);
        return result;
    }

    std::unordered_map<string, size_t> by_id;
    for (const auto& dir : fs::directory_iterator(projects_root, fs::directory_options::skip_permission_denied, ec)) {
        if (!dir.is_directory(ec)) continue;
        projects::DecodedPath project = projects::decode(dir.path().filename().string());
        if (project.ambiguous) ++result.report.ambiguous_paths;
        spdlog::debug("discover: project {} -> {}{}", dir.path().filename().string(), project.path,
                      project.ambiguous ? " (ambiguous)" : "");

        std::error_code dir_ec;
        for (const auto& entry : fs::directory_iterator(dir.path(), dir_ec)) {
            if (!entry.is_regular_file(dir_ec)) continue;
            const fs::path& file = entry.path();
            if (file.extension() != kTranscriptExt) continue;
            if (util::starts_with(file.stem().string(), kAgentPrefix)) continue;

            ++result.report.files;
            SessionPtr session = scan_file(file, project, result.report);
            if (tags) session->tag = tags->get(session->id);

            auto [it, inserted] = by_id.emplace(session->id, result.sessions.size());
            if (inserted) {
                result.sessions.push_back(std::move(session));
                continue;
            }
            SessionPtr& existing = result.sessions[it->second];
            if (wins_collision(*session, *existing)) std::swap(existing, session);
            spdlog::warn("discover: duplicate session id {}, dropping {}", existing->id, session->file_path);
            result.report.dropped.push_back(session->file_path);
        }
        if (dir_ec) spdlog::warn("discover: cannot list {}: {}", dir.path().string(), dir_ec.message());
    }
    if (ec) spdlog::warn("discover: error walking {}: {}", projects_root, ec.message());

    sort_sessions(result.sessions);
    spdlog::debug("discover: {} sessions from {} files", result.sessions.size(), result.report.files);
    return result;
}

// ---------------------------- SessionIndex ----------------------------
SessionIndex::SessionIndex(string projects_root, TagStore tags) : root_(std::move(projects_root)), tags_(std::move(tags)) {}

const DiscoveryReport& SessionIndex::refresh() {
    DiscoveryResult result = discover_sessions(root_, &tags_);
    sessions_ = std::move(result.sessions);
    report_ = std::move(result.report);
    return report_;
}

SessionPtr SessionIndex::find(const string& id) const {
    auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const SessionPtr& s) { return s->id == id; });
    return it == sessions_.end() ? nullptr : *it;
}

void SessionIndex::tag(const string& id, const string& value) {
    SessionPtr session = find(id);
    if (!session) throw NotFoundError(id);

    string clean = util::trim(value);
    if (!util::valid_utf8(clean)) throw ValidationError("tag is not valid UTF-8");
    if (clean.empty()) {
        tags_.erase(id);
        session->tag.reset();
        spdlog::info("tag: cleared {}", id);
        return;
    }
    tags_.set(id, clean);
    session->tag = clean;
    spdlog::info("tag: {} -> {}", id, clean);
}

bool SessionIndex::remove(const string& id) {
    SessionPtr session = find(id);
    if (!session) throw NotFoundError(id);

    std::error_code ec;
    if (!fs::remove(session->file_path, ec)) {
        string reason = ec ? ec.message() : "file no longer exists";
        throw IoFailure("cannot delete " + session->file_path + ": " + reason);
    }
    sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), session), sessions_.end());
    spdlog::info("delete: removed {}", session->file_path);

    // the transcript is gone; a stale tag entry must not undo that
    try {
        tags_.erase(id);
    } catch (const IoFailure& e) {
        spdlog::warn("delete: tag for {} not dropped: {}", id, e.what());
        return false;
    }
    return true;
}

string SessionIndex::create(const string& tag, bool temporary, launch::ISessionLauncher& launcher,
                            const std::optional<string>& replaces) {
    string clean = util::trim(tag);
    if (clean.empty()) throw ValidationError("a session name is required");
    if (!util::valid_utf8(clean)) throw ValidationError("session name is not valid UTF-8");

    string id = launcher.create_session("Session: " + clean);
    spdlog::info("create: new session {} tagged '{}'{}", id, clean, temporary ? " (temporary)" : "");
    if (temporary) temporary_.push_back(id);
    if (replaces && *replaces != id) {
        if (purge(*replaces)) spdlog::info("create: removed old session {}", *replaces);
    }
    tags_.set(id, clean);
    return id;
}

bool SessionIndex::purge(const string& id) {
    bool removed = false;
    std::error_code ec;
    if (fs::is_directory(root_, ec)) {
        const string target = id + kTranscriptExt;
        fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            if (it->path().filename() != target || !it->is_regular_file(ec)) continue;
            fs::path file = it->path();
            if (!fs::remove(file, ec)) throw IoFailure("cannot delete " + file.string() + ": " + ec.message());
            // the assistant keeps per-session scratch files in a sibling dir; only drop it when empty
            std::error_code dir_ec;
            fs::path scratch = file.parent_path() / id;
            if (fs::is_directory(scratch, dir_ec) && fs::is_empty(scratch, dir_ec)) fs::remove(scratch, dir_ec);
            removed = true;
            break;
        }
    }
    tags_.erase(id);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(), [&](const SessionPtr& s) { return s->id == id; }),
                    sessions_.end());
    return removed;
}

size_t SessionIndex::cleanup_temporary() {
    size_t cleaned = 0;
    vector<string> pending;
    pending.swap(temporary_);
    for (const auto& id : pending) {
        try {
            if (purge(id)) ++cleaned;
            spdlog::info("cleanup: temporary session {} removed", id);
        } catch (const IoFailure& e) {
            spdlog::error("cleanup: {}", e.what());
            temporary_.push_back(id);
        }
    }
    return cleaned;
}

TemporarySessionGuard::~TemporarySessionGuard() {
    try {
        index_.cleanup_temporary();
    } catch (const std::exception& e) {
        spdlog::error("cleanup: {}", e.what());
    }
}
