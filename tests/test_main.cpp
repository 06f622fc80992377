#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipboard.hpp"
#include "controller.hpp"
#include "errors.hpp"
#include "filters.hpp"
#include "launcher.hpp"
#include "project_path.hpp"
#include "render.hpp"
#include "session.hpp"
#include "session_index.hpp"
#include "tag_store.hpp"
#include "transcript.hpp"
#include "util.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using modal::Intent;
using modal::IntentKind;
using modal::Mode;

namespace {

void assert_true(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

std::string make_temp_dir(const std::string& prefix) {
    const std::string dir = (fs::temp_directory_path() / (prefix + std::to_string(std::rand()))).string();
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string entry(const std::string& type, const json& content, const std::string& ts = "") {
    json j = {{"type", type}, {"message", {{"role", type}, {"content", content}}}};
    if (!ts.empty()) j["timestamp"] = ts;
    return j.dump();
}

void write_transcript(const fs::path& file, const std::vector<std::string>& lines) {
    std::string content;
    for (const auto& l : lines) content += l + "\n";
    write_file(file, content);
}

SessionList make_sessions(size_t n) {
    SessionList out;
    for (size_t i = 0; i < n; ++i)
        out.push_back(std::make_shared<Session>("session-" + std::to_string(i), "/work/proj", "/nonexistent.jsonl"));
    return out;
}

modal::State state_with(const SessionList& view) {
    modal::State s;
    s.view = view;
    return s;
}

modal::State apply_keys(modal::State s, const std::string& keys, const SessionList& all) {
    for (char c : keys) s = modal::reduce(std::move(s), Intent{IntentKind::InsertChar, c}, all).state;
    return s;
}

class FakeClipboard : public clipboard::IClipboard {
  public:
    bool copy(const std::string& text, std::string&) override {
        copied = text;
        return true;
    }
    std::optional<std::string> primary_selection() override { return std::nullopt; }
    std::string copied;
};

// Writes the transcript the real assistant would create for a new session
class FakeLauncher : public launch::ISessionLauncher {
  public:
    explicit FakeLauncher(fs::path project_dir) : project_dir_(std::move(project_dir)) {}

    std::string create_session(const std::string& title) override {
        const std::string id = "created-" + std::to_string(++created_);
        titles.push_back(title);
        write_transcript(project_dir_ / (id + ".jsonl"), {entry("user", title, "2024-05-01T10:00:00Z")});
        fs::create_directories(project_dir_ / id);
        return id;
    }
    int resume(const std::string&, const std::string&) override { return 0; }
    void exec_resume(const std::string&, const std::string&) override { throw LaunchError("exec not available in tests"); }

    std::vector<std::string> titles;

  private:
    fs::path project_dir_;
    int created_ = 0;
};

// ---------------------------- transcript ----------------------------
void test_malformed_line_is_skipped() {
    std::istringstream in(entry("user", "first question") + "\n" +
                          entry("assistant", json::array({{{"type", "text"}, {"text", "part one"}},
                                                          {{"type", "tool_use"}, {"name", "bash"}},
                                                          {{"type", "text"}, {"text", "part two"}}})) +
                          "\n" + "{not json at all\n" + "\n" + R"({"type":"summary","summary":"x"})" + "\n" +
                          entry("user", "second question") + "\n");
    transcript::ParseResult result = transcript::parse_stream(in);
    assert_true(result.skipped_lines == 1, "one malformed line should be counted");
    assert_true(result.messages.size() == 3, "three messages should survive the malformed line");
    assert_true(transcript::role_of(result.messages[1]) == transcript::Role::Assistant, "second message is the assistant");
    assert_true(transcript::text_of(result.messages[1]) == "part one\n\npart two", "text items join with a blank line");
    assert_true(transcript::text_of(result.messages[2]) == "second question", "message after the bad line is kept");
}

void test_summary_preview_and_timestamp() {
    std::istringstream in(R"({"type":"system","timestamp":"2024-01-01T00:00:00Z"})" "\n" +
                          entry("user", std::string(150, 'a'), "2024-02-03T04:05:06.789Z") + "\n" +
                          entry("assistant", "ignored") + "\n");
    transcript::Summary summary = transcript::scan_summary(in);
    assert_true(summary.preview.size() == 100, "preview is cut to 100 bytes");
    assert_true(util::format_timestamp(summary.timestamp) == "2024-02-03 04:05", "timestamp comes from the first user entry");
}

void test_iso_and_epoch_timestamps_agree() {
    auto iso = util::parse_iso8601("2024-03-10T12:30:00.500Z");
    auto offset = util::parse_iso8601("2024-03-10T14:30:00.500+02:00");
    auto epoch = util::from_epoch_millis(1710073800500.0);
    assert_true(iso.has_value() && offset.has_value() && epoch.has_value(), "all three forms should parse");
    assert_true(*iso == *offset, "offset form should equal the UTC form");
    assert_true(*iso == *epoch, "epoch milliseconds should equal the ISO form");
    assert_true(!util::parse_iso8601("yesterday").has_value(), "garbage is not a timestamp");
    assert_true(util::format_timestamp(std::nullopt) == "unknown", "missing timestamp renders as unknown");
}

void test_messages_cached_until_invalidated() {
    const std::string dir = make_temp_dir("claude-sessions-cache-");
    const fs::path file = fs::path(dir) / "c1.jsonl";
    write_transcript(file, {entry("user", "one")});
    Session session("c1", "/srv/app", file.string());
    assert_true(!session.parsed(), "messages are not parsed at construction");
    assert_true(session.messages().size() == 1, "first access parses the transcript");

    write_transcript(file, {entry("user", "one"), entry("assistant", "two")});
    assert_true(session.messages().size() == 1, "later access serves the cache");
    session.invalidate();
    assert_true(session.messages().size() == 2, "invalidate forces a re-parse");
    fs::remove_all(dir);
}

// ---------------------------- tag store ----------------------------
void test_tag_store_canonical_round_trip() {
    const std::string dir = make_temp_dir("claude-sessions-tags-");
    const std::string path = dir + "/tags.json";
    const std::string canonical = "{\n  \"aaa\": \"one\",\n  \"bbb\": \"two\"\n}\n";
    write_file(path, canonical);

    TagStore store(path);
    store.load();
    assert_true(store.entries().size() == 2, "both tags should load");
    store.save();
    assert_true(read_file(path) == canonical, "save(load(f)) should reproduce a canonical file");

    store.set("aaa", "one");
    const std::string first = read_file(path);
    store.set("aaa", "one");
    assert_true(read_file(path) == first, "tagging twice with the same value leaves the file unchanged");
    assert_true(store.find_by_tag("two") == std::optional<std::string>("bbb"), "reverse lookup by tag");

    write_file(path, "[1, 2, 3]");
    store.load();
    assert_true(store.entries().empty(), "a non-object tag file loads as empty");

    fs::remove_all(dir);
}

// ---------------------------- discovery ----------------------------
void test_discovery_sorts_and_deduplicates() {
    const std::string dir = make_temp_dir("claude-sessions-discover-");
    const fs::path projects = fs::path(dir) / "projects";
    const fs::path p1 = projects / "-nonexistent-alpha";
    const fs::path p2 = projects / "-nonexistent-beta";

    write_transcript(p1 / "aaa.jsonl", {entry("user", "old", "2024-01-01T00:00:00Z")});
    write_transcript(p1 / "ccc.jsonl", {entry("user", "tie two", "2024-03-01T00:00:00Z")});
    write_transcript(p2 / "bbb.jsonl", {entry("user", "tie one", "2024-03-01T00:00:00Z")});
    write_transcript(p2 / "ddd.jsonl", {R"({"type":"summary"})"});
    write_transcript(p2 / "agent-123.jsonl", {entry("user", "sub agent", "2024-04-01T00:00:00Z")});
    write_file(p2 / "notes.txt", "not a transcript");

    write_transcript(p1 / "dup.jsonl", {entry("user", "older copy", "2024-02-01T00:00:00Z")});
    write_transcript(p2 / "dup.jsonl", {entry("user", "newer copy", "2024-02-01T00:00:00Z")});
    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(p1 / "dup.jsonl", now - std::chrono::hours(2));
    fs::last_write_time(p2 / "dup.jsonl", now - std::chrono::hours(1));

    DiscoveryResult result = discover_sessions(projects.string());
    std::vector<std::string> ids;
    for (const auto& s : result.sessions) ids.push_back(s->id);
    const std::vector<std::string> expected = {"bbb", "ccc", "dup", "aaa", "ddd"};
    assert_true(ids == expected, "sessions sorted newest first, ties by id, untimed last");
    assert_true(result.report.dropped.size() == 1, "one colliding file should be dropped");
    assert_true(result.sessions[2]->preview == "newer copy", "the newer transcript wins an id collision");
    assert_true(!result.sessions[4]->timestamp.has_value(), "a transcript without timestamps has none");

    assert_true(discover_sessions((fs::path(dir) / "missing").string()).sessions.empty(),
                "a missing projects directory yields no sessions");
    fs::remove_all(dir);
}

void test_unreadable_transcript_is_listed() {
    const std::string dir = make_temp_dir("claude-sessions-unreadable-");
    const fs::path project = fs::path(dir) / "-srv-app";
    write_transcript(project / "ok.jsonl", {entry("user", "fine", "2024-01-01T00:00:00Z")});
    write_transcript(project / "locked.jsonl", {entry("user", "secret", "2024-01-02T00:00:00Z")});
    fs::permissions(project / "locked.jsonl", fs::perms::none);
    if (std::ifstream(project / "locked.jsonl").is_open()) {
        // permission bits do not stop root
        fs::remove_all(dir);
        return;
    }

    DiscoveryResult result = discover_sessions(dir);
    assert_true(result.sessions.size() == 2, "an unreadable transcript is still listed");
    assert_true(result.report.unreadable == 1, "the unreadable file is counted");
    SessionPtr locked = result.sessions[0]->id == "locked" ? result.sessions[0] : result.sessions[1];
    assert_true(locked->id == "locked" && locked->read_failed, "the record is flagged read_failed");
    assert_true(locked->preview.empty() && !locked->timestamp, "no preview or timestamp could be read");
    assert_true(result.sessions[0]->id == "ok", "sessions with a timestamp sort first");
    fs::remove_all(dir);
}

void test_project_path_decoding() {
    std::vector<std::string> on_disk = {"/home", "/home/user", "/home/user/my-project"};
    auto exists = [&](const std::string& p) { return std::find(on_disk.begin(), on_disk.end(), p) != on_disk.end(); };

    projects::DecodedPath clean = projects::decode("-home-user-my-project", "/", exists);
    assert_true(clean.path == "/home/user/my-project", "dashed directory name should be recovered");
    assert_true(!clean.ambiguous, "a single existing candidate is not ambiguous");

    on_disk.push_back("/home/user/my");
    on_disk.push_back("/home/user/my/project");
    projects::DecodedPath guessed = projects::decode("-home-user-my-project", "/", exists);
    assert_true(guessed.ambiguous, "two existing candidates should be flagged");

    projects::DecodedPath unknown = projects::decode("-srv-app", "/", [](const std::string&) { return false; });
    assert_true(unknown.path == "/srv/app" && unknown.ambiguous, "unconfirmed parts are kept verbatim and flagged");

    assert_true(projects::encode("/home/user/.config") == "-home-user--config", "slashes and dots become dashes");
}

// ---------------------------- filters ----------------------------
void test_list_filter_is_order_preserving() {
    SessionList sessions = make_sessions(5);
    sessions[1]->tag = "Bugfix login";
    sessions[3]->preview = "fix the BUG in parser";
    sessions[4]->project_path = "/work/bugtracker";

    SessionList hits = filters::list_filter("bug", sessions);
    assert_true(hits.size() == 3, "tag, preview and project name all match case-insensitively");
    assert_true(hits[0] == sessions[1] && hits[1] == sessions[3] && hits[2] == sessions[4], "input order is kept");
    assert_true(filters::list_filter("", sessions) == sessions, "an empty query returns the input");
    assert_true(filters::list_filter("   ", sessions) == sessions, "a blank query returns the input");
    assert_true(filters::list_filter("session-2", sessions).size() == 1, "ids are searchable");
}

void test_match_cursor_wraps() {
    std::string text(45, '.');
    text[5] = text[20] = text[40] = 'x';
    filters::MatchCursor cursor;
    cursor.reset("X", text);
    assert_true((cursor.offsets() == std::vector<size_t>{5, 20, 40}), "matches found case-insensitively");
    cursor.next();
    cursor.next();
    assert_true(cursor.current() == std::optional<size_t>(40), "cursor reaches the last match");
    assert_true(cursor.next() == std::optional<size_t>(5) && cursor.wrapped(), "next from the last wraps to the first");
    assert_true(cursor.previous() == std::optional<size_t>(40) && cursor.wrapped(), "previous from the first wraps to the last");

    cursor.reset("zzz", text);
    assert_true(cursor.active() && cursor.empty(), "a query without hits stays active but empty");
    assert_true(!cursor.next().has_value(), "stepping without matches yields nothing");
    assert_true((filters::find_matches("aaaa", "aa") == std::vector<size_t>{0, 1, 2}), "matches may overlap");
}

// ---------------------------- state machine ----------------------------
void test_jump_validation() {
    SessionList all = make_sessions(12);
    modal::State s = modal::reduce(state_with(all), Intent{IntentKind::BeginJump}, all).state;
    assert_true(s.mode == Mode::CommandEntry, "':' enters command mode");

    modal::State zero = modal::reduce(apply_keys(s, "0", all), Intent{IntentKind::Commit}, all).state;
    assert_true(zero.mode == Mode::CommandEntry && !zero.error.empty(), "0 is rejected and the mode stays");
    assert_true(zero.buffer == "0", "the rejected buffer is kept");

    modal::State twelve = modal::reduce(apply_keys(s, "+12", all), Intent{IntentKind::Commit}, all).state;
    assert_true(twelve.mode == Mode::Normal && twelve.selected == 11, "12 selects the last of 12 sessions");

    modal::State word = modal::reduce(apply_keys(s, "abc", all), Intent{IntentKind::Commit}, all).state;
    assert_true(word.mode == Mode::CommandEntry && word.error.find("Unknown command") == 0, "non-numbers are rejected");
    modal::State edited = modal::reduce(word, Intent{IntentKind::Backspace}, all).state;
    assert_true(edited.error.empty() && edited.buffer == "ab", "editing clears the validation error");
}

void test_double_g_needs_two_quick_presses() {
    SessionList all = make_sessions(3);
    modal::State s = state_with(all);
    s.selected = 2;
    const auto t0 = modal::Clock::now();

    modal::State slow = modal::reduce(s, Intent{IntentKind::GoFirst, 0, t0}, all).state;
    slow = modal::reduce(slow, Intent{IntentKind::GoFirst, 0, t0 + std::chrono::milliseconds(600)}, all).state;
    assert_true(slow.selected == 2, "two presses 600ms apart do not jump");

    modal::State quick = modal::reduce(s, Intent{IntentKind::GoFirst, 0, t0}, all).state;
    quick = modal::reduce(quick, Intent{IntentKind::GoFirst, 0, t0 + std::chrono::milliseconds(100)}, all).state;
    assert_true(quick.selected == 0, "gg within 500ms jumps to the top");

    modal::State broken = modal::reduce(s, Intent{IntentKind::GoFirst, 0, t0}, all).state;
    broken = modal::reduce(broken, Intent{IntentKind::MoveUp, 0, t0}, all).state;
    broken = modal::reduce(broken, Intent{IntentKind::GoFirst, 0, t0 + std::chrono::milliseconds(50)}, all).state;
    assert_true(broken.selected == 1, "another key between the presses cancels gg");

    modal::State aborted = modal::reduce(s, Intent{IntentKind::GoFirst, 0, t0}, all).state;
    aborted = modal::reduce(aborted, Intent{IntentKind::BeginFilter, 0, t0}, all).state;
    aborted = modal::reduce(aborted, Intent{IntentKind::Cancel, 0, t0}, all).state;
    aborted = modal::reduce(aborted, Intent{IntentKind::GoFirst, 0, t0 + std::chrono::milliseconds(50)}, all).state;
    assert_true(aborted.selected == 2, "a cancelled prompt between the presses cancels gg");

    modal::State last = modal::reduce(s, Intent{IntentKind::GoLast}, all).state;
    assert_true(last.selected == 2, "G selects the last session");
}

void test_filter_keeps_selection() {
    SessionList all = make_sessions(6);
    all[2]->tag = "keep";
    all[4]->tag = "keep too";
    modal::State s = state_with(all);
    s.selected = 4;
    s = modal::reduce(s, Intent{IntentKind::BeginFilter}, all).state;
    s = modal::reduce(apply_keys(s, "keep", all), Intent{IntentKind::Commit}, all).state;
    assert_true(s.mode == Mode::Normal && s.view.size() == 2, "filter commit narrows the view");
    assert_true(s.selected == 1, "selection follows the previously selected session");
    assert_true(s.notice && s.notice->text == "Search: keep (2 results)", "filter result is announced");

    s = modal::reduce(s, Intent{IntentKind::BeginFilter}, all).state;
    s = modal::reduce(s, Intent{IntentKind::Commit}, all).state;
    assert_true(s.view.size() == 6 && s.selected == 4, "an empty filter restores the full list");
}

void test_help_blocks_other_keys() {
    SessionList all = make_sessions(3);
    modal::State s = modal::reduce(state_with(all), Intent{IntentKind::ToggleHelp}, all).state;
    assert_true(s.help_visible, "ctrl+k opens help");
    s = modal::reduce(s, Intent{IntentKind::MoveDown}, all).state;
    assert_true(s.help_visible && s.selected == 0, "navigation is ignored while help is shown");
    s = modal::reduce(s, Intent{IntentKind::Cancel}, all).state;
    assert_true(!s.help_visible && !s.quit, "escape closes help");
}

void test_list_width_limits() {
    SessionList all = make_sessions(1);
    modal::State s = state_with(all);
    for (int i = 0; i < 20; ++i) s = modal::reduce(s, Intent{IntentKind::ShrinkList}, all).state;
    assert_true(s.list_width == modal::kMinListWidth, "list pane stops shrinking at the minimum");
    for (int i = 0; i < 20; ++i) s = modal::reduce(s, Intent{IntentKind::GrowList}, all).state;
    assert_true(s.list_width == modal::kMaxListWidth, "list pane stops growing at the maximum");
}

// ---------------------------- controller ----------------------------
struct Fixture {
    std::string dir;
    fs::path project;
    std::string tags_path;

    Fixture() {
        dir = make_temp_dir("claude-sessions-ctl-");
        project = fs::path(dir) / "projects" / "-nonexistent-app";
        tags_path = dir + "/claude-sessions-tags.json";
        write_transcript(project / "s-new.jsonl",
                         {entry("user", "refactor the parser", "2024-06-02T09:00:00Z"),
                          entry("assistant", "Parser refactored."), entry("user", "now add tests")});
        write_transcript(project / "s-old.jsonl", {entry("user", "hello", "2024-06-01T09:00:00Z")});
    }
    ~Fixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    SessionIndex make_index() const {
        TagStore tags(tags_path);
        tags.load();
        SessionIndex index((fs::path(dir) / "projects").string(), std::move(tags));
        index.refresh();
        return index;
    }
};

void test_tag_entry_commit_and_cancel() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);

    ctl.dispatch(Intent{IntentKind::BeginTag});
    assert_true(ctl.state().mode == Mode::TagEntry, "t enters tag entry");
    ctl.dispatch(Intent{IntentKind::Cancel});
    assert_true(ctl.state().mode == Mode::Normal, "escape returns to normal");
    assert_true(!fs::exists(fx.tags_path), "cancel writes no tag file");

    ctl.dispatch(Intent{IntentKind::BeginTag});
    for (char c : std::string("bugfix")) ctl.dispatch(Intent{IntentKind::InsertChar, c});
    ctl.dispatch(Intent{IntentKind::Commit});
    assert_true(ctl.state().mode == Mode::Normal, "commit returns to normal");
    assert_true(index.find("s-new")->tag == std::optional<std::string>("bugfix"), "the selected session is tagged");
    json saved = json::parse(read_file(fx.tags_path));
    assert_true(saved["s-new"] == "bugfix", "the tag file holds the new tag");

    ctl.dispatch(Intent{IntentKind::BeginTag});
    assert_true(ctl.state().buffer == "bugfix", "tag entry starts from the current tag");
    for (int i = 0; i < 6; ++i) ctl.dispatch(Intent{IntentKind::Backspace});
    ctl.dispatch(Intent{IntentKind::Commit});
    assert_true(!index.find("s-new")->tag.has_value(), "an empty tag clears it");
}

void test_delete_removes_transcript_and_tag() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    index.tag("s-new", "doomed");
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);

    ctl.dispatch(Intent{IntentKind::Delete});
    assert_true(ctl.state().mode == Mode::ConfirmDelete, "d asks for confirmation");
    ctl.dispatch(Intent{IntentKind::Cancel});
    assert_true(fs::exists(fx.project / "s-new.jsonl"), "cancelled delete keeps the file");

    ctl.dispatch(Intent{IntentKind::Delete});
    ctl.dispatch(Intent{IntentKind::Confirm});
    assert_true(!fs::exists(fx.project / "s-new.jsonl"), "confirmed delete removes the transcript");
    assert_true(!index.tags().get("s-new").has_value(), "the tag entry is gone");
    assert_true(ctl.state().view.size() == 1 && ctl.state().selected == 0, "the view shrinks and selection is clamped");

    bool threw = false;
    try {
        index.tag("s-new", "again");
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert_true(threw, "tagging a deleted session reports not found");
}

// A directory where the tag file belongs makes every tag save fail
void block_tag_file(const Fixture& fx) {
    std::error_code ec;
    fs::remove(fx.tags_path, ec);
    fs::create_directories(fx.tags_path);
}

void test_delete_survives_tag_file_failure() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    index.tag("s-new", "doomed");
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);
    block_tag_file(fx);

    ctl.dispatch(Intent{IntentKind::Delete});
    ctl.dispatch(Intent{IntentKind::Confirm});
    assert_true(!fs::exists(fx.project / "s-new.jsonl"), "the transcript is removed");
    assert_true(!index.find("s-new"), "the index forgets the session");
    assert_true(ctl.state().view.size() == 1 && ctl.state().view[0]->id == "s-old", "the view drops the row");
    assert_true(ctl.state().notice && ctl.state().notice->severity == modal::Severity::Warning,
                "the stale tag file is reported as a warning");
}

void test_remove_missing_transcript_keeps_record() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    fs::remove(fx.project / "s-old.jsonl");

    bool threw = false;
    try {
        index.remove("s-old");
    } catch (const IoFailure&) {
        threw = true;
    }
    assert_true(threw, "deleting a vanished transcript reports an I/O failure");
    assert_true(index.find("s-old") != nullptr, "the record stays in the index");
    assert_true(index.sessions().size() == 2, "no other record is touched");

    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);
    ctl.dispatch(Intent{IntentKind::MoveDown});
    ctl.dispatch(Intent{IntentKind::Delete});
    ctl.dispatch(Intent{IntentKind::Confirm});
    assert_true(ctl.state().view.size() == 2, "the failed delete keeps the row");
    assert_true(ctl.state().notice && ctl.state().notice->severity == modal::Severity::Error, "the failure is shown");
}

void test_tag_rejects_invalid_utf8() {
    assert_true(util::valid_utf8("plain") && util::valid_utf8("caf\xC3\xA9"), "ASCII and UTF-8 are accepted");
    assert_true(!util::valid_utf8("caf\xE9") && !util::valid_utf8("\xC0\xAF"), "Latin-1 and overlong bytes are rejected");

    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);

    ctl.dispatch(Intent{IntentKind::BeginTag});
    ctl.dispatch(Intent{IntentKind::InsertChar, '\xE9'});
    ctl.dispatch(Intent{IntentKind::Commit});
    assert_true(ctl.state().mode == Mode::Normal, "the prompt closes");
    assert_true(ctl.state().notice && ctl.state().notice->severity == modal::Severity::Error, "the bad tag is reported");
    assert_true(!index.tags().get("s-new").has_value(), "nothing is stored for the bad tag");

    index.tag("s-old", "still works");
    assert_true(json::parse(read_file(fx.tags_path))["s-old"] == "still works", "later saves are unaffected");

    TagStore store(fx.dir + "/raw-tags.json");
    bool threw = false;
    try {
        store.set("s1", "caf\xE9");
    } catch (const IoFailure&) {
        threw = true;
    }
    assert_true(threw, "an unencodable tag is an I/O failure");
    assert_true(store.entries().empty(), "the failed set is rolled back");
}

void test_thread_search_and_copy() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);

    ctl.dispatch(Intent{IntentKind::NextMatch});
    assert_true(ctl.state().notice && ctl.state().notice->text == "No search active", "n without a search warns");

    ctl.dispatch(Intent{IntentKind::FocusThread});
    ctl.dispatch(Intent{IntentKind::BeginFilter});
    for (char c : std::string("parser")) ctl.dispatch(Intent{IntentKind::InsertChar, c});
    ctl.dispatch(Intent{IntentKind::Commit});
    assert_true(ctl.state().search.count() == 2, "both mentions in the thread are found");
    assert_true(ctl.state().view.size() == 2, "a thread search leaves the list alone");
    ctl.dispatch(Intent{IntentKind::NextMatch});
    ctl.dispatch(Intent{IntentKind::NextMatch});
    assert_true(ctl.state().search.position() == std::optional<size_t>(0) && ctl.state().search.wrapped(),
                "stepping past the last match wraps");

    ctl.dispatch(Intent{IntentKind::ToggleUserOnly});
    assert_true(ctl.thread_text().find("Parser refactored.") == std::string::npos, "user-only hides assistant text");
    assert_true(ctl.state().search.count() == 1, "an active search is recomputed on the new text");

    ctl.dispatch(Intent{IntentKind::CopyThread});
    assert_true(clip.copied.rfind("# Session: s-new", 0) == 0, "copy puts the markdown thread on the clipboard");

    ctl.dispatch(Intent{IntentKind::MoveDown});
    ctl.dispatch(Intent{IntentKind::FocusList});
    ctl.dispatch(Intent{IntentKind::MoveDown});
    assert_true(!ctl.state().search.active(), "changing the selection clears the thread search");
}

void test_start_and_jump_requests() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);

    assert_true(!ctl.jump_to(3), "jumping past the list fails");
    assert_true(ctl.jump_to(2) && ctl.state().selected == 1, "jump_to is 1-based");
    ctl.dispatch(Intent{IntentKind::StartSession});
    assert_true(ctl.state().quit && ctl.exit_request().has_value(), "s closes the browser with a resume request");
    assert_true(ctl.exit_request()->session_id == "s-old", "the selected session is resumed");
}

void test_reload_picks_up_new_transcripts() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, fx.dir);
    ctl.dispatch(Intent{IntentKind::MoveDown});

    write_transcript(fx.project / "s-newest.jsonl", {entry("user", "fresh", "2024-07-01T00:00:00Z")});
    ctl.dispatch(Intent{IntentKind::Reload});
    assert_true(ctl.state().view.size() == 3, "reload discovers the new transcript");
    assert_true(ctl.state().selected_session()->id == "s-old", "reload keeps the selected session");
    assert_true(ctl.state().notice && ctl.state().notice->text == "Reloaded 3 sessions", "reload is announced");
}

void test_export_writes_markdown() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    index.tag("s-new", "api/v2: work");
    const std::string out_dir = fx.dir + "/out";
    fs::create_directories(out_dir);
    FakeClipboard clip;
    modal::ModalController ctl(index, clip, out_dir);

    ctl.dispatch(Intent{IntentKind::Export});
    const fs::path expected = fs::path(out_dir) / "s-new-api_v2_ work.md";
    assert_true(fs::exists(expected), "export file name carries the sanitized tag");
    const std::string md = read_file(expected.string());
    assert_true(md.rfind("# Claude Session: s-new", 0) == 0, "export starts with the session header");
    assert_true(md.find("**Tag:** api/v2: work") != std::string::npos, "export lists the tag");
    assert_true(md.find("## User\n\nrefactor the parser") != std::string::npos, "each message gets a section");
}

// ---------------------------- session creation ----------------------------
void test_temporary_session_cleanup() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeLauncher launcher(fx.project);

    std::string id = index.create("  scratch  ", true, launcher);
    assert_true(launcher.titles.size() == 1 && launcher.titles[0] == "Session: scratch", "the session is titled by its tag");
    assert_true(index.find_by_tag("scratch") == std::optional<std::string>(id), "the new session is tagged");
    assert_true(index.temporary_ids().size() == 1, "the session is recorded as temporary");
    {
        TemporarySessionGuard guard(index);
    }
    assert_true(!fs::exists(fx.project / (id + ".jsonl")), "the temporary transcript is purged");
    assert_true(!fs::exists(fx.project / id), "its empty scratch directory is removed");
    assert_true(!index.find_by_tag("scratch").has_value(), "its tag is dropped");
    assert_true(index.temporary_ids().empty(), "nothing is left to clean");

    bool threw = false;
    try {
        index.create("   ", false, launcher);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert_true(threw, "a blank session name is rejected");
}

void test_temporary_session_recorded_when_tagging_fails() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    FakeLauncher launcher(fx.project);
    block_tag_file(fx);

    bool threw = false;
    try {
        index.create("scratch", true, launcher);
    } catch (const IoFailure&) {
        threw = true;
    }
    assert_true(threw, "the tag save failure is surfaced");
    assert_true(index.temporary_ids().size() == 1, "the created session is still recorded as temporary");
    const std::string id = index.temporary_ids()[0];
    assert_true(fs::exists(fx.project / (id + ".jsonl")), "the launcher created the transcript");

    index.cleanup_temporary();
    assert_true(!fs::exists(fx.project / (id + ".jsonl")), "cleanup still removes it");
    assert_true(index.temporary_ids().empty(), "nothing is left to clean");
}

void test_overwrite_replaces_tagged_session() {
    Fixture fx;
    SessionIndex index = fx.make_index();
    index.tag("s-old", "daily");
    FakeLauncher launcher(fx.project);

    std::string id = index.create("daily", false, launcher, index.find_by_tag("daily"));
    assert_true(!fs::exists(fx.project / "s-old.jsonl"), "the replaced transcript is deleted");
    assert_true(index.find_by_tag("daily") == std::optional<std::string>(id), "the tag moves to the new session");
    assert_true(fs::exists(fx.project / (id + ".jsonl")), "the new session is kept");
}

void test_created_session_id_parsing() {
    assert_true(launch::parse_created_session_id("\x1b{\"session_id\":\"abc-123\",\"result\":\"ok\"}\n") == "abc-123",
                "control characters are stripped before parsing");
    bool threw = false;
    try {
        launch::parse_created_session_id("{\"result\":\"ok\"}");
    } catch (const LaunchError&) {
        threw = true;
    }
    assert_true(threw, "output without a session id is an error");
}

// ---------------------------- rendering ----------------------------
void test_thread_render_groups_runs() {
    const std::string dir = make_temp_dir("claude-sessions-render-");
    const fs::path file = fs::path(dir) / "r1.jsonl";
    write_transcript(file, {entry("user", "one"), entry("user", "two"), entry("assistant", "three")});
    Session session("r1", "/srv/app", file.string());
    session.path_ambiguous = true;

    const std::string text = render::render_thread(session, false);
    assert_true(text.find("Project: /srv/app (?)\n") != std::string::npos, "guessed project paths are marked");
    assert_true(text.find("User:\none\n\ntwo\n\nAssistant:\nthree") != std::string::npos, "same-role runs are merged");
    assert_true(render::line_of(text, text.find("three")) == 10, "line_of counts newlines before the offset");

    Session missing("gone", "/srv/app", dir + "/gone.jsonl");
    assert_true(render::render_thread(missing, false).find("Error:\nError loading messages") != std::string::npos,
                "an unreadable transcript shows an error note");
    fs::remove_all(dir);
}

}  // namespace

int main() {
    try {
        test_malformed_line_is_skipped();
        test_summary_preview_and_timestamp();
        test_iso_and_epoch_timestamps_agree();
        test_messages_cached_until_invalidated();
        test_tag_store_canonical_round_trip();
        test_discovery_sorts_and_deduplicates();
        test_unreadable_transcript_is_listed();
        test_project_path_decoding();
        test_list_filter_is_order_preserving();
        test_match_cursor_wraps();
        test_jump_validation();
        test_double_g_needs_two_quick_presses();
        test_filter_keeps_selection();
        test_help_blocks_other_keys();
        test_list_width_limits();
        test_tag_entry_commit_and_cancel();
        test_delete_removes_transcript_and_tag();
        test_delete_survives_tag_file_failure();
        test_remove_missing_transcript_keeps_record();
        test_tag_rejects_invalid_utf8();
        test_thread_search_and_copy();
        test_start_and_jump_requests();
        test_reload_picks_up_new_transcripts();
        test_export_writes_markdown();
        test_temporary_session_cleanup();
        test_temporary_session_recorded_when_tagging_fails();
        test_overwrite_replaces_tagged_session();
        test_created_session_id_parsing();
        test_thread_render_groups_runs();
        std::cout << "claude_sessions_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "claude_sessions_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
