#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

#include "clipboard.hpp"
#include "filters.hpp"
#include "session.hpp"
#include "session_index.hpp"

namespace modal {

using Clock = std::chrono::steady_clock;

enum class Mode { Normal, FilterEntry, CommandEntry, TagEntry, ConfirmDelete };
enum class TagPurpose { Tag, NewSession };
enum class Focus { List, Thread };
enum class Severity { Info, Warning, Error };

// Abstract user intents; the key bindings live in the terminal front end
enum class IntentKind {
    MoveUp, MoveDown, PageUp, PageDown, GoFirst, GoLast,
    BeginFilter, BeginJump, BeginTag, BeginNewSession,
    InsertChar, Backspace, Commit, Cancel, Confirm,
    StartSession, Delete, Export, CopyThread, CopySelection, ToggleUserOnly,
    NextMatch, PreviousMatch, ShrinkList, GrowList, FocusList, FocusThread,
    Reload, ToggleHelp, Quit,
};

struct Intent {
    IntentKind kind;
    char ch = 0;                      // InsertChar only
    Clock::time_point at = Clock::now();
};

struct Notice {
    std::string text;
    Severity severity = Severity::Info;
};

constexpr auto kDoublePressWindow = std::chrono::milliseconds(500);
constexpr size_t kPageRows = 10;
constexpr int kMinListWidth = 15;
constexpr int kMaxListWidth = 70;
constexpr int kListWidthStep = 5;
constexpr size_t kContextLines = 5; // lines kept above a search hit
constexpr size_t kScrollToBottom = std::numeric_limits<size_t>::max();

struct State {
    Mode mode = Mode::Normal;
    TagPurpose tag_purpose = TagPurpose::Tag;
    std::string buffer;
    std::string error; // validation message for the active entry mode

    Focus focus = Focus::List;
    SessionList view;
    std::string list_query;
    size_t selected = 0;

    size_t thread_scroll = 0; // first visible text line
    size_t thread_page = kPageRows;
    bool user_only = false;
    filters::MatchCursor search;

    int list_width = 30; // percent of the screen
    bool help_visible = false;
    std::optional<Clock::time_point> pending_first; // first 'g' of "gg"
    std::optional<Notice> notice;
    bool quit = false;

    SessionPtr selected_session() const;
};

enum class EffectKind {
    None, ApplyTag, Delete, CreateSession, StartSession, Export, CopyThread, CopySelection, SearchThread, RefreshThread, Reload,
};

struct Effect {
    EffectKind kind = EffectKind::None;
    std::string session_id;
    std::string value; // tag, session name or search query
};

struct Transition {
    State state;
    Effect effect;
};

// Pure transition: no I/O, no clock reads. `all` is the unfiltered collection.
Transition reduce(State state, const Intent& intent, const SessionList& all, bool include_content = false);

// What the entry point should do once the browser closes
struct ExitRequest {
    enum class Kind { Resume, Create };
    Kind kind;
    std::string session_id;
    std::string project_dir;
    std::string tag;
};

// Holds the one State of a running browser and carries out committed effects
class ModalController {
  public:
    ModalController(SessionIndex& index, clipboard::IClipboard& clip, std::string export_dir, bool deep_search = false);

    const State& state() const { return state_; }
    void dispatch(const Intent& intent);

    // "open at index N" (1-based, visible list); false with an error notice
    bool jump_to(size_t number);

    // Rebuild the view after the index changed, keeping the selection
    void reload();

    // Rendered text of the selected session, cached until it changes
    const std::string& thread_text();

    // Renderer feedback: clamps scrolling to the text actually drawn
    void set_thread_viewport(size_t total_lines, size_t rows);

    void notify(std::string text, Severity severity = Severity::Info);
    const std::optional<ExitRequest>& exit_request() const { return exit_; }

  private:
    void apply(const Effect& effect);
    void refresh_search();

    SessionIndex& index_;
    clipboard::IClipboard& clip_;
    std::string export_dir_;
    bool deep_search_;
    State state_;
    std::optional<ExitRequest> exit_;

    std::string thread_text_;
    std::string thread_key_;
};

} // namespace modal
