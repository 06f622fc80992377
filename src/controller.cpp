#include "controller.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "launcher.hpp"
#include "render.hpp"
#include "util.hpp"

using std::string;

namespace modal {
namespace {

void set_notice(State& s, string text, Severity severity = Severity::Info) {
    s.notice = Notice{std::move(text), severity};
}

// Moves the selection; a different session invalidates the thread search
void select_index(State& s, size_t index) {
    if (s.view.empty()) {
        s.selected = 0;
        return;
    }
    index = std::min(index, s.view.size() - 1);
    if (index == s.selected) return;
    s.selected = index;
    s.search.clear();
    s.thread_scroll = 0;
}

void scroll_thread(State& s, long delta) {
    if (s.thread_scroll == kScrollToBottom) return; // resolved by the next viewport update
    if (delta < 0) {
        size_t up = static_cast<size_t>(-delta);
        s.thread_scroll = s.thread_scroll > up ? s.thread_scroll - up : 0;
    } else {
        s.thread_scroll += static_cast<size_t>(delta);
    }
}

void scroll_to_match(State& s) {
    if (auto line = s.search.line()) s.thread_scroll = *line > kContextLines ? *line - kContextLines : 0;
}

void pop_utf8_char(string& buf) {
    while (!buf.empty()) {
        unsigned char c = static_cast<unsigned char>(buf.back());
        buf.pop_back();
        if ((c & 0xC0) != 0x80) break;
    }
}

void enter(State& s, Mode mode, string buffer = {}) {
    s.mode = mode;
    s.pending_first.reset();
    s.buffer = std::move(buffer);
    s.error.clear();
}

void leave(State& s) { enter(s, Mode::Normal); }

// FilterEntry commit
Effect commit_filter(State& s, const SessionList& all, bool include_content) {
    const string query = util::trim(s.buffer);
    leave(s);

    if (query.empty()) {
        SessionPtr prev = s.selected_session();
        s.list_query.clear();
        s.view = all;
        s.search.clear();
        auto it = std::find(s.view.begin(), s.view.end(), prev);
        s.selected = it == s.view.end() ? 0 : static_cast<size_t>(it - s.view.begin());
        set_notice(s, "Search cleared");
        return {};
    }
    if (s.focus == Focus::Thread) return Effect{EffectKind::SearchThread, "", query};

    SessionPtr prev = s.selected_session();
    s.list_query = query;
    s.view = filters::list_filter(query, all, include_content);
    auto it = std::find(s.view.begin(), s.view.end(), prev);
    if (it != s.view.end()) {
        s.selected = static_cast<size_t>(it - s.view.begin());
    } else {
        s.selected = 0;
        s.search.clear();
        s.thread_scroll = 0;
    }
    set_notice(s, "Search: " + query + " (" + std::to_string(s.view.size()) + " results)");
    return {};
}

// CommandEntry commit: a 1-based index into the visible list
void commit_jump(State& s) {
    string text = util::trim(s.buffer);
    if (!text.empty() && text[0] == '+') text.erase(0, 1);
    const bool numeric = !text.empty() && text.size() <= 9 &&
                         std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!numeric) {
        s.error = "Unknown command: " + util::trim(s.buffer);
        return;
    }
    const size_t number = std::stoul(text);
    if (number < 1 || number > s.view.size()) {
        s.error = s.view.empty() ? "No sessions to jump to"
                                 : "Invalid session number: " + std::to_string(number) + " (range: 1-" +
                                       std::to_string(s.view.size()) + ")";
        return;
    }
    leave(s);
    select_index(s, number - 1);
    s.focus = Focus::List;
    set_notice(s, "Jumped to session " + std::to_string(number));
}

Effect commit_tag(State& s) {
    const string value = util::trim(s.buffer);
    if (s.tag_purpose == TagPurpose::NewSession) {
        if (value.empty()) {
            s.error = "Session name required";
            return {};
        }
        leave(s);
        s.quit = true;
        return Effect{EffectKind::CreateSession, "", value};
    }
    SessionPtr session = s.selected_session();
    leave(s);
    if (!session) return {};
    return Effect{EffectKind::ApplyTag, session->id, value};
}

Effect reduce_entry(State& s, const Intent& in, const SessionList& all, bool include_content) {
    switch (in.kind) {
        case IntentKind::InsertChar:
            if (static_cast<unsigned char>(in.ch) >= 32 && in.ch != 127) {
                s.buffer.push_back(in.ch);
                s.error.clear();
            }
            return {};
        case IntentKind::Backspace:
            pop_utf8_char(s.buffer);
            s.error.clear();
            return {};
        case IntentKind::Cancel:
            leave(s);
            return {};
        case IntentKind::Commit:
            if (s.mode == Mode::FilterEntry) return commit_filter(s, all, include_content);
            if (s.mode == Mode::CommandEntry) {
                commit_jump(s);
                return {};
            }
            return commit_tag(s);
        default:
            return {};
    }
}

Effect reduce_confirm(State& s, const Intent& in) {
    if (in.kind == IntentKind::Cancel) {
        leave(s);
        return {};
    }
    if (in.kind != IntentKind::Confirm) return {};
    SessionPtr session = s.selected_session();
    leave(s);
    if (!session) return {};
    return Effect{EffectKind::Delete, session->id, ""};
}

Effect step_match(State& s, bool forward) {
    if (!s.search.active()) {
        set_notice(s, "No search active", Severity::Warning);
        return {};
    }
    if (s.search.empty()) {
        set_notice(s, "No matches for '" + s.search.query() + "'", Severity::Warning);
        return {};
    }
    if (forward) s.search.next();
    else s.search.previous();
    scroll_to_match(s);
    string text = "Match " + std::to_string(*s.search.position() + 1) + "/" + std::to_string(s.search.count());
    if (s.search.wrapped()) text += forward ? " (wrapped to beginning)" : " (wrapped to end)";
    set_notice(s, text);
    return {};
}

Effect reduce_normal(State& s, const Intent& in) {
    if (in.kind != IntentKind::GoFirst) s.pending_first.reset();
    SessionPtr current = s.selected_session();
    const bool on_list = s.focus == Focus::List;

    switch (in.kind) {
        case IntentKind::MoveUp:
            if (on_list) select_index(s, s.selected > 0 ? s.selected - 1 : 0);
            else scroll_thread(s, -1);
            return {};
        case IntentKind::MoveDown:
            if (on_list) select_index(s, s.selected + 1);
            else scroll_thread(s, 1);
            return {};
        case IntentKind::PageUp:
            if (on_list) select_index(s, s.selected > kPageRows ? s.selected - kPageRows : 0);
            else scroll_thread(s, -static_cast<long>(s.thread_page));
            return {};
        case IntentKind::PageDown:
            if (on_list) select_index(s, s.selected + kPageRows);
            else scroll_thread(s, static_cast<long>(s.thread_page));
            return {};
        case IntentKind::GoFirst:
            if (s.pending_first && in.at - *s.pending_first < kDoublePressWindow) {
                s.pending_first.reset();
                if (on_list) select_index(s, 0);
                else s.thread_scroll = 0;
            } else {
                s.pending_first = in.at;
            }
            return {};
        case IntentKind::GoLast:
            if (on_list) select_index(s, s.view.empty() ? 0 : s.view.size() - 1);
            else s.thread_scroll = kScrollToBottom;
            return {};

        case IntentKind::BeginFilter:
            enter(s, Mode::FilterEntry);
            return {};
        case IntentKind::BeginJump:
            enter(s, Mode::CommandEntry);
            return {};
        case IntentKind::BeginTag:
            if (!current) {
                set_notice(s, "No session selected", Severity::Warning);
                return {};
            }
            s.tag_purpose = TagPurpose::Tag;
            enter(s, Mode::TagEntry, current->tag.value_or(""));
            return {};
        case IntentKind::BeginNewSession:
            s.tag_purpose = TagPurpose::NewSession;
            enter(s, Mode::TagEntry);
            return {};

        case IntentKind::Delete:
            if (!current) {
                set_notice(s, "No session selected", Severity::Warning);
                return {};
            }
            enter(s, Mode::ConfirmDelete);
            return {};
        case IntentKind::StartSession:
            if (!current) return {};
            s.quit = true;
            return Effect{EffectKind::StartSession, current->id, ""};
        case IntentKind::Export:
            if (!current) return {};
            return Effect{EffectKind::Export, current->id, ""};
        case IntentKind::CopyThread:
            if (!current) return {};
            return Effect{EffectKind::CopyThread, current->id, ""};
        case IntentKind::CopySelection:
            return Effect{EffectKind::CopySelection, "", ""};
        case IntentKind::ToggleUserOnly:
            s.user_only = !s.user_only;
            s.thread_scroll = 0;
            set_notice(s, s.user_only ? "Filter: User messages only" : "Filter: All messages");
            return Effect{EffectKind::RefreshThread, "", ""};

        case IntentKind::NextMatch:
            return step_match(s, true);
        case IntentKind::PreviousMatch:
            return step_match(s, false);

        case IntentKind::ShrinkList:
            s.list_width = std::max(kMinListWidth, s.list_width - kListWidthStep);
            return {};
        case IntentKind::GrowList:
            s.list_width = std::min(kMaxListWidth, s.list_width + kListWidthStep);
            return {};
        case IntentKind::FocusList:
            s.focus = Focus::List;
            return {};
        case IntentKind::FocusThread:
            s.focus = Focus::Thread;
            return {};
        case IntentKind::Reload:
            return Effect{EffectKind::Reload, "", ""};
        case IntentKind::ToggleHelp:
            s.help_visible = true;
            return {};
        case IntentKind::Cancel:
            s.notice.reset();
            return {};
        case IntentKind::Quit:
            s.quit = true;
            return {};
        default:
            return {};
    }
}

} // namespace

SessionPtr State::selected_session() const {
    if (selected < view.size()) return view[selected];
    return nullptr;
}

Transition reduce(State state, const Intent& intent, const SessionList& all, bool include_content) {
    state.notice.reset();
    Effect effect;
    if (state.help_visible) {
        if (intent.kind == IntentKind::ToggleHelp || intent.kind == IntentKind::Cancel || intent.kind == IntentKind::Quit)
            state.help_visible = false;
        return {std::move(state), effect};
    }
    switch (state.mode) {
        case Mode::Normal:
            effect = reduce_normal(state, intent);
            break;
        case Mode::FilterEntry:
        case Mode::CommandEntry:
        case Mode::TagEntry:
            effect = reduce_entry(state, intent, all, include_content);
            break;
        case Mode::ConfirmDelete:
            effect = reduce_confirm(state, intent);
            break;
    }
    return {std::move(state), std::move(effect)};
}

// ---------------------------- ModalController ----------------------------
ModalController::ModalController(SessionIndex& index, clipboard::IClipboard& clip, string export_dir, bool deep_search)
    : index_(index), clip_(clip), export_dir_(std::move(export_dir)), deep_search_(deep_search) {
    state_.view = index_.sessions();
}

void ModalController::dispatch(const Intent& intent) {
    Transition t = reduce(std::move(state_), intent, index_.sessions(), deep_search_);
    state_ = std::move(t.state);
    if (t.effect.kind != EffectKind::None) apply(t.effect);
}

bool ModalController::jump_to(size_t number) {
    State candidate = state_;
    candidate.mode = Mode::CommandEntry;
    candidate.buffer = std::to_string(number);
    candidate.error.clear();
    commit_jump(candidate);
    if (candidate.mode == Mode::CommandEntry) {
        notify(candidate.error, Severity::Error);
        return false;
    }
    state_ = std::move(candidate);
    return true;
}

void ModalController::reload() {
    SessionPtr prev = state_.selected_session();
    const string prev_id = prev ? prev->id : string();
    state_.view = filters::list_filter(state_.list_query, index_.sessions(), deep_search_);
    auto it = std::find_if(state_.view.begin(), state_.view.end(),
                           [&](const SessionPtr& s) { return s->id == prev_id; });
    if (it != state_.view.end()) {
        state_.selected = static_cast<size_t>(it - state_.view.begin());
    } else {
        state_.selected = 0;
        state_.search.clear();
        state_.thread_scroll = 0;
    }
    thread_key_.clear();
    refresh_search();
}

const string& ModalController::thread_text() {
    SessionPtr session = state_.selected_session();
    if (!session) {
        thread_text_ = state_.view.empty() && index_.sessions().empty() ? "No sessions available." : "";
        thread_key_.clear();
        return thread_text_;
    }
    string key = session->id + '\x1f' + (state_.user_only ? "u" : "a") + '\x1f' + session->tag.value_or("");
    if (key != thread_key_) {
        thread_text_ = render::render_thread(*session, state_.user_only);
        thread_key_ = std::move(key);
    }
    return thread_text_;
}

void ModalController::set_thread_viewport(size_t total_lines, size_t rows) {
    state_.thread_page = std::max<size_t>(1, rows);
    const size_t max_scroll = total_lines > rows ? total_lines - rows : 0;
    state_.thread_scroll = std::min(state_.thread_scroll, max_scroll);
}

void ModalController::notify(string text, Severity severity) { state_.notice = Notice{std::move(text), severity}; }

void ModalController::refresh_search() {
    if (!state_.search.active()) return;
    const string query = state_.search.query();
    state_.search.reset(query, thread_text());
}

void ModalController::apply(const Effect& effect) {
    SessionPtr session = effect.session_id.empty() ? nullptr : index_.find(effect.session_id);
    spdlog::debug("controller: effect {} session '{}'", static_cast<int>(effect.kind), effect.session_id);

    switch (effect.kind) {
        case EffectKind::None:
            return;

        case EffectKind::ApplyTag:
            try {
                index_.tag(effect.session_id, effect.value);
                notify(effect.value.empty() ? "Tag cleared" : "Tagged: " + util::trim(effect.value));
                refresh_search();
            } catch (const NotFoundError& e) {
                notify(e.what(), Severity::Error);
            } catch (const ValidationError& e) {
                notify(string("Tag rejected: ") + e.what(), Severity::Error);
            } catch (const IoFailure& e) {
                spdlog::error("tag {}: {}", effect.session_id, e.what());
                notify(string("Failed to save tag: ") + e.what(), Severity::Error);
            }
            return;

        case EffectKind::Delete:
            try {
                const string short_id = session ? session->short_id() : effect.session_id;
                const bool tag_dropped = index_.remove(effect.session_id);
                auto& view = state_.view;
                view.erase(std::remove_if(view.begin(), view.end(),
                                          [&](const SessionPtr& s) { return s->id == effect.session_id; }),
                           view.end());
                state_.selected = view.empty() ? 0 : std::min(state_.selected, view.size() - 1);
                state_.search.clear();
                state_.thread_scroll = 0;
                if (tag_dropped) notify("Session deleted: " + short_id);
                else notify("Session deleted: " + short_id + " (tag file not updated)", Severity::Warning);
            } catch (const NotFoundError& e) {
                notify(string("Failed to delete session: ") + e.what(), Severity::Error);
            } catch (const IoFailure& e) {
                spdlog::error("delete {}: {}", effect.session_id, e.what());
                notify(string("Failed to delete session: ") + e.what(), Severity::Error);
            }
            return;

        case EffectKind::CreateSession:
            exit_ = ExitRequest{ExitRequest::Kind::Create, "", "", effect.value};
            return;

        case EffectKind::StartSession:
            if (!session) return;
            exit_ = ExitRequest{ExitRequest::Kind::Resume, session->id, launch::resolve_working_dir(session->project_path), ""};
            return;

        case EffectKind::Export:
            if (!session) return;
            try {
                notify("Exported to: " + render::export_session(*session, export_dir_));
            } catch (const IoFailure& e) {
                spdlog::error("export {}: {}", effect.session_id, e.what());
                notify(string("Error exporting session: ") + e.what(), Severity::Error);
            }
            return;

        case EffectKind::CopyThread: {
            if (!session) return;
            string error;
            if (clip_.copy(render::render_markdown(*session, render::MarkdownStyle::Grouped), error))
                notify("Thread copied to clipboard!");
            else
                notify("Failed to copy: " + error, Severity::Error);
            return;
        }

        case EffectKind::CopySelection: {
            auto selection = clip_.primary_selection();
            if (!selection) {
                notify("No text selected (install xclip for terminal selection)", Severity::Warning);
                return;
            }
            string error;
            if (clip_.copy(*selection, error))
                notify("Yanked " + std::to_string(selection->size()) + " chars");
            else
                notify("Failed to yank: " + error, Severity::Error);
            return;
        }

        case EffectKind::SearchThread:
            state_.search.reset(effect.value, thread_text());
            if (state_.search.empty()) {
                notify("No matches for '" + effect.value + "'", Severity::Warning);
                return;
            }
            if (auto line = state_.search.line()) state_.thread_scroll = *line > kContextLines ? *line - kContextLines : 0;
            notify("Match 1/" + std::to_string(state_.search.count()) + " for '" + effect.value + "'");
            return;

        case EffectKind::RefreshThread:
            refresh_search();
            return;

        case EffectKind::Reload: {
            const DiscoveryReport& report = index_.refresh();
            reload();
            string text = "Reloaded " + std::to_string(index_.sessions().size()) + " sessions";
            if (report.unreadable) text += " (" + std::to_string(report.unreadable) + " unreadable)";
            notify(text, report.unreadable ? Severity::Warning : Severity::Info);
            return;
        }
    }
}

} // namespace modal
