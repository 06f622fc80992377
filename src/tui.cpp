#include "tui.hpp"

#include <algorithm>
#include <clocale>

#include <spdlog/spdlog.h>

#include "util.hpp"

using modal::Focus;
using modal::IntentKind;
using modal::Mode;
using std::string;
using std::vector;

namespace {

// Color pairs
enum : short {
    kHeaderPair = 1,
    kHelpBarPair,
    kMatchPair,
    kCurrentMatchPair,
    kErrorPair,
    kWarningPair,
    kFlagPair,   // unreadable transcript / guessed project path
    kRolePair,
};

const vector<string> kHelpLines = {
    "Keyboard Shortcuts",
    "",
    "Session List Panel (Left)",
    "  Up / Down            Navigate sessions",
    "  PageUp / PageDown    Scroll by 10 sessions",
    "  gg                   Jump to first session",
    "  G                    Jump to last session",
    "  :number              Goto session by number",
    "  /text                Filter sessions by text",
    "  s                    Start (resume) session",
    "  t                    Tag session",
    "  d                    Delete session",
    "  e                    Export session to markdown",
    "  Ctrl+n               Create new tagged session",
    "  r                    Reload sessions from disk",
    "",
    "Thread Panel (Right)",
    "  Up / Down            Scroll thread",
    "  PageUp / PageDown    Page scroll",
    "  gg / G               Scroll to top / bottom",
    "  /text                Search text in thread",
    "  n / N                Next / previous search match",
    "  u                    Toggle user-only messages",
    "  c                    Copy thread as markdown",
    "  y                    Yank selected text",
    "",
    "General",
    "  Left / Right         Switch panel focus",
    "  Shift+Left / Right   Resize panels",
    "  Ctrl+k               Toggle this help",
    "  Escape               Cancel / close dialog",
    "  q                    Quit",
    "",
    "Press ESC or Ctrl+K to close",
};

constexpr int kKeyEscape = 27;
constexpr int kKeyCtrlK = 11;
constexpr int kKeyCtrlN = 14;

bool is_role_heading(const string& text, size_t offset, size_t length) {
    const string line = text.substr(offset, length);
    return line == "User:" || line == "Assistant:" || line == "Error:";
}

} // namespace

// ---------------------------- Input ----------------------------
std::optional<modal::Intent> SessionBrowser::intent_for_key(int ch) const {
    const modal::State& s = ctl_.state();
    auto make = [](IntentKind kind, char c = 0) { return modal::Intent{kind, c}; };

    if (s.help_visible) {
        if (ch == kKeyCtrlK) return make(IntentKind::ToggleHelp);
        if (ch == kKeyEscape) return make(IntentKind::Cancel);
        if (ch == 'q') return make(IntentKind::Quit);
        return std::nullopt;
    }

    switch (s.mode) {
        case Mode::FilterEntry:
        case Mode::CommandEntry:
        case Mode::TagEntry:
            if (ch == '\n' || ch == '\r' || ch == KEY_ENTER) return make(IntentKind::Commit);
            if (ch == kKeyEscape) return make(IntentKind::Cancel);
            if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) return make(IntentKind::Backspace);
            if (ch >= 32 && ch <= 255 && ch != 127) return make(IntentKind::InsertChar, static_cast<char>(ch));
            return std::nullopt;
        case Mode::ConfirmDelete:
            if (ch == 'y' || ch == 'Y' || ch == '\n' || ch == '\r' || ch == KEY_ENTER) return make(IntentKind::Confirm);
            if (ch == 'n' || ch == 'N' || ch == kKeyEscape || ch == 'q') return make(IntentKind::Cancel);
            return std::nullopt;
        case Mode::Normal:
            break;
    }

    switch (ch) {
        case KEY_UP: return make(IntentKind::MoveUp);
        case KEY_DOWN: return make(IntentKind::MoveDown);
        case KEY_PPAGE: return make(IntentKind::PageUp);
        case KEY_NPAGE: return make(IntentKind::PageDown);
        case KEY_HOME: return make(IntentKind::GoFirst); // a single Home acts as the first 'g'
        case 'g': return make(IntentKind::GoFirst);
        case 'G':
        case KEY_END: return make(IntentKind::GoLast);
        case KEY_LEFT: return make(IntentKind::FocusList);
        case KEY_RIGHT: return make(IntentKind::FocusThread);
        case KEY_SLEFT: return make(IntentKind::ShrinkList);
        case KEY_SRIGHT: return make(IntentKind::GrowList);
        case '/': return make(IntentKind::BeginFilter);
        case ':': return make(IntentKind::BeginJump);
        case 't': return make(IntentKind::BeginTag);
        case kKeyCtrlN: return make(IntentKind::BeginNewSession);
        case 's': return make(IntentKind::StartSession);
        case '\n':
        case '\r':
        case KEY_ENTER: return make(IntentKind::FocusThread);
        case 'd': return make(IntentKind::Delete);
        case 'e': return make(IntentKind::Export);
        case 'c': return make(IntentKind::CopyThread);
        case 'y': return make(IntentKind::CopySelection);
        case 'u': return make(IntentKind::ToggleUserOnly);
        case 'r': return make(IntentKind::Reload);
        case 'n': return make(IntentKind::NextMatch);
        case 'N': return make(IntentKind::PreviousMatch);
        case kKeyCtrlK: return make(IntentKind::ToggleHelp);
        case kKeyEscape: return make(IntentKind::Cancel);
        case 'q': return make(IntentKind::Quit);
        default: return std::nullopt;
    }
}

// ---------------------------- Curses helpers ----------------------------
void SessionBrowser::addstr_clip(WINDOW* win, int y, int x, const string& text, int attr, int max_x) {
    int max_y, win_x;
    getmaxyx(win, max_y, win_x);
    if (max_x < 0 || max_x > win_x) max_x = win_x;
    if (y < 0 || y >= max_y || x >= max_x) return;
    int n = std::max(0, max_x - x - (max_x == win_x ? 1 : 0));
    if (n <= 0) return;
    string clipped = util::utf8_truncate(text, static_cast<size_t>(n));
    if (attr) wattron(win, attr);
    mvwaddnstr(win, y, x, clipped.c_str(), (int)clipped.size());
    if (attr) wattroff(win, attr);
}

vector<SessionBrowser::Segment> SessionBrowser::wrap_text(const string& text, int width) {
    vector<Segment> segs;
    width = std::max(1, width);
    size_t start = 0, line = 0;
    int cols = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\n') {
            segs.push_back({start, i - start, line});
            ++line;
            start = i + 1;
            cols = 0;
            continue;
        }
        if ((c & 0xC0) == 0x80) continue;
        if (cols == width) {
            segs.push_back({start, i - start, line});
            start = i;
            cols = 0;
        }
        ++cols;
    }
    if (start < text.size()) segs.push_back({start, text.size() - start, line});
    return segs;
}

void SessionBrowser::curses_init() {
    std::setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    has_colors_ = has_colors();
    if (has_colors_) {
        start_color();
        use_default_colors();
        init_pair(kHeaderPair, COLOR_CYAN, -1);
        init_pair(kHelpBarPair, COLOR_BLACK, COLOR_WHITE);
        init_pair(kMatchPair, COLOR_BLACK, COLOR_YELLOW);
        init_pair(kCurrentMatchPair, COLOR_BLACK, COLOR_GREEN);
        init_pair(kErrorPair, COLOR_RED, -1);
        init_pair(kWarningPair, COLOR_YELLOW, -1);
        init_pair(kFlagPair, COLOR_MAGENTA, -1);
        init_pair(kRolePair, COLOR_BLUE, -1);
    }
}

// ---------------------------- Drawing ----------------------------
void SessionBrowser::draw_header(WINDOW* win, int list_w) {
    const modal::State& s = ctl_.state();
    string title = " Sessions " + std::to_string(s.view.size());
    if (!s.list_query.empty()) title += " / filter: " + s.list_query;
    int attr = A_BOLD | (has_colors_ ? COLOR_PAIR(kHeaderPair) : 0);
    if (s.focus == Focus::List) attr |= A_UNDERLINE;
    addstr_clip(win, 0, 0, title, attr, list_w);

    string thread_title = " Thread";
    if (s.user_only) thread_title += " (user only)";
    if (s.search.active())
        thread_title += "  search: " + s.search.query() + " [" +
                        (s.search.empty() ? string("0") : std::to_string(*s.search.position() + 1)) + "/" +
                        std::to_string(s.search.count()) + "]";
    int tattr = A_BOLD | (has_colors_ ? COLOR_PAIR(kHeaderPair) : 0);
    if (s.focus == Focus::Thread) tattr |= A_UNDERLINE;
    addstr_clip(win, 0, list_w + 1, thread_title, tattr);
}

void SessionBrowser::draw_rows(WINDOW* win, int list_w, int height) {
    const modal::State& s = ctl_.state();
    const int selected = static_cast<int>(s.selected);
    if (selected < list_offset_) list_offset_ = selected;
    else if (selected >= list_offset_ + height) list_offset_ = selected - height + 1;
    list_offset_ = std::max(0, std::min(list_offset_, std::max(0, (int)s.view.size() - height)));

    if (s.view.empty()) {
        addstr_clip(win, 1, 1, s.list_query.empty() ? "No sessions found." : "No matching sessions.", 0, list_w);
        return;
    }

    for (int i = list_offset_; i < std::min((int)s.view.size(), list_offset_ + height); ++i) {
        const Session& session = *s.view[static_cast<size_t>(i)];
        string line = util::rjust(std::to_string(i + 1), 4) + " " + session.date_str() + " " +
                      (session.read_failed ? "!" : " ") + session.display_name() + "  " + session.project_name();
        if (!session.tag && !session.preview.empty()) line += "  " + session.preview;

        int y = i - list_offset_ + 1;
        int attr = 0;
        if (i == selected) attr = s.focus == Focus::List ? A_REVERSE : A_BOLD;
        if (session.read_failed && has_colors_) attr |= COLOR_PAIR(kFlagPair);
        addstr_clip(win, y, 0, util::ljust(line, list_w), attr, list_w);
    }
}

void SessionBrowser::draw_segment(WINDOW* win, int y, int x, int width, const string& text, const Segment& seg) {
    const modal::State& s = ctl_.state();
    const auto& offsets = s.search.offsets();
    const size_t qlen = s.search.query().size();
    const auto current = s.search.current();

    int base = 0;
    if (is_role_heading(text, seg.offset, seg.length)) base = A_BOLD | (has_colors_ ? COLOR_PAIR(kRolePair) : 0);

    // 0 plain, 1 match, 2 current match
    auto kind_at = [&](size_t b) -> int {
        if (qlen == 0 || offsets.empty()) return 0;
        auto it = std::upper_bound(offsets.begin(), offsets.end(), b);
        if (it == offsets.begin()) return 0;
        size_t start = *(it - 1);
        if (b >= start + qlen) return 0;
        if (current && b >= *current && b < *current + qlen) return 2;
        return 1;
    };
    auto attr_for = [&](int kind) -> int {
        if (kind == 2) return has_colors_ ? COLOR_PAIR(kCurrentMatchPair) | A_BOLD : A_REVERSE | A_BOLD;
        if (kind == 1) return has_colors_ ? COLOR_PAIR(kMatchPair) : A_UNDERLINE;
        return base;
    };

    wmove(win, y, x);
    const size_t end = seg.offset + seg.length;
    size_t run = seg.offset;
    while (run < end) {
        int kind = kind_at(run);
        size_t stop = run + 1;
        while (stop < end && kind_at(stop) == kind) ++stop;

        string piece = text.substr(run, stop - run);
        for (auto& c : piece)
            if (static_cast<unsigned char>(c) < 32) c = ' ';
        int room = x + width - getcurx(win);
        if (room <= 0) break;
        int attr = attr_for(kind);
        if (attr) wattron(win, attr);
        waddnstr(win, piece.c_str(), (int)std::min(piece.size(), (size_t)room * 4));
        if (attr) wattroff(win, attr);
        run = stop;
    }
}

void SessionBrowser::draw_thread(WINDOW* win, int x, int width, int height) {
    const string& text = ctl_.thread_text();
    vector<Segment> segs = wrap_text(text, width);
    const size_t total_lines = segs.empty() ? 0 : segs.back().line + 1;
    ctl_.set_thread_viewport(total_lines, static_cast<size_t>(height));

    const size_t scroll = ctl_.state().thread_scroll;
    auto first = std::find_if(segs.begin(), segs.end(), [&](const Segment& s) { return s.line >= scroll; });
    int y = 1;
    for (auto it = first; it != segs.end() && y <= height; ++it, ++y) draw_segment(win, y, x, width, text, *it);
}

void SessionBrowser::draw_helpbar(WINDOW* win) {
    int max_y, max_x;
    getmaxyx(win, max_y, max_x);
    const modal::State& s = ctl_.state();
    const int y = max_y - 1;
    addstr_clip(win, y, 0, string((size_t)std::max(0, max_x - 1), ' '), has_colors_ ? COLOR_PAIR(kHelpBarPair) : A_REVERSE);

    if (s.mode == Mode::FilterEntry || s.mode == Mode::CommandEntry || s.mode == Mode::TagEntry) {
        string prompt;
        if (s.mode == Mode::FilterEntry) prompt = s.focus == Focus::Thread ? "Search thread: /" : "Filter: /";
        else if (s.mode == Mode::CommandEntry) prompt = ":";
        else prompt = s.tag_purpose == modal::TagPurpose::NewSession ? "New session tag: " : "Tag: ";
        string line = prompt + s.buffer;
        addstr_clip(win, y, 0, line, A_REVERSE);
        int cursor_x = getcurx(win);
        if (!s.error.empty())
            addstr_clip(win, y, cursor_x + 2, s.error, has_colors_ ? COLOR_PAIR(kErrorPair) | A_BOLD : A_BOLD);
        wmove(win, y, std::min(cursor_x, max_x - 2));
        curs_set(1);
        return;
    }
    curs_set(0);

    if (s.notice) {
        int attr = A_BOLD;
        if (has_colors_ && s.notice->severity == modal::Severity::Error) attr |= COLOR_PAIR(kErrorPair);
        else if (has_colors_ && s.notice->severity == modal::Severity::Warning) attr |= COLOR_PAIR(kWarningPair);
        addstr_clip(win, y, 0, " " + s.notice->text, attr);
        return;
    }
    string help = " ^N New  s Start  t Tag  d Delete  e Export  / Search  : Goto  ^K Help  q Quit";
    string right = "row " + std::to_string(s.view.empty() ? 0 : s.selected + 1) + "/" + std::to_string(s.view.size());
    string bar = help + "  " + right;
    addstr_clip(win, y, 0, bar, has_colors_ ? COLOR_PAIR(kHelpBarPair) : A_REVERSE);
}

void SessionBrowser::draw_delete_popup(WINDOW* win) {
    SessionPtr session = ctl_.state().selected_session();
    if (!session) return;
    vector<string> lines = {
        "Delete session?",
        "",
        session->display_name(),
        session->project_path,
        "",
        "[y] Delete   [n] Cancel",
    };
    int h, w;
    getmaxyx(win, h, w);
    int width = std::min(60, w - 4);
    int height = std::min((int)lines.size() + 2, h - 2);
    if (width < 10 || height < 3) return;
    WINDOW* popup = newwin(height, width, (h - height) / 2, (w - width) / 2);
    box(popup, 0, 0);
    for (int i = 0; i < (int)lines.size() && i + 1 < height - 1; ++i)
        addstr_clip(popup, i + 1, 2, lines[i], i == 0 ? A_BOLD : 0, width - 1);
    wnoutrefresh(popup);
    delwin(popup);
}

void SessionBrowser::draw_help_popup(WINDOW* win) {
    int h, w;
    getmaxyx(win, h, w);
    int width = std::min(64, w - 4);
    int height = std::min((int)kHelpLines.size() + 2, h - 2);
    if (width < 10 || height < 3) return;
    WINDOW* popup = newwin(height, width, (h - height) / 2, (w - width) / 2);
    box(popup, 0, 0);
    for (int i = 0; i < (int)kHelpLines.size() && i + 1 < height - 1; ++i) {
        const string& line = kHelpLines[(size_t)i];
        bool heading = !line.empty() && line[0] != ' ';
        addstr_clip(popup, i + 1, 2, line, heading ? A_BOLD : 0, width - 1);
    }
    wnoutrefresh(popup);
    delwin(popup);
}

void SessionBrowser::draw() {
    erase();
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);
    const modal::State& s = ctl_.state();

    const int list_w = std::max(10, max_x * s.list_width / 100);
    const int body_h = std::max(1, max_y - 2);
    draw_header(stdscr, list_w);
    draw_rows(stdscr, list_w, body_h);
    mvwvline(stdscr, 1, list_w, ACS_VLINE, body_h);
    draw_thread(stdscr, list_w + 2, std::max(1, max_x - list_w - 3), body_h);

    // prompt drawn last so the cursor stays on it
    draw_helpbar(stdscr);
    wnoutrefresh(stdscr);
    if (s.help_visible) draw_help_popup(stdscr);
    else if (s.mode == Mode::ConfirmDelete) draw_delete_popup(stdscr);
    doupdate();
}

void SessionBrowser::run() {
    curses_init();
    while (!ctl_.state().quit) {
        draw();
        int ch = getch();
        if (ch == ERR || ch == KEY_RESIZE) continue;
        if (auto intent = intent_for_key(ch)) ctl_.dispatch(*intent);
    }
    endwin();
    spdlog::debug("browser closed");
}
