#pragma once

#include <curses.h>
#include <optional>
#include <string>
#include <vector>

#include "controller.hpp"

// ncurses front end: draws modal::State and turns keys into intents
class SessionBrowser {
  public:
    explicit SessionBrowser(modal::ModalController& controller) : ctl_(controller) {}

    // Blocks until the controller sets quit
    void run();

  private:
    // One display row of the thread panel: a slice of the rendered text
    struct Segment {
        size_t offset;
        size_t length;
        size_t line; // logical line it belongs to
    };

    modal::ModalController& ctl_;
    int list_offset_ = 0;
    bool has_colors_ = false;

    void curses_init();
    std::optional<modal::Intent> intent_for_key(int ch) const;

    static void addstr_clip(WINDOW* win, int y, int x, const std::string& text, int attr = 0, int max_x = -1);
    static std::vector<Segment> wrap_text(const std::string& text, int width);

    void draw();
    void draw_header(WINDOW* win, int list_w);
    void draw_rows(WINDOW* win, int list_w, int height);
    void draw_thread(WINDOW* win, int x, int width, int height);
    void draw_segment(WINDOW* win, int y, int x, int width, const std::string& text, const Segment& seg);
    void draw_helpbar(WINDOW* win);
    void draw_delete_popup(WINDOW* win);
    void draw_help_popup(WINDOW* win);
};
