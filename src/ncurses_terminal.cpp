#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

short curses_color_from_name(const std::string& name) {
  if (name == "black") return COLOR_BLACK;
  if (name == "red") return COLOR_RED;
  if (name == "green") return COLOR_GREEN;
  if (name == "yellow") return COLOR_YELLOW;
  if (name == "blue") return COLOR_BLUE;
  if (name == "magenta") return COLOR_MAGENTA;
  if (name == "cyan") return COLOR_CYAN;
  if (name == "white" || name == "gray" || name == "grey") return COLOR_WHITE;
  if (name.size() == 7 && name[0] == '#') {
    char* end = nullptr;
    unsigned long rgb = std::strtoul(name.c_str() + 1, &end, 16);
    if (end == nullptr || *end != '\0') return -1;
    short c = 0;
    if (((rgb >> 16) & 0xFF) >= 0x80) c |= COLOR_RED;
    if (((rgb >> 8) & 0xFF) >= 0x80) c |= COLOR_GREEN;
    if ((rgb & 0xFF) >= 0x80) c |= COLOR_BLUE;
    // dark grays would map to black and vanish on a black background
    return c == COLOR_BLACK ? COLOR_WHITE : c;
  }
  return -1;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    use_default_colors();
    colors_ = true;
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { werase(stdscr); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvwaddnstr(stdscr, row, col, text.c_str(), static_cast<int>(text.size()));
}

short NcursesTerminal::pair_for(const std::string& color) {
  if (!colors_) return 0;
  if (auto it = pairs_.find(color); it != pairs_.end()) return it->second;
  short fg = curses_color_from_name(color);
  if (fg < 0 || next_pair_ >= COLOR_PAIRS) {
    spdlog::debug("[NcursesTerminal] no color pair for '{}'", color);
    pairs_.emplace(color, 0);
    return 0;
  }
  short id = next_pair_++;
  init_pair(id, fg, -1);
  pairs_.emplace(color, id);
  return id;
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, const std::string& color) {
  short id = pair_for(color);
  if (id > 0) wattron(stdscr, COLOR_PAIR(id));
  mvwaddnstr(stdscr, row, col, text.c_str(), static_cast<int>(text.size()));
  if (id > 0) wattroff(stdscr, COLOR_PAIR(id));
}

void NcursesTerminal::draw_image(int row, int col, const BitmapGlyph& image, const std::string& color) {
  // no pixels on a character terminal: show the bar cell as a plain line character
  if (image.width <= 0) return;
  draw_colored(row, col, "|", color);
}

void NcursesTerminal::move_cursor(int row, int col) { wmove(stdscr, row, col); }

void NcursesTerminal::refresh() { wrefresh(stdscr); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  wmove(stdscr, row, col);
  wclrtoeol(stdscr);
}

int NcursesTerminal::read_key(int timeout_ms) {
  wtimeout(stdscr, timeout_ms);
  return wgetch(stdscr);
}
