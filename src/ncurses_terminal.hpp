#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by the Terminal RAII wrapper;
 *       color names get a color pair on first use.
 */
#include <string>
#include <unordered_map>
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  bool graphical() const override { return false; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, const std::string& color) override;
  void draw_image(int row, int col, const BitmapGlyph& image, const std::string& color) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  /* blocks up to timeout_ms for a key (-1 waits forever); ERR on timeout */
  int read_key(int timeout_ms);

private:
  short pair_for(const std::string& color);
  bool colors_ = false;
  short next_pair_ = 1;
  std::unordered_map<std::string, short> pairs_;
};

/* basic curses color for a name or #rrggbb; -1 when unknown */
short curses_color_from_name(const std::string& name);
