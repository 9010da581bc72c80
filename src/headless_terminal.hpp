#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that records into a character grid instead of a screen,
 *          used by tests to check what the renderer composited.
 * Note: one grid cell per byte written, except UTF-8 continuation bytes which
 *       join the previous cell.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    std::string ch = " ";
    std::string color;  // empty: default color
  };
  struct Image {
    int row = 0;
    int col = 0;
    BitmapGlyph bitmap;
    std::string color;
  };

  HeadlessTerminal(int rows, int cols, bool graphical = false);

  TermSize get_size() const override { return {rows_, cols_}; }
  bool graphical() const override { return graphical_; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, const std::string& color) override;
  void draw_image(int row, int col, const BitmapGlyph& image, const std::string& color) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refreshes_; }
  void clear_to_eol(int row, int col) override;

  std::string row_text(int row) const;
  const Cell& cell(int row, int col) const;
  const std::vector<Image>& images() const { return images_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, const std::string& color);

  int rows_;
  int cols_;
  bool graphical_;
  std::vector<std::vector<Cell>> grid_;
  std::vector<Image> images_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
};
