#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols, bool graphical)
    : rows_(rows), cols_(cols), graphical_(graphical) {
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(rows_), std::vector<Cell>(static_cast<size_t>(cols_)));
  images_.clear();
}

void HeadlessTerminal::put(int row, int col, const std::string& text, const std::string& color) {
  if (row < 0 || row >= rows_) return;
  auto& line = grid_[static_cast<size_t>(row)];
  int c = col - 1;
  for (char ch : text) {
    bool continuation = (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    if (continuation) {
      if (c >= 0 && c < cols_) line[static_cast<size_t>(c)].ch += ch;
      continue;
    }
    ++c;
    if (c < 0 || c >= cols_) continue;
    line[static_cast<size_t>(c)] = Cell{std::string(1, ch), color};
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, std::string()); }

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, const std::string& color) {
  put(row, col, text, color);
}

void HeadlessTerminal::draw_image(int row, int col, const BitmapGlyph& image, const std::string& color) {
  images_.push_back(Image{row, col, image, color});
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  auto& line = grid_[static_cast<size_t>(row)];
  for (int c = std::max(0, col); c < cols_; ++c) line[static_cast<size_t>(c)] = Cell{};
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (const auto& c : grid_[static_cast<size_t>(row)]) out += c.ch;
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

const HeadlessTerminal::Cell& HeadlessTerminal::cell(int row, int col) const {
  return grid_.at(static_cast<size_t>(row)).at(static_cast<size_t>(col));
}
