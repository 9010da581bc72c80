#include "tab_layout.hpp"
#include <algorithm>

static inline bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

int next_tab_stop(int col, int tab_width) {
  int tw = std::max(1, tab_width);
  return (col / tw + 1) * tw;
}

int char_display_width(char c, int col, int tab_width) {
  if (c == '\t') return next_tab_stop(col, tab_width) - col;
  if (is_continuation_byte(c)) return 0;
  return 1;
}

int visual_column(std::string_view line, int byte, int tab_width) {
  int end = std::clamp(byte, 0, static_cast<int>(line.size()));
  int col = 0;
  for (int i = 0; i < end; ++i) col += char_display_width(line[static_cast<size_t>(i)], col, tab_width);
  return col;
}

int line_width(std::string_view line, int tab_width) {
  return visual_column(line, static_cast<int>(line.size()), tab_width);
}

int indentation_bytes(std::string_view line) {
  size_t i = 0;
  while (i < line.size() && is_indent_char(line[i])) i++;
  return static_cast<int>(i);
}

int indentation_width(std::string_view line, int tab_width) {
  return visual_column(line, indentation_bytes(line), tab_width);
}

bool is_blank(std::string_view line) {
  return indentation_bytes(line) == static_cast<int>(line.size());
}

ColumnHit move_to_column(std::string_view line, int target, int tab_width) {
  ColumnHit hit;
  int col = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    int w = char_display_width(line[i], col, tab_width);
    if (w > 0 && col + w > target) {
      hit.byte = static_cast<int>(i);
      hit.column = col;
      return hit;
    }
    col += w;
  }
  hit.byte = static_cast<int>(line.size());
  hit.column = col;
  hit.at_eol = true;
  return hit;
}

std::string expand_tabs(std::string_view line, int tab_width) {
  std::string out;
  out.reserve(line.size());
  int col = 0;
  for (char c : line) {
    int w = char_display_width(c, col, tab_width);
    if (c == '\t') out.append(static_cast<size_t>(w), ' ');
    else out.push_back(c);
    col += w;
  }
  return out;
}
