#include "span_expander.hpp"
#include <algorithm>
#include "tab_layout.hpp"

bool row_in_block(const TextBuffer& buf, int row, int column, int tab_width) {
  std::string_view line = buf.line_view(row);
  return is_blank(line) || indentation_width(line, tab_width) > column;
}

int expand_span(const TextBuffer& buf, int column, int start_row, VisibleRange visible, int tab_width,
                int cursor_row) {
  int n = buf.line_count();
  int row = std::max(start_row + 1, visible.first_row);
  while (row < n && row <= visible.last_row && row_in_block(buf, row, column, tab_width)) ++row;

  // viewport edge with the block still going: keep the guide down to the last visible row
  if (row < n && row > visible.last_row) return std::max(start_row, visible.last_row);

  int end = row - 1;
  int keep = (cursor_row > start_row && cursor_row <= end) ? cursor_row : start_row;
  while (end > keep && is_blank(buf.line_view(end))) --end;
  return std::max(start_row, end);
}
