#include "tab_layout.hpp"
#include <cassert>
#include <string>

int main() {
  assert(next_tab_stop(0, 4) == 4);
  assert(next_tab_stop(3, 4) == 4);
  assert(next_tab_stop(4, 4) == 8);
  assert(next_tab_stop(5, 0) == 6);  // width clamps to 1

  assert(visual_column("\tx", 1, 4) == 4);
  assert(visual_column("  \tx", 3, 4) == 4);
  assert(visual_column("  \tx", 3, 8) == 8);
  assert(visual_column("ab", 10, 4) == 2);
  // "é" is two bytes but one column
  assert(line_width("\xC3\xA9x", 4) == 2);

  assert(indentation_bytes("  \tfoo") == 3);
  assert(indentation_width("  \tfoo", 4) == 4);
  assert(indentation_width("foo", 4) == 0);
  assert(is_blank(""));
  assert(is_blank(" \t "));
  assert(!is_blank("  x"));

  // column inside a tab lands on the tab itself
  ColumnHit h = move_to_column("\tx", 2, 4);
  assert(h.byte == 0 && h.column == 0 && !h.at_eol);
  h = move_to_column("\tx", 4, 4);
  assert(h.byte == 1 && h.column == 4 && !h.at_eol);
  h = move_to_column("ab", 5, 4);
  assert(h.at_eol && h.byte == 2 && h.column == 2);
  h = move_to_column("", 0, 4);
  assert(h.at_eol && h.byte == 0 && h.column == 0);
  h = move_to_column("\xC3\xA9x", 1, 4);
  assert(h.byte == 2 && h.column == 1);

  assert(expand_tabs("a\tb", 4) == "a   b");
  assert(expand_tabs("\t\t", 2) == "    ");
  return 0;
}
