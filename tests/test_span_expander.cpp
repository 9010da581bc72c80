#include "span_expander.hpp"
#include <cassert>

int main() {
  TextBuffer py = TextBuffer::from_text("if x:\n    a\n\n    b\nc\n");
  VisibleRange all{0, 100};
  assert(row_in_block(py, 1, 0, 4));
  assert(row_in_block(py, 2, 0, 4));
  assert(!row_in_block(py, 4, 0, 4));
  assert(!row_in_block(py, 1, 4, 4));

  // blank row inside the block is kept
  assert(expand_span(py, 0, 0, all, 4) == 3);

  // trailing blanks are trimmed back to the last code row
  TextBuffer trailing = TextBuffer::from_text("if x:\n    a\n\n  \nb\n");
  assert(expand_span(trailing, 0, 0, all, 4) == 1);
  TextBuffer at_end = TextBuffer::from_text("if x:\n    a\n\n");
  assert(expand_span(at_end, 0, 0, all, 4) == 1);

  // the trim stops at a cursor sitting on a trailing blank row
  assert(expand_span(trailing, 0, 0, all, 4, 2) == 2);
  assert(expand_span(trailing, 0, 0, all, 4, 3) == 3);
  assert(expand_span(trailing, 0, 0, all, 4, 1) == 1);
  assert(expand_span(trailing, 0, 0, all, 4, 4) == 1);  // cursor outside the block
  TextBuffer nested = TextBuffer::from_text("def f():\n  if x:\n    c\n\n  d\n");
  assert(expand_span(nested, 2, 1, all, 4) == 2);
  assert(expand_span(nested, 2, 1, all, 4, 3) == 3);

  // whitespace-only rows shorter than the body still count as inside
  TextBuffer shortline = TextBuffer::from_text("if x:\n    a\n  \n    b\n");
  assert(expand_span(shortline, 0, 0, all, 4) == 3);

  // viewport edge: keep the guide to the last visible row, no trim
  assert(expand_span(py, 0, 0, VisibleRange{0, 2}, 4) == 2);
  assert(expand_span(trailing, 0, 0, VisibleRange{0, 2}, 4) == 2);

  // an opener above the viewport still ends where the block ends
  assert(expand_span(py, 0, 0, VisibleRange{2, 10}, 4) == 3);

  // nothing after the opener
  assert(expand_span(py, 0, 4, all, 4) == 4);
  TextBuffer flat = TextBuffer::from_text("a\nb\n");
  assert(expand_span(flat, 0, 0, all, 4) == 0);

  // tab-indented body against a column reached with spaces
  TextBuffer tabs = TextBuffer::from_text("    if y:\n\t\tz\n\t\tw\n    end\n");
  assert(expand_span(tabs, 4, 0, all, 4) == 2);
  return 0;
}
