#pragma once
/*
 * SpanExpander
 *
 * Purpose: find the last row of the block opened at start_row for a guide column.
 * Constraint: the forward scan never leaves the visible range, so cost follows
 *             the screen size rather than the file size.
 */
#include "text_buffer.hpp"
#include "types.hpp"

struct GuideSpan {
  int start_row = 0;  // opening line; not annotated itself
  int end_row = 0;    // last annotated row, >= start_row
  int column = 0;     // guide column
  int level = 0;      // block level the span was located from
  bool operator==(const GuideSpan&) const = default;
};

/* blank, or indented deeper than column */
bool row_in_block(const TextBuffer& buf, int row, int column, int tab_width);

/* trailing blank rows are dropped, except down to cursor_row when the scan reached it */
int expand_span(const TextBuffer& buf, int column, int start_row, VisibleRange visible, int tab_width,
                int cursor_row = -1);
