#pragma once
/*
 * LevelLocator
 *
 * Purpose: find the indentation level of the cursor's block and the line that opens it.
 * Note: tab/space agnostic; a line "opens" the block when its leading whitespace
 *       is any encoding (tabs at tab_width, spaces) narrower than the level.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "text_buffer.hpp"

struct BlockStart {
  int column = 0;     // guide column: indentation of the opening line
  int start_row = 0;  // row of the opening line
  int level = 0;      // indentation level the search started from
  bool has_opener = false;  // false: no shallower line above, start_row 0 belongs to the block
};

/*
 * Every whitespace prefix whose expanded width is at most max_width, kept as a
 * transition table over visual columns instead of a list of strings.
 */
class IndentPrefixSet {
public:
  IndentPrefixSet(int max_width, int tab_width);

  /* true for lines of the form ^<prefix><non-whitespace> */
  bool matches(std::string_view line) const;
  /* the literal prefixes, shortest first, at most `limit` of them */
  std::vector<std::string> enumerate(size_t limit) const;
  int max_width() const { return static_cast<int>(edges_.size()) - 1; }

private:
  struct Edge {
    int on_space = -1;  // next column, -1 leaves the set
    int on_tab = -1;
  };
  std::vector<Edge> edges_;
};

/* level of `row`; for blank rows the deeper of the nearest non-blank neighbours */
int row_level(const TextBuffer& buf, int row, int tab_width);

BlockStart locate_level(const TextBuffer& buf, int row, int tab_width);
