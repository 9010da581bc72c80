#pragma once
/*
 * TabLayout
 *
 * Purpose: map between byte offsets and visual columns under tab expansion.
 * Note: UTF-8 continuation bytes occupy no column; every other non-tab byte
 *       occupies one. Only ' ' and '\t' count as indentation.
 */
#include <string>
#include <string_view>

inline bool is_indent_char(char c) { return c == ' ' || c == '\t'; }

int next_tab_stop(int col, int tab_width);
int char_display_width(char c, int col, int tab_width);

/* visual column at which byte `byte` starts (line width when byte >= size) */
int visual_column(std::string_view line, int byte, int tab_width);
int line_width(std::string_view line, int tab_width);

/* byte offset of the first non-indentation character, or size() when blank */
int indentation_bytes(std::string_view line);
int indentation_width(std::string_view line, int tab_width);
bool is_blank(std::string_view line);

struct ColumnHit {
  int byte = 0;        // char covering the target, or line size past the end
  int column = 0;      // visual column where that char starts (line width at eol)
  bool at_eol = false;
};

/* like moving point to a column: lands on the char whose cells cover `target` */
ColumnHit move_to_column(std::string_view line, int target, int tab_width);

std::string expand_tabs(std::string_view line, int tab_width);
