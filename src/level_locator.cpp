#include "level_locator.hpp"
#include <algorithm>
#include <deque>
#include <utility>
#include "tab_layout.hpp"

IndentPrefixSet::IndentPrefixSet(int max_width, int tab_width) {
  if (max_width < 0) return;
  edges_.resize(static_cast<size_t>(max_width) + 1);
  for (int col = 0; col <= max_width; ++col) {
    Edge& e = edges_[static_cast<size_t>(col)];
    if (col + 1 <= max_width) e.on_space = col + 1;
    int stop = next_tab_stop(col, tab_width);
    if (stop <= max_width) e.on_tab = stop;
  }
}

bool IndentPrefixSet::matches(std::string_view line) const {
  if (edges_.empty()) return false;
  int col = 0;
  for (char c : line) {
    if (c == ' ') col = edges_[static_cast<size_t>(col)].on_space;
    else if (c == '\t') col = edges_[static_cast<size_t>(col)].on_tab;
    else return true;
    if (col < 0) return false;
  }
  return false;
}

std::vector<std::string> IndentPrefixSet::enumerate(size_t limit) const {
  std::vector<std::string> out;
  if (edges_.empty()) return out;
  std::deque<std::pair<int, std::string>> pending;
  pending.emplace_back(0, std::string());
  while (!pending.empty() && out.size() < limit) {
    auto [col, prefix] = std::move(pending.front());
    pending.pop_front();
    const Edge& e = edges_[static_cast<size_t>(col)];
    if (e.on_space >= 0) pending.emplace_back(e.on_space, prefix + ' ');
    if (e.on_tab >= 0) pending.emplace_back(e.on_tab, prefix + '\t');
    out.push_back(std::move(prefix));
  }
  return out;
}

static int neighbour_level(const TextBuffer& buf, int row, int step, int tab_width) {
  int r = row + step;
  while (buf.valid_row(r) && is_blank(buf.line_view(r))) r += step;
  if (!buf.valid_row(r)) return 0;
  return indentation_width(buf.line_view(r), tab_width);
}

int row_level(const TextBuffer& buf, int row, int tab_width) {
  if (!buf.valid_row(row)) return 0;
  std::string_view line = buf.line_view(row);
  if (!is_blank(line)) return indentation_width(line, tab_width);
  return std::max(neighbour_level(buf, row, 1, tab_width), neighbour_level(buf, row, -1, tab_width));
}

BlockStart locate_level(const TextBuffer& buf, int row, int tab_width) {
  BlockStart out;
  if (buf.line_count() == 0) return out;
  row = std::clamp(row, 0, buf.line_count() - 1);
  out.start_row = row;
  out.level = row_level(buf, row, tab_width);
  if (out.level == 0) return out;

  IndentPrefixSet openers(out.level - 1, tab_width);
  for (int r = row - 1; r >= 0; --r) {
    std::string_view line = buf.line_view(r);
    if (!openers.matches(line)) continue;
    out.column = indentation_width(line, tab_width);
    out.start_row = r;
    out.has_opener = true;
    return out;
  }
  out.column = 0;
  out.start_row = 0;
  return out;
}
