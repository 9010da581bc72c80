#pragma once
#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "i_text_buffer_core.hpp"

/*
  vector backend: one std::string per line.
  line_view() hands out views into lines_, so any mutation invalidates them.
*/
class VectorTextBufferCore : public TextBufferCoreCRTP<VectorTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  void do_init_from_lines(std::vector<std::string>&& lines) { lines_ = std::move(lines); }
  int do_line_count() const { return static_cast<int>(lines_.size()); }
  std::string_view do_line_view(int r) const {
    if (r < 0 || r >= static_cast<int>(lines_.size())) return std::string_view();
    return lines_[static_cast<size_t>(r)];
  }

  void do_insert_line(size_t row, std::string_view s) {
    size_t pos = std::min(row, lines_.size());
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::string(s));
  }
  void do_erase_line(size_t row) {
    if (row >= lines_.size()) return;
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row));
  }
  void do_erase_lines(size_t start_row, size_t end_row) {
    if (end_row < start_row) end_row = start_row;
    start_row = std::min(start_row, lines_.size());
    end_row = std::min(end_row, lines_.size());
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start_row),
                 lines_.begin() + static_cast<std::ptrdiff_t>(end_row));
  }
  void do_replace_line(size_t row, std::string_view s) {
    if (row >= lines_.size()) return;
    lines_[row].assign(s.data(), s.size());
  }

private:
  std::vector<std::string> lines_;
};

static_assert(TextBufferCoreCRTPConcept<VectorTextBufferCore>, "Vector backend must satisfy CRTP concept");
