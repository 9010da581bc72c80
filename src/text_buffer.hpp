#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer; the guide core only reads it, the editor edits it.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Invariant: always holds at least one (possibly empty) line.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "vector_text_buffer_core.hpp"

class TextBuffer {
public:
  using CoreType = VectorTextBufferCore;
  static_assert(TextBufferCoreCRTPConcept<CoreType>, "Selected backend must satisfy CRTP concept");

  TextBuffer();

  std::string_view backend_name() const;
  int line_count() const;
  std::string line(int r) const;
  std::string_view line_view(int r) const;
  bool valid_row(int r) const { return r >= 0 && r < line_count(); }

  void init_from_lines(std::vector<std::string> lines);
  void insert_line(int row, std::string_view s);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row);
  void replace_line(int row, std::string_view s);

  /*splits on '\n'; a trailing '\n' does not open an extra line*/
  static TextBuffer from_text(std::string_view text);
  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  void ensure_not_empty();
  CoreType core_;
};
