#pragma once
/*
 * Renderer
 *
 * Purpose: draw buffer text (tabs expanded), guide annotations, status and command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor for every frame.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"
#include "line_renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

struct RenderInfo {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  Viewport vp{};
  int tab_width = 4;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  bool show_line_numbers = false;
  Mode mode = Mode::Normal;
  std::string message;
  std::string cmdline;
  const std::vector<Annotation>* annotations = nullptr;
};

class Renderer {
public:
  static int gutter_width(const TextBuffer& buf, bool show_line_numbers);
  /* adjusts vp so the cursor is on screen; the last terminal row is the status line */
  static void scroll_to_cursor(const TextBuffer& buf, Cursor cur, int tab_width, TermSize size,
                               bool show_line_numbers, Viewport& vp);
  void render(ITerminal& term, const RenderInfo& info);

private:
  void draw_annotation(ITerminal& term, int screen_row, int gutter, int left_col, int text_cols,
                       std::string_view line, int tab_width, const Annotation& a);
};
