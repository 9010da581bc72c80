#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include <variant>
#include "tab_layout.hpp"

static bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

/* the part of an already tab-expanded line covering columns [start, start + count) */
static std::string slice_columns(const std::string& expanded, int start, int count) {
  std::string out;
  int col = 0;
  for (char c : expanded) {
    if (is_continuation(c)) {
      if (col - 1 >= start && col - 1 < start + count) out += c;
      continue;
    }
    if (col >= start + count) break;
    if (col >= start) out += c;
    ++col;
  }
  return out;
}

static int cell_count(const std::string& s) {
  return static_cast<int>(std::count_if(s.begin(), s.end(), [](char c) { return !is_continuation(c); }));
}

int Renderer::gutter_width(const TextBuffer& buf, bool show_line_numbers) {
  if (!show_line_numbers) return 0;
  int digits = 1;
  int total = std::max(1, buf.line_count());
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1; // one space after numbers
}

void Renderer::scroll_to_cursor(const TextBuffer& buf, Cursor cur, int tab_width, TermSize size,
                                bool show_line_numbers, Viewport& vp) {
  int max_text_rows = std::max(1, size.rows - 1);
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;
  vp.top_line = std::max(0, vp.top_line);
  int text_cols = std::max(0, size.cols - gutter_width(buf, show_line_numbers));
  if (text_cols <= 0) { vp.left_col = 0; return; }
  int vcol = visual_column(buf.line_view(cur.row), cur.col, tab_width);
  if (vcol < vp.left_col) vp.left_col = vcol;
  else if (vcol >= vp.left_col + text_cols) vp.left_col = vcol - text_cols + 1;
  vp.left_col = std::max(0, vp.left_col);
}

void Renderer::draw_annotation(ITerminal& term, int screen_row, int gutter, int left_col, int text_cols,
                               std::string_view line, int tab_width, const Annotation& a) {
  if (!a.glyph) return;
  int base = a.mode == AnnotationMode::AppendAfterEnd ? line_width(line, tab_width)
                                                       : visual_column(line, a.offset, tab_width);
  auto visible = [&](int col) { return col >= left_col && col < left_col + text_cols; };
  if (const auto* text = std::get_if<TextGlyph>(a.glyph.get())) {
    for (int i = 0; i < text->cells; ++i) {
      int col = base + i;
      if (!visible(col)) continue;
      term.draw_colored(screen_row, gutter + col - left_col, i == text->bar ? text->bar_text : std::string(" "), a.color);
    }
    return;
  }
  const auto& image = std::get<BitmapGlyph>(*a.glyph);
  int cell_w = std::max(1, image.width / std::max(1, a.cells));
  int col = base + std::min(a.cells - 1, image.bar / cell_w);
  if (visible(col)) term.draw_image(screen_row, gutter + col - left_col, image, a.color);
}

void Renderer::render(ITerminal& term, const RenderInfo& info) {
  const TextBuffer& buf = *info.buf;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = rows - 1;
  int gutter = gutter_width(buf, info.show_line_numbers);
  int ln_width = std::max(0, gutter - 1);
  int text_cols = std::max(0, cols - gutter);
  const Viewport& vp = info.vp;

  for (int i = 0; i < max_text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= buf.line_count()) break;
    std::string_view s = buf.line_view(line_idx);
    if (info.show_line_numbers) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, ln_width - static_cast<int>(num.size()))), ' ');
      term.draw_text(i, 0, pad + num + " ");
    }
    std::string vis = slice_columns(expand_tabs(s, info.tab_width), vp.left_col, text_cols);
    term.draw_text(i, gutter, vis);
    term.clear_to_eol(i, gutter + cell_count(vis));
    if (!info.annotations) continue;
    for (const auto& a : *info.annotations) {
      if (a.row == line_idx) draw_annotation(term, i, gutter, vp.left_col, text_cols, s, info.tab_width, a);
    }
  }

  std::string status;
  if (info.mode == Mode::Command) {
    status = ":" + info.cmdline;
  } else {
    std::ostringstream oss;
    oss << (info.mode == Mode::Insert ? "INSERT" : "NORMAL") << "  "
        << (info.file_path ? info.file_path->string() : "[no file]")
        << (info.modified ? " [+]" : "")
        << "  row:" << (info.cur.row + 1)
        << " col:" << (visual_column(buf.line_view(info.cur.row), info.cur.col, info.tab_width) + 1);
    if (!info.message.empty()) oss << "  | " << info.message;
    status = oss.str();
  }
  term.draw_text(rows - 1, 0, status);
  term.clear_to_eol(rows - 1, std::min(cols, static_cast<int>(status.size())));

  int screen_row = info.cur.row - vp.top_line;
  if (info.mode != Mode::Command && screen_row >= 0 && screen_row < max_text_rows) {
    int vcol = visual_column(buf.line_view(info.cur.row), info.cur.col, info.tab_width);
    int screen_col = gutter + std::max(0, vcol - vp.left_col);
    term.move_cursor(screen_row, std::min(screen_col, std::max(0, cols - 1)));
  } else {
    term.move_cursor(rows - 1, std::min(cols - 1, static_cast<int>(status.size())));
  }
  term.refresh();
}
