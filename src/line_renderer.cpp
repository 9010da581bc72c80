#include "line_renderer.hpp"
#include <utility>
#include <spdlog/spdlog.h>
#include "tab_layout.hpp"

std::optional<Annotation> LineRenderer::render(std::string_view line, int row, int column) {
  ColumnHit hit = move_to_column(line, column, ctx_.tab_width);
  Annotation a;
  a.row = row;
  a.offset = hit.byte;
  a.color = ctx_.color;
  int bar = 0;
  if (hit.at_eol) {
    a.mode = AnnotationMode::AppendAfterEnd;
    a.cells = column - hit.column + 1;
    bar = a.cells - 1;
  } else if (line[static_cast<size_t>(hit.byte)] == '\t') {
    a.mode = AnnotationMode::ReplaceChar;
    a.cells = char_display_width('\t', hit.column, ctx_.tab_width);
    bar = column - hit.column;
  } else {
    a.mode = AnnotationMode::ReplaceChar;
    a.cells = 1;
  }
  if (row == ctx_.cursor.row && a.offset == ctx_.cursor.col) return std::nullopt;
  a.glyph = glyph_for(a.cells, bar);
  return a;
}

std::shared_ptr<const Glyph> LineRenderer::glyph_for(int cells, int bar) {
  if (ctx_.rich) {
    int w = cells * ctx_.cell.width;
    int h = ctx_.cell.height + ctx_.height_adjustment;
    int x = bar * ctx_.cell.width + ctx_.left_margin;
    if (auto g = cache_.get(GlyphKind::Bitmap, w, h, x)) return g;
    spdlog::debug("[LineRenderer] bitmap {}x{} bar={} unavailable, using text glyph", w, h, x);
  }
  return cache_.get(GlyphKind::Text, cells, ctx_.cell.height, bar);
}
