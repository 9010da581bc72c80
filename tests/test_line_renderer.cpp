#include "line_renderer.hpp"
#include <cassert>
#include <string>
#include <variant>

static std::string text_of(const Annotation& a) { return std::get<TextGlyph>(*a.glyph).text; }

int main() {
  GlyphCache cache;
  GuideRenderContext ctx;
  ctx.tab_width = 4;
  ctx.color = "blue";
  ctx.cursor = Cursor{99, 0};
  LineRenderer r(cache, ctx);

  // short line: padding appended after the end, bar in the last cell
  auto a = r.render("", 3, 4);
  assert(a && a->mode == AnnotationMode::AppendAfterEnd);
  assert(a->row == 3 && a->offset == 0 && a->cells == 5);
  assert(text_of(*a) == "    |");
  assert(a->color == "blue");
  a = r.render("  ", 3, 4);
  assert(a && a->mode == AnnotationMode::AppendAfterEnd && a->offset == 2 && text_of(*a) == "  |");

  // column inside a tab: glyph as wide as the tab, bar offset within it
  a = r.render("  \tx", 0, 3);
  assert(a && a->mode == AnnotationMode::ReplaceChar);
  assert(a->offset == 2 && a->cells == 2 && text_of(*a) == " |");

  // column exactly on a tab
  a = r.render("\t\tx", 0, 4);
  assert(a && a->mode == AnnotationMode::ReplaceChar);
  assert(a->offset == 1 && a->cells == 4 && text_of(*a) == "|   ");

  // plain space
  a = r.render("        x", 0, 4);
  assert(a && a->mode == AnnotationMode::ReplaceChar && a->offset == 4 && a->cells == 1);
  assert(text_of(*a) == "|");

  // identical geometry shares one glyph
  auto again = r.render("        y", 1, 4);
  assert(again && again->glyph == a->glyph);

  // never under the cursor
  ctx.cursor = Cursor{1, 4};
  LineRenderer at_cursor(cache, ctx);
  assert(!at_cursor.render("        x", 1, 4));
  assert(at_cursor.render("        x", 2, 4));
  assert(at_cursor.render("        x", 1, 0));

  // rich glyphs: pixel geometry from the cell size
  ctx.cursor = Cursor{99, 0};
  ctx.rich = true;
  ctx.cell = CellSize{8, 16};
  LineRenderer rich(cache, ctx);
  a = rich.render("\tx", 0, 2);
  assert(a && a->cells == 4);
  const auto& bm = std::get<BitmapGlyph>(*a->glyph);
  assert(bm.width == 32 && bm.height == 16 && bm.bar == 16);

  // bar pushed outside the image: silent fallback to text
  ctx.left_margin = 8;
  LineRenderer off_edge(cache, ctx);
  a = off_edge.render("        x", 0, 4);
  assert(a && std::holds_alternative<TextGlyph>(*a->glyph));
  ctx.left_margin = 0;
  ctx.height_adjustment = -16;
  LineRenderer flat(cache, ctx);
  a = flat.render("        x", 0, 4);
  assert(a && std::holds_alternative<TextGlyph>(*a->glyph));
  return 0;
}
