#pragma once
/*
 * LineRenderer
 *
 * Purpose: turn (row, guide column) into one Annotation for the host to composite.
 * Cases: past end of line → padding appended after the line; inside or on a tab →
 *        the tab's display replaced by a glyph as wide as the tab; otherwise the
 *        single character at the column is replaced.
 * Constraint: never produces an annotation at the cursor position.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "glyph_cache.hpp"
#include "types.hpp"

enum class AnnotationMode { AppendAfterEnd, ReplaceChar };

struct Annotation {
  int row = 0;
  int offset = 0;  // byte offset in the line
  AnnotationMode mode = AnnotationMode::ReplaceChar;
  int cells = 1;   // display width the glyph occupies
  std::shared_ptr<const Glyph> glyph;
  std::string color;
};

/* geometry resolved once per render pass */
struct GuideRenderContext {
  int tab_width = 4;
  bool rich = false;     // bitmap glyphs
  CellSize cell{};
  int left_margin = 0;
  int height_adjustment = 0;
  std::string color;
  Cursor cursor{};
};

class LineRenderer {
public:
  LineRenderer(GlyphCache& cache, GuideRenderContext ctx) : cache_(cache), ctx_(std::move(ctx)) {}

  std::optional<Annotation> render(std::string_view line, int row, int column);
  const GuideRenderContext& context() const { return ctx_; }

private:
  std::shared_ptr<const Glyph> glyph_for(int cells, int bar);

  GlyphCache& cache_;
  GuideRenderContext ctx_;
};
