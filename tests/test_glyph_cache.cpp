#include "glyph_cache.hpp"
#include <cassert>
#include <string>
#include <variant>

int main() {
  GlyphCache cache;
  auto a = cache.get(GlyphKind::Text, 3, 1, 2);
  auto b = cache.get(GlyphKind::Text, 3, 1, 2);
  assert(a && a == b);
  assert(cache.size() == 1);
  const auto& t = std::get<TextGlyph>(*a);
  assert(t.text == "  |");
  assert(t.cells == 3 && t.bar == 2);

  // any differing field is a separate entry
  assert(cache.get(GlyphKind::Text, 4, 1, 2) != a);
  assert(cache.get(GlyphKind::Text, 3, 2, 2) != a);
  assert(cache.get(GlyphKind::Text, 3, 1, 1) != a);
  assert(cache.get(GlyphKind::Bitmap, 3, 1, 2) != a);
  assert(cache.size() == 5);

  // out of range bar is clamped for text
  const auto& clamped = std::get<TextGlyph>(*cache.get(GlyphKind::Text, 2, 1, 5));
  assert(clamped.text == " |");

  auto solid = cache.get(GlyphKind::Bitmap, 5, 6, 2);
  const auto& bm = std::get<BitmapGlyph>(*solid);
  assert(bm.width == 5 && bm.height == 6 && bm.bar == 2);
  for (int y = 0; y < 6; ++y) {
    for (int x = 0; x < 5; ++x) assert(bm.at(x, y) == (x == 2));
  }

  // unusable geometry gives no glyph, and that answer is cached too
  size_t before = cache.size();
  assert(!cache.get(GlyphKind::Bitmap, 0, 5, 0));
  assert(!cache.get(GlyphKind::Bitmap, 4, 4, 4));
  assert(!cache.get(GlyphKind::Bitmap, 4, 4, -1));
  assert(!cache.get(GlyphKind::Bitmap, 4, 0, 1));
  assert(!cache.get(GlyphKind::Bitmap, 4, 0, 1));
  assert(cache.size() == before + 4);

  GlyphStyle dashed;
  dashed.dash_length = 2;
  dashed.bar_text = "\xE2\x94\x82";
  cache.set_style(dashed);
  assert(cache.size() == 0);
  const auto& d = std::get<BitmapGlyph>(*cache.get(GlyphKind::Bitmap, 1, 6, 0));
  assert(d.at(0, 0) && d.at(0, 1) && !d.at(0, 2));
  assert(d.at(0, 3) && d.at(0, 4) && !d.at(0, 5));
  const auto& wide = std::get<TextGlyph>(*cache.get(GlyphKind::Text, 2, 1, 0));
  assert(wide.text == "\xE2\x94\x82 ");

  GlyphCache plain;
  std::string xpm = std::get<BitmapGlyph>(*plain.get(GlyphKind::Bitmap, 3, 2, 1)).to_xpm("#535353");
  assert(xpm.find("\"3 2 2 1\"") != std::string::npos);
  assert(xpm.find(". c #535353") != std::string::npos);
  assert(xpm.find("\" . \",\n\" . \"\n};") != std::string::npos);

  plain.clear();
  assert(plain.size() == 0);
  return 0;
}
