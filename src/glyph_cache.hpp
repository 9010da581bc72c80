#pragma once
/*
 * GlyphCache
 *
 * Purpose: memoize guide glyphs keyed by (kind, width, height, bar offset).
 * Strategy: Text glyphs are cells of spaces with the bar character at the bar
 *           cell; Bitmap glyphs are width x height pixel masks with a one pixel
 *           vertical line (optionally dashed) at the bar pixel.
 * Lifetime: entries live until clear() or a style change.
 */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class GlyphKind { Text, Bitmap };

struct GlyphKey {
  GlyphKind kind = GlyphKind::Text;
  int width = 0;
  int height = 0;
  int bar = 0;
  bool operator==(const GlyphKey&) const = default;
};

struct TextGlyph {
  std::string text;      // full rendering, UTF-8
  std::string bar_text;  // the bar character alone
  int cells = 0;
  int bar = 0;
};

struct BitmapGlyph {
  int width = 0;
  int height = 0;
  int bar = 0;
  std::vector<std::uint8_t> pixels;  // row-major, 1 = foreground

  bool at(int x, int y) const { return pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)] != 0; }
  std::string to_xpm(const std::string& color) const;
};

using Glyph = std::variant<TextGlyph, BitmapGlyph>;

struct GlyphStyle {
  std::string bar_text = "|";
  std::string color = "blue";
  std::optional<int> dash_length;  // nullopt: solid line
};

class GlyphCache {
public:
  explicit GlyphCache(GlyphStyle style = {});

  /* nullptr only for a Bitmap request whose geometry cannot be drawn */
  std::shared_ptr<const Glyph> get(GlyphKind kind, int width, int height, int bar);
  void clear();
  void set_style(GlyphStyle style);
  const GlyphStyle& style() const { return style_; }
  size_t size() const { return entries_.size(); }

private:
  struct KeyHash {
    size_t operator()(const GlyphKey& k) const;
  };
  std::shared_ptr<const Glyph> make_text(int width, int bar) const;
  std::shared_ptr<const Glyph> make_bitmap(int width, int height, int bar) const;

  GlyphStyle style_;
  std::unordered_map<GlyphKey, std::shared_ptr<const Glyph>, KeyHash> entries_;
};
