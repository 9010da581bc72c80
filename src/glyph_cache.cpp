#include "glyph_cache.hpp"
#include <algorithm>
#include <functional>
#include <utility>
#include <spdlog/spdlog.h>
#include "config.hpp"

std::string BitmapGlyph::to_xpm(const std::string& color) const {
  std::string out = "/* XPM */\nstatic char * guide_xpm[] = {\n";
  out += "\"" + std::to_string(width) + " " + std::to_string(height) + " 2 1\",\n";
  out += "\"  c None\",\n";
  out += "\". c " + color + "\",\n";
  for (int y = 0; y < height; ++y) {
    out += '"';
    for (int x = 0; x < width; ++x) out += at(x, y) ? '.' : ' ';
    out += (y + 1 < height) ? "\",\n" : "\"\n";
  }
  out += "};\n";
  return out;
}

size_t GlyphCache::KeyHash::operator()(const GlyphKey& k) const {
  size_t h = std::hash<int>()(static_cast<int>(k.kind));
  auto mix = [&h](int v) { h ^= std::hash<int>()(v) + 0x9e3779b9 + (h << 6) + (h >> 2); };
  mix(k.width);
  mix(k.height);
  mix(k.bar);
  return h;
}

GlyphCache::GlyphCache(GlyphStyle style) : style_(std::move(style)) {}

void GlyphCache::clear() { entries_.clear(); }

void GlyphCache::set_style(GlyphStyle style) {
  style_ = std::move(style);
  clear();
}

std::shared_ptr<const Glyph> GlyphCache::get(GlyphKind kind, int width, int height, int bar) {
  GlyphKey key{kind, width, height, bar};
  if (auto it = entries_.find(key); it != entries_.end()) return it->second;
  std::shared_ptr<const Glyph> g = kind == GlyphKind::Text ? make_text(width, bar) : make_bitmap(width, height, bar);
  spdlog::trace("[GlyphCache] miss kind={} w={} h={} bar={}", kind == GlyphKind::Text ? "text" : "bitmap", width, height, bar);
  entries_.emplace(key, g);
  return g;
}

std::shared_ptr<const Glyph> GlyphCache::make_text(int width, int bar) const {
  TextGlyph g;
  g.cells = std::max(1, width);
  g.bar = std::clamp(bar, 0, g.cells - 1);
  g.bar_text = style_.bar_text.empty() ? std::string("|") : style_.bar_text;
  for (int i = 0; i < g.cells; ++i) {
    if (i == g.bar) g.text += g.bar_text;
    else g.text += ' ';
  }
  return std::make_shared<const Glyph>(std::move(g));
}

std::shared_ptr<const Glyph> GlyphCache::make_bitmap(int width, int height, int bar) const {
  if (width <= 0 || height <= 0 || width > IG_MAX_GLYPH_PIXELS || height > IG_MAX_GLYPH_PIXELS) return nullptr;
  if (bar < 0 || bar >= width) return nullptr;
  BitmapGlyph g;
  g.width = width;
  g.height = height;
  g.bar = bar;
  g.pixels.assign(static_cast<size_t>(width) * static_cast<size_t>(height), 0);
  int period = style_.dash_length ? *style_.dash_length + 1 : 0;
  for (int y = 0; y < height; ++y) {
    if (period > 0 && (y + 1) % period == 0) continue;
    g.pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(bar)] = 1;
  }
  return std::make_shared<const Glyph>(std::move(g));
}
