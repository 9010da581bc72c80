#pragma once
/*
 * GuideOptions
 *
 * Purpose: every user-facing knob of the indent guides, with defaults.
 * Usage: apply_guide_option(opts, "guidedash", "3", msg) from `:set` or the rc file;
 *        returns false and fills msg when the value is rejected.
 */
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

/* cell size given in pixels by the user */
struct FixedMetric { int pixels = 0; };
/* cell size taken from what the host actually renders */
struct DerivedMetric {};
using CellMetric = std::variant<FixedMetric, DerivedMetric>;

struct GuideOptions {
  bool enabled = true;
  std::string color = "blue";
  CellMetric char_width = DerivedMetric{};
  CellMetric char_height = DerivedMetric{};
  std::string line_char = "|";
  bool rich_glyphs = false;
  int left_margin = 0;        // pixels, bitmap glyphs only
  int height_adjustment = 0;  // pixels, bitmap glyphs only
  std::optional<int> dash_length;
  int threshold = -1;         // draw only when the guide column exceeds this
  std::optional<std::chrono::milliseconds> redraw_delay;
  std::set<std::string> excluded_contexts;
  bool recursive = false;
};

int resolve_metric(const CellMetric& m, int derived);

/* names accepted by apply_guide_option, in registration order */
const std::vector<std::string>& guide_option_names();
bool apply_guide_option(GuideOptions& opts, const std::string& name, const std::string& value, std::string& msg);
std::string describe_guide_option(const GuideOptions& opts, const std::string& name);
