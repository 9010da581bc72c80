#include "guide_options.hpp"
#include <cassert>
#include <string>
#include <variant>

int main() {
  GuideOptions o;
  std::string msg;
  assert(o.enabled && !o.rich_glyphs && !o.recursive);
  assert(o.threshold == -1 && !o.redraw_delay && !o.dash_length);
  assert(resolve_metric(o.char_width, 9) == 9);

  assert(apply_guide_option(o, "guidecharwidth", "7", msg));
  assert(resolve_metric(o.char_width, 9) == 7);
  assert(msg == "guidecharwidth=7");
  assert(apply_guide_option(o, "guidecharwidth", "AUTO", msg));
  assert(std::holds_alternative<DerivedMetric>(o.char_width));
  assert(!apply_guide_option(o, "guidecharheight", "0", msg));
  assert(msg.rfind("set guidecharheight:", 0) == 0);

  // bool options toggle without a value
  assert(apply_guide_option(o, "guides", "", msg));
  assert(!o.enabled && msg == "guides=off");
  assert(apply_guide_option(o, "guides", "on", msg) && o.enabled);
  assert(!apply_guide_option(o, "richglyphs", "maybe", msg));
  assert(!o.rich_glyphs);

  assert(apply_guide_option(o, "guidedash", "3", msg) && o.dash_length == 3);
  assert(apply_guide_option(o, "guidedash", "off", msg) && !o.dash_length);
  assert(!apply_guide_option(o, "guidedash", "0", msg));

  assert(apply_guide_option(o, "guidedelay", "0.25", msg));
  assert(o.redraw_delay && o.redraw_delay->count() == 250);
  assert(msg == "guidedelay=0.25");
  assert(apply_guide_option(o, "guidedelay", "nil", msg) && !o.redraw_delay);
  assert(!apply_guide_option(o, "guidedelay", "-1", msg));
  assert(!apply_guide_option(o, "guidedelay", "soon", msg));
  assert(!apply_guide_option(o, "guidedelay", "1e300", msg) && !o.redraw_delay);
  assert(!apply_guide_option(o, "guidedelay", "3601", msg));
  assert(apply_guide_option(o, "guidedelay", "3600", msg) && o.redraw_delay->count() == 3600000);
  assert(apply_guide_option(o, "guidedelay", "off", msg) && !o.redraw_delay);

  // the bar glyph is one cell wide, so only one character fits
  assert(!apply_guide_option(o, "guidechar", "ab", msg) && o.line_char == "|");
  assert(msg == "set guidechar: use a single character");
  assert(!apply_guide_option(o, "guidechar", " ", msg));
  assert(!apply_guide_option(o, "guidechar", "\xE2\x94\x82x", msg));
  assert(!apply_guide_option(o, "guidechar", "\x94", msg));
  assert(apply_guide_option(o, "guidechar", "\xE2\x94\x82", msg) && o.line_char == "\xE2\x94\x82");
  assert(apply_guide_option(o, "guidechar", ":", msg) && o.line_char == ":");

  assert(apply_guide_option(o, "guidethreshold", "2", msg) && o.threshold == 2);
  assert(!apply_guide_option(o, "guidethreshold", "two", msg) && o.threshold == 2);
  assert(apply_guide_option(o, "guideleftmargin", "-3", msg) && o.left_margin == -3);

  assert(apply_guide_option(o, "guideexclude", "Py, md,,txt ", msg));
  assert(o.excluded_contexts.size() == 3 && o.excluded_contexts.count("py") == 1);
  assert(describe_guide_option(o, "guideexclude") == "md,py,txt");

  assert(apply_guide_option(o, "guidecolor", "#535353", msg) && o.color == "#535353");
  assert(!apply_guide_option(o, "guidecolor", "", msg));
  assert(!apply_guide_option(o, "nosuchoption", "1", msg));
  assert(msg == "unknown option: nosuchoption");

  GuideOptions defaults;
  assert(guide_option_names().size() == 13);
  assert(describe_guide_option(defaults, "guidecharheight") == "auto");
  assert(describe_guide_option(defaults, "guidethreshold") == "-1");
  assert(describe_guide_option(defaults, "guidedelay") == "off");
  assert(describe_guide_option(defaults, "guideexclude").empty());
  return 0;
}
