#include "guide_options.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "config.hpp"

int resolve_metric(const CellMetric& m, int derived) {
  if (const auto* f = std::get_if<FixedMetric>(&m)) return f->pixels;
  return derived;
}

const std::vector<std::string>& guide_option_names() {
  static const std::vector<std::string> names = {
    "guides", "guidecolor", "guidecharwidth", "guidecharheight", "guidechar",
    "richglyphs", "guideleftmargin", "guideheightadjust", "guidedash",
    "guidethreshold", "guidedelay", "guideexclude", "guiderecursive"
  };
  return names;
}

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
  if (i == s.size()) return false;
  if (!std::all_of(s.begin() + static_cast<std::ptrdiff_t>(i), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  try { out = std::stoi(s); } catch (const std::out_of_range&) { return false; }
  return true;
}

static bool parse_bool(const std::string& s, bool& out) {
  std::string v = to_lower(s);
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static bool parse_metric(const std::string& s, CellMetric& out) {
  if (to_lower(s) == "auto") { out = DerivedMetric{}; return true; }
  int px = 0;
  if (!parse_int(s, px) || px < 1) return false;
  out = FixedMetric{px};
  return true;
}

static bool parse_seconds(const std::string& s, std::optional<std::chrono::milliseconds>& out) {
  std::string v = to_lower(s);
  if (v == "off" || v == "nil") { out.reset(); return true; }
  double secs = 0;
  std::istringstream iss(v);
  if (!(iss >> secs) || !iss.eof() || !std::isfinite(secs) || secs < 0) return false;
  if (secs > IG_MAX_REDRAW_DELAY_SECONDS) return false;
  out = std::chrono::milliseconds(static_cast<long long>(std::llround(secs * 1000.0)));
  return true;
}

/* exactly one UTF-8 code point, not whitespace or a control byte */
static bool is_single_char(const std::string& s) {
  if (s.empty() || static_cast<unsigned char>(s[0]) <= 0x20 || s[0] == 0x7F) return false;
  size_t starts = std::count_if(s.begin(), s.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; });
  return starts == 1 && (static_cast<unsigned char>(s[0]) & 0xC0) != 0x80;
}

static std::set<std::string> split_contexts(const std::string& s) {
  std::set<std::string> out;
  std::string item;
  std::istringstream iss(s);
  while (std::getline(iss, item, ',')) {
    item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c){ return std::isspace(c) != 0; }), item.end());
    if (!item.empty()) out.insert(to_lower(item));
  }
  return out;
}

static bool reject(const std::string& name, const std::string& usage, std::string& msg) {
  msg = "set " + name + ": " + usage;
  spdlog::warn("[GuideOptions] rejected value for {}", name);
  return false;
}

bool apply_guide_option(GuideOptions& opts, const std::string& name, const std::string& value, std::string& msg) {
  if (name == "guides") {
    bool v = !opts.enabled;
    if (!value.empty() && !parse_bool(value, v)) return reject(name, "use on|off", msg);
    opts.enabled = v;
  } else if (name == "guidecolor") {
    if (value.empty()) return reject(name, "use a color name or #rrggbb", msg);
    opts.color = to_lower(value);
  } else if (name == "guidecharwidth") {
    if (!parse_metric(value, opts.char_width)) return reject(name, "use auto or a pixel count >= 1", msg);
  } else if (name == "guidecharheight") {
    if (!parse_metric(value, opts.char_height)) return reject(name, "use auto or a pixel count >= 1", msg);
  } else if (name == "guidechar") {
    if (!is_single_char(value)) return reject(name, "use a single character", msg);
    opts.line_char = value;
  } else if (name == "richglyphs") {
    bool v = !opts.rich_glyphs;
    if (!value.empty() && !parse_bool(value, v)) return reject(name, "use on|off", msg);
    opts.rich_glyphs = v;
  } else if (name == "guideleftmargin") {
    if (!parse_int(value, opts.left_margin)) return reject(name, "use a pixel offset", msg);
  } else if (name == "guideheightadjust") {
    if (!parse_int(value, opts.height_adjustment)) return reject(name, "use a pixel delta", msg);
  } else if (name == "guidedash") {
    int d = 0;
    if (to_lower(value) == "off") opts.dash_length.reset();
    else if (parse_int(value, d) && d >= 1) opts.dash_length = d;
    else return reject(name, "use off or a dash length >= 1", msg);
  } else if (name == "guidethreshold") {
    if (!parse_int(value, opts.threshold)) return reject(name, "use a column number", msg);
  } else if (name == "guidedelay") {
    if (!parse_seconds(value, opts.redraw_delay)) return reject(name, "use off or seconds", msg);
  } else if (name == "guideexclude") {
    opts.excluded_contexts = split_contexts(value);
  } else if (name == "guiderecursive") {
    bool v = !opts.recursive;
    if (!value.empty() && !parse_bool(value, v)) return reject(name, "use on|off", msg);
    opts.recursive = v;
  } else {
    msg = "unknown option: " + name;
    return false;
  }
  msg = name + "=" + describe_guide_option(opts, name);
  return true;
}

static std::string describe_metric(const CellMetric& m) {
  if (const auto* f = std::get_if<FixedMetric>(&m)) return std::to_string(f->pixels);
  return "auto";
}

std::string describe_guide_option(const GuideOptions& opts, const std::string& name) {
  if (name == "guides") return opts.enabled ? "on" : "off";
  if (name == "guidecolor") return opts.color;
  if (name == "guidecharwidth") return describe_metric(opts.char_width);
  if (name == "guidecharheight") return describe_metric(opts.char_height);
  if (name == "guidechar") return opts.line_char;
  if (name == "richglyphs") return opts.rich_glyphs ? "on" : "off";
  if (name == "guideleftmargin") return std::to_string(opts.left_margin);
  if (name == "guideheightadjust") return std::to_string(opts.height_adjustment);
  if (name == "guidedash") return opts.dash_length ? std::to_string(*opts.dash_length) : "off";
  if (name == "guidethreshold") return std::to_string(opts.threshold);
  if (name == "guidedelay") {
    if (!opts.redraw_delay) return "off";
    std::ostringstream oss;
    oss << static_cast<double>(opts.redraw_delay->count()) / 1000.0;
    return oss.str();
  }
  if (name == "guideexclude") {
    std::string out;
    for (const auto& c : opts.excluded_contexts) {
      if (!out.empty()) out += ',';
      out += c;
    }
    return out;
  }
  if (name == "guiderecursive") return opts.recursive ? "on" : "off";
  return std::string();
}
