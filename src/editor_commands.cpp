#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

void Editor::register_guide_option(const std::string& name) {
  registry.register_command("set " + name, [this, name](const std::vector<std::string>& args) {
    std::string value;
    for (const auto& a : args) {
      if (!value.empty()) value += ' ';
      value += a;
    }
    GuideOptions opts = guides.options();
    if (!apply_guide_option(opts, name, value, message)) { command_failed = true; return; }
    guides.set_options(std::move(opts));
    spdlog::debug("[Editor] {}", message);
  });
}

void Editor::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>& args) {
    std::optional<std::filesystem::path> target = doc.file_path;
    if (!args.empty()) target = std::filesystem::path(args[0]);
    if (!target) { message = "don't have path, use :w <path>"; command_failed = true; return; }
    if (!doc.buf.write_file(*target, message)) { command_failed = true; return; }
    doc.modified = false;
    if (!doc.file_path) doc.file_path = target;
  });
  registry.register_command("q", [this](const std::vector<std::string>&) {
    if (doc.modified) { message = "have unsaved changes, use :q! or :w"; command_failed = true; return; }
    should_quit = true;
  });
  registry.register_command("q!", [this](const std::vector<std::string>&) { should_quit = true; });
  registry.register_command("wq", [this](const std::vector<std::string>& args) {
    registry.execute("w", args);
    if (!command_failed) should_quit = true;
  });
  registry.register_command("set number", [this](const std::vector<std::string>& args) {
    if (!parse_on_off(args, show_line_numbers, show_line_numbers)) {
      message = "set number: use :set number on|off"; command_failed = true; return;
    }
    message = show_line_numbers ? "number on" : "number off";
  });
  registry.register_command("set autoindent", [this](const std::vector<std::string>& args) {
    if (!parse_on_off(args, auto_indent, auto_indent)) {
      message = "set autoindent: use :set autoindent on|off"; command_failed = true; return;
    }
    message = auto_indent ? "autoindent on" : "autoindent off";
  });
  registry.register_command("set tabwidth", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message = "set tabwidth: use :set tabwidth <width>"; command_failed = true; return; }
    const std::string& s = args[0];
    bool digits = !s.empty() && s.size() < 4 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits || std::stoi(s) < 1) { message = "set tabwidth: width must be a number >= 1"; command_failed = true; return; }
    set_tab_width(std::stoi(s));
  });
  for (const auto& name : guide_option_names()) register_guide_option(name);

  registry.register_command("guides", [this](const std::vector<std::string>& args) {
    std::string sub = args.empty() ? "redraw" : args[0];
    if (sub == "redraw") {
      guides.redraw();
      message = "guides redrawn";
    } else if (sub == "clearcache") {
      guides.clear_cache();
      message = "guide glyph cache cleared";
    } else if (sub == "info") {
      guides.redraw();
      if (guides.spans().empty()) { message = "no guide"; return; }
      const GuideSpan& s = guides.spans().front();
      message = "guide rows " + std::to_string(s.start_row + 1) + "-" + std::to_string(s.end_row + 1) +
                " column " + std::to_string(s.column) + " level " + std::to_string(s.level) +
                " glyphs " + std::to_string(guides.cache().size());
    } else {
      message = "guides: use :guides redraw|clearcache|info";
      command_failed = true;
    }
  });
}
