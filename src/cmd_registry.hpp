#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands (":w", ":set guidedash=3", ...).
 * Design: map name → handler (args vector); Editor parses and routes.
 * Note: ":set <name>" commands are registered under the composite name "set <name>".
 */
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedCommand {
  std::string name;                // "w", "set guidedash", ...; empty for a blank line
  std::vector<std::string> args;
  std::string option;              // option name for ":set", empty otherwise
};

/* ":set guidedash=3 x" → {"set guidedash", {"3", "x"}, "guidedash"}; a bare ":set" keeps name "set" */
inline ParsedCommand parse_command_line(const std::string& line) {
  ParsedCommand out;
  std::istringstream iss(line);
  iss >> out.name;
  std::vector<std::string> words;
  std::string w;
  while (iss >> w) words.push_back(w);
  if (out.name != "set" || words.empty()) {
    out.args = std::move(words);
    return out;
  }
  std::string value;
  size_t eq = words[0].find('=');
  out.option = words[0].substr(0, eq);
  if (eq != std::string::npos) value = words[0].substr(eq + 1);
  out.name = "set " + out.option;
  if (!value.empty()) out.args.push_back(value);
  out.args.insert(out.args.end(), words.begin() + 1, words.end());
  return out;
}

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  /* false when no handler is registered under name */
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
