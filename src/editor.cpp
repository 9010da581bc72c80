#include "editor.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"
#include "tab_layout.hpp"

static constexpr int CTRL_u = 'U'-64;
static constexpr int CTRL_d = 'D'-64;
static constexpr int ESC = 27;

static bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

Editor::Editor(const std::optional<std::filesystem::path>& file) : guides(*this, timers) {
  if (file) open_file(*file);
  register_commands();
  load_rc();
}

void Editor::open_file(const std::filesystem::path& path) {
  bool ok = true;
  doc.buf = TextBuffer::from_file(path, message, ok);
  doc.file_path = path;
  doc.modified = false;
  cur = Cursor{};
  vp = Viewport{};
  if (ok) spdlog::info("[Editor] {}", message);
  else spdlog::warn("[Editor] {}", message);
}

VisibleRange Editor::visible_range() const {
  TermSize sz = term.get_size();
  int text_rows = std::max(1, sz.rows - 1);
  VisibleRange r;
  r.first_row = vp.top_line;
  r.last_row = std::min(doc.buf.line_count() - 1, vp.top_line + text_rows - 1);
  return r;
}

std::optional<CellSize> Editor::row_cell(int row) const {
  VisibleRange r = visible_range();
  if (row < r.first_row || row > r.last_row) return std::nullopt;
  return CellSize{1, 1};
}

std::string Editor::context_name() const {
  if (!doc.file_path) return "text";
  std::string ext = doc.file_path->extension().string();
  if (!ext.empty() && ext[0] == '.') ext.erase(ext.begin());
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext.empty() ? "text" : ext;
}

bool Editor::context_eligible() const {
  return guides.options().excluded_contexts.count(context_name()) == 0;
}

void Editor::run() {
  Renderer::scroll_to_cursor(doc.buf, cur, tab_width_, term.get_size(), show_line_numbers, vp);
  guides.post_command();
  while (!should_quit) {
    render();
    int ch = wait_for_key();
    if (ch == ERR) {
      timers.fire_due();
      continue;
    }
    guides.pre_command();
    handle_input(ch);
    clamp_cursor();
    Renderer::scroll_to_cursor(doc.buf, cur, tab_width_, term.get_size(), show_line_numbers, vp);
    guides.post_command();
  }
}

int Editor::wait_for_key() {
  auto left = timers.time_until_next();
  if (!left) return term.read_key(-1);
  auto ms = std::chrono::ceil<std::chrono::milliseconds>(*left).count();
  return term.read_key(static_cast<int>(std::max<long long>(0, ms)));
}

void Editor::render() {
  RenderInfo info;
  info.buf = &doc.buf;
  info.cur = cur;
  info.vp = vp;
  info.tab_width = tab_width_;
  info.file_path = doc.file_path;
  info.modified = doc.modified;
  info.show_line_numbers = show_line_numbers;
  info.mode = mode;
  info.message = message;
  info.cmdline = cmdline;
  info.annotations = &guides.annotations();
  renderer.render(term, info);
}

void Editor::handle_input(int ch) {
  if (ch == KEY_RESIZE) return;
  if (mode == Mode::Command) { handle_command_input(ch); return; }
  if (mode == Mode::Insert) { handle_insert_input(ch); return; }
  handle_normal_input(ch);
}

void Editor::handle_normal_input(int ch) {
  if (ch != 'd' && ch != 'g') input.reset();
  if (input.consume_digit(ch)) return;
  switch (ch) {
    case '0': cur.col = 0; break;
    case 'h': case KEY_LEFT: { size_t n = input.take_count(); while (n--) move_left(); } break;
    case 'l': case KEY_RIGHT: { size_t n = input.take_count(); while (n--) move_right(); } break;
    case 'j': case KEY_DOWN: move_vertical(static_cast<int>(input.take_count())); break;
    case 'k': case KEY_UP: move_vertical(-static_cast<int>(input.take_count())); break;
    case '^': move_to_first_non_blank(); break;
    case '$': move_to_end_of_line(); break;
    case 'g':
      if (input.consume_gg(ch)) {
        bool counted = input.has_count();
        size_t n = input.take_count();
        cur.row = counted ? static_cast<int>(n) - 1 : 0;
        clamp_cursor();
      }
      break;
    case 'G': {
      bool counted = input.has_count();
      size_t n = input.take_count();
      cur.row = counted ? static_cast<int>(n) - 1 : doc.buf.line_count() - 1;
      clamp_cursor();
    } break;
    case CTRL_d: scroll_half_page(1); break;
    case CTRL_u: scroll_half_page(-1); break;
    case 'i': mode = Mode::Insert; break;
    case 'I': move_to_first_non_blank(); mode = Mode::Insert; break;
    case 'a':
      cur.col = std::min(static_cast<int>(doc.buf.line_view(cur.row).size()), cur.col + 1);
      mode = Mode::Insert;
      break;
    case 'A': cur.col = static_cast<int>(doc.buf.line_view(cur.row).size()); mode = Mode::Insert; break;
    case 'o': open_line(true); break;
    case 'O': open_line(false); break;
    case 'x': { size_t n = input.take_count(); while (n--) delete_char(); } break;
    case 'd':
      if (input.consume_dd(ch)) delete_lines(static_cast<int>(input.take_count()));
      break;
    case ':': mode = Mode::Command; cmdline.clear(); break;
    default: break;
  }
}

void Editor::handle_insert_input(int ch) {
  switch (ch) {
    case ESC:
      mode = Mode::Normal;
      if (cur.col > 0) move_left();
      return;
    case KEY_LEFT: move_left(); return;
    case KEY_RIGHT: cur.col = std::min(cur.col + 1, static_cast<int>(doc.buf.line_view(cur.row).size())); return;
    case KEY_UP: move_vertical(-1); return;
    case KEY_DOWN: move_vertical(1); return;
    case KEY_BACKSPACE: case 127: case 8: backspace(); return;
    case '\n': case '\r': case KEY_ENTER: split_line_at_cursor(); return;
    default: break;
  }
  if (ch == '\t' || (ch >= 32 && ch <= 126) || (ch >= 128 && ch <= 255)) insert_char(static_cast<char>(ch));
}

void Editor::handle_command_input(int ch) {
  if (ch == ESC) { mode = Mode::Normal; return; }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline.empty()) mode = Mode::Normal;
    else cmdline.pop_back();
    return;
  }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') {
    mode = Mode::Normal;
    if (!execute_command()) spdlog::info("[Editor] :{} failed: {}", cmdline, message);
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline.push_back(static_cast<char>(ch));
}

bool Editor::execute_command() {
  command_failed = false;
  ParsedCommand pc = parse_command_line(cmdline);
  if (pc.name.empty()) return true;
  if (pc.name == "set") {
    message.clear();
    for (const auto& name : guide_option_names()) {
      if (!message.empty()) message += ' ';
      message += name + "=" + describe_guide_option(guides.options(), name);
    }
    return true;
  }
  if (!registry.execute(pc.name, pc.args)) {
    message = pc.option.empty() ? "unknown command: " + pc.name : "unknown option: " + pc.option;
    command_failed = true;
  }
  return !command_failed;
}

void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / IG_RC_FILE_NAME;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(p, lines, msg)) { message = msg; spdlog::warn("[Editor] {}", msg); return; }
  std::string last_error;
  for (std::string s : lines) {
    size_t i = static_cast<size_t>(indentation_bytes(s));
    size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty() || s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    cmdline = s;
    if (!execute_command()) {
      last_error = message;
      spdlog::warn("[Editor] {}: {}", IG_RC_FILE_NAME, message);
    }
  }
  cmdline.clear();
  message = last_error;
}

int Editor::max_col_for_row(int row) const {
  int len = static_cast<int>(doc.buf.line_view(row).size());
  if (mode == Mode::Insert) return len;
  return len > 0 ? len - 1 : 0;
}

void Editor::clamp_cursor() {
  cur.row = std::clamp(cur.row, 0, std::max(0, doc.buf.line_count() - 1));
  cur.col = std::clamp(cur.col, 0, max_col_for_row(cur.row));
  std::string_view line = doc.buf.line_view(cur.row);
  while (cur.col > 0 && cur.col < static_cast<int>(line.size()) && is_continuation(line[static_cast<size_t>(cur.col)])) cur.col--;
}

void Editor::move_left() {
  std::string_view line = doc.buf.line_view(cur.row);
  if (cur.col <= 0) return;
  cur.col--;
  while (cur.col > 0 && is_continuation(line[static_cast<size_t>(cur.col)])) cur.col--;
}

void Editor::move_right() {
  std::string_view line = doc.buf.line_view(cur.row);
  int next = cur.col + 1;
  while (next < static_cast<int>(line.size()) && is_continuation(line[static_cast<size_t>(next)])) next++;
  if (next <= max_col_for_row(cur.row)) cur.col = next;
}

void Editor::move_vertical(int delta) {
  int vcol = visual_column(doc.buf.line_view(cur.row), cur.col, tab_width_);
  cur.row = std::clamp(cur.row + delta, 0, doc.buf.line_count() - 1);
  cur.col = move_to_column(doc.buf.line_view(cur.row), vcol, tab_width_).byte;
}

void Editor::move_to_first_non_blank() {
  cur.col = indentation_bytes(doc.buf.line_view(cur.row));
}

void Editor::move_to_end_of_line() {
  cur.col = max_col_for_row(cur.row);
}

void Editor::scroll_half_page(int direction) {
  int half = std::max(1, (term.get_size().rows - 1) / 2);
  int max_top = std::max(0, doc.buf.line_count() - 1);
  vp.top_line = std::clamp(vp.top_line + direction * half, 0, max_top);
  move_vertical(direction * half);
}

void Editor::insert_char(char ch) {
  std::string s = doc.buf.line(cur.row);
  cur.col = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  s.insert(s.begin() + cur.col, ch);
  doc.buf.replace_line(cur.row, s);
  cur.col++;
  doc.modified = true;
}

void Editor::split_line_at_cursor() {
  std::string s = doc.buf.line(cur.row);
  cur.col = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  std::string indent = auto_indent ? s.substr(0, static_cast<size_t>(std::min(cur.col, indentation_bytes(s)))) : std::string();
  std::string tail = indent + s.substr(static_cast<size_t>(cur.col));
  doc.buf.replace_line(cur.row, s.substr(0, static_cast<size_t>(cur.col)));
  doc.buf.insert_line(cur.row + 1, tail);
  cur.row++;
  cur.col = static_cast<int>(indent.size());
  doc.modified = true;
}

void Editor::backspace() {
  if (cur.col == 0) {
    if (cur.row == 0) return;
    std::string prev = doc.buf.line(cur.row - 1);
    int join_col = static_cast<int>(prev.size());
    doc.buf.replace_line(cur.row - 1, prev + doc.buf.line(cur.row));
    doc.buf.erase_line(cur.row);
    cur.row--;
    cur.col = join_col;
    doc.modified = true;
    return;
  }
  std::string s = doc.buf.line(cur.row);
  int start = std::min(cur.col, static_cast<int>(s.size())) - 1;
  while (start > 0 && is_continuation(s[static_cast<size_t>(start)])) start--;
  s.erase(static_cast<size_t>(start), static_cast<size_t>(cur.col - start));
  doc.buf.replace_line(cur.row, s);
  cur.col = start;
  doc.modified = true;
}

void Editor::delete_char() {
  std::string s = doc.buf.line(cur.row);
  if (cur.col >= static_cast<int>(s.size())) return;
  size_t end = static_cast<size_t>(cur.col) + 1;
  while (end < s.size() && is_continuation(s[end])) end++;
  s.erase(static_cast<size_t>(cur.col), end - static_cast<size_t>(cur.col));
  doc.buf.replace_line(cur.row, s);
  doc.modified = true;
}

void Editor::delete_lines(int count) {
  int end = std::min(doc.buf.line_count(), cur.row + std::max(1, count));
  doc.buf.erase_lines(cur.row, end);
  doc.modified = true;
  cur.row = std::min(cur.row, doc.buf.line_count() - 1);
  move_to_first_non_blank();
}

void Editor::open_line(bool below) {
  std::string_view line = doc.buf.line_view(cur.row);
  std::string indent = auto_indent ? std::string(line.substr(0, static_cast<size_t>(indentation_bytes(line)))) : std::string();
  int row = below ? cur.row + 1 : cur.row;
  doc.buf.insert_line(row, indent);
  cur.row = row;
  cur.col = static_cast<int>(indent.size());
  doc.modified = true;
  mode = Mode::Insert;
}

void Editor::set_tab_width(int width) {
  tab_width_ = std::max(1, width);
  message = std::string("tabwidth=") + std::to_string(tab_width_);
}
