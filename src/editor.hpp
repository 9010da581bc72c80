#pragma once
/*
 * Editor
 *
 * Purpose: modal terminal editor hosting the indent guides.
 * Loop: render → wait for a key (bounded by the next idle timer) → pre_command →
 *       handle key → post_command. A wait that times out fires idle timers.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "guide_controller.hpp"
#include "guide_host.hpp"
#include "idle_timers.hpp"
#include "input.hpp"
#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

class Editor : public IGuideHost {
public:
  explicit Editor(const std::optional<std::filesystem::path>& file);
  void run();

  const TextBuffer& buffer() const override { return doc.buf; }
  Cursor cursor() const override { return cur; }
  int tab_width() const override { return tab_width_; }
  VisibleRange visible_range() const override;
  bool prompt_active() const override { return mode == Mode::Command; }
  bool context_eligible() const override;
  bool graphical() const override { return term.graphical(); }
  CellSize nominal_cell() const override { return CellSize{1, 1}; }
  std::optional<CellSize> row_cell(int row) const override;

private:
  struct Document {
    TextBuffer buf;
    std::optional<std::filesystem::path> file_path;
    bool modified = false;
  };

  Document doc;
  Cursor cur;
  Viewport vp;
  Mode mode = Mode::Normal;
  int tab_width_ = IG_DEFAULT_TAB_WIDTH;
  bool show_line_numbers = false;
  bool auto_indent = true;
  bool should_quit = false;
  bool command_failed = false;
  std::string message;
  std::string cmdline;
  Input input;
  Renderer renderer;
  NcursesTerminal term;
  CommandRegistry registry;
  IdleTimers timers;
  GuideController guides;

  void render();
  int wait_for_key();
  void handle_input(int ch);
  void handle_normal_input(int ch);
  void handle_insert_input(int ch);
  void handle_command_input(int ch);
  /* false when the command or its value was rejected; message says why */
  bool execute_command();
  void register_commands();
  void register_guide_option(const std::string& name);
  void load_rc();
  void open_file(const std::filesystem::path& path);
  std::string context_name() const;

  int max_col_for_row(int row) const;
  void clamp_cursor();
  void move_left();
  void move_right();
  void move_vertical(int delta);
  void move_to_first_non_blank();
  void move_to_end_of_line();
  void scroll_half_page(int direction);

  void insert_char(char ch);
  void split_line_at_cursor();
  void backspace();
  void delete_char();
  void delete_lines(int count);
  void open_line(bool below);
  void set_tab_width(int width);
};
