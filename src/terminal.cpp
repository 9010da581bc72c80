#include "terminal.hpp"
#include <ncurses.h>
#include <clocale>

Terminal::Terminal() {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
}

Terminal::~Terminal() {
  endwin();
}
