#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, ""); // wide glyphs for the bullet marker
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
}

Terminal::~Terminal() {
  endwin();
}
