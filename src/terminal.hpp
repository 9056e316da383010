#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around the ncurses session.
 * Usage: construct in main before any NcursesTerminal; destructor restores the terminal.
 * Note: manages terminal modes (locale/raw/noecho/keypad), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
