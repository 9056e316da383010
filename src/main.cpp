#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"

int main() {
  Terminal term;
  NcursesTerminal screen;
  Editor ed(screen);
  if (auto rc = Editor::default_rc_path()) ed.load_rc(*rc);
  ed.run();
  return 0;
}
