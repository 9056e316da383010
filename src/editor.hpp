#pragma once
/*
 * Editor
 *
 * Purpose: modal command layer over the outline core.
 * Flow: every key is handled against the Raster of the last render, the tree is mutated
 * through activate + one Tree operation, then the document is rendered again.
 * Errors from the core surface in the status line; the cursor stays where it was.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "outline_tree.hpp"
#include "raster.hpp"
#include "renderer.hpp"
#include "subtree.hpp"
#include "types.hpp"
#include "undo_manager.hpp"

class Editor {
public:
  explicit Editor(ITerminal& term);
  void run();
  void handle_key(int ch);
  void execute_command(const std::string& line);
  void load_rc(const std::filesystem::path& path);
  static std::optional<std::filesystem::path> default_rc_path();

  bool should_quit() const { return quit_requested; }
  Mode current_mode() const { return mode; }
  Point cursor_pos() const { return cur; }
  int insert_offset() const { return offset; }
  const std::string& status_message() const { return message; }
  const Tree& document() const { return tree; }
  const Raster& grid() const { return raster; }
  const Viewport& viewport() const { return vp; }
  bool has_clipboard() const { return clipboard.has_value(); }
  size_t undo_depth() const { return um.undo_size(); }
  int indent() const { return indent_width; }
  const std::string& bullet() const { return bullet_glyph; }

private:
  ITerminal& term;
  Tree tree;
  Renderer renderer;
  Viewport vp;
  Raster raster{0, 0};
  std::optional<Point> anchor;
  int total_lines = 0;

  Mode mode = Mode::Insert;
  Point cur{0, 0};
  int want_col = 0;          // column remembered across j/k
  int offset = 0;            // characters back from the end of the active content
  bool follow_anchor = true; // next render puts the cursor on the active anchor
  std::string message;
  std::string cmdline;
  Input input;
  CommandRegistry registry;
  UndoManager um;
  std::optional<Subtree> clipboard;

  int indent_width = BV_INDENT_WIDTH;
  std::string bullet_glyph = BV_BULLET_GLYPH;
  bool show_status = true;
  bool quit_requested = false;

  void render();
  void register_commands();
  std::optional<Error> handle_normal_input(int ch);
  std::optional<Error> handle_insert_input(int ch);
  void handle_command_input(int ch);

  Outcome<Cell> activate_under_cursor();
  void follow_start();
  void follow_cell(const Cell& cell);
  void refocus_cursor();
  bool scroll(int delta);

  std::optional<Error> move_horizontal(Direction dir);
  std::optional<Error> move_vertical(Direction dir);
  std::optional<Error> move_word(int key);
  std::optional<Error> move_to_bullet_edge(bool end);
  std::optional<Error> enter_insert(int key);
  std::optional<Error> open_bullet(bool below);
  std::optional<Error> delete_bullet();
  std::optional<Error> yank_bullet();
  std::optional<Error> paste(bool below, int count);
  std::optional<Error> shift_bullet(bool deeper, int count);
  std::optional<Error> delete_char();
  std::optional<Error> undo();
  std::optional<Error> redo();
  std::optional<Error> backspace();
  void split_bullet();
  void leave_insert();
};
