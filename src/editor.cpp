#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <cstdlib>
#include "browser.hpp"
#include "id_source.hpp"

static constexpr int CTRL_C = 'C'-64;
static constexpr int CTRL_R = 'R'-64;
static constexpr int ESC = 27;

static inline bool is_sep(char c) { return c == ' '; }
static inline bool not_browsable(const Cell& c) { return !c.is_browsable(); }

static CellPredicate text_of(int id) {
  return [id](const Cell& c){ return c.is_text() && c.id == id; };
}

/*word boundaries inside one bullet, separators are spaces*/
static std::optional<int> word_start_after(const std::string& s, int i) {
  int len = static_cast<int>(s.size());
  int j = i;
  while (j < len && !is_sep(s[j])) j++;
  while (j < len && is_sep(s[j])) j++;
  if (j < len) return j;
  return std::nullopt;
}
static std::optional<int> word_end_after(const std::string& s, int i) {
  int len = static_cast<int>(s.size());
  int j = i + 1;
  while (j < len && is_sep(s[j])) j++;
  if (j >= len) return std::nullopt;
  while (j + 1 < len && !is_sep(s[j + 1])) j++;
  return j;
}
static std::optional<int> word_start_before(const std::string& s, int i) {
  int j = i - 1;
  while (j >= 0 && is_sep(s[j])) j--;
  if (j < 0) return std::nullopt;
  while (j > 0 && !is_sep(s[j - 1])) j--;
  return j;
}

// Moves b from its Text cell to character `target` of the same bullet.
static Outcome<Browser> goto_offset(const Browser& b, int target) {
  Cell c = b.state();
  if (!c.is_text() || target == c.offset) return b;
  Direction dir = target > c.offset ? Direction::Right : Direction::Left;
  return b.go_until_count(dir, std::abs(target - c.offset), text_of(c.id));
}

// Browsable cell on b's row: b itself, else the nearest one to the left, else to the right.
static Outcome<Point> find_browsable_near(const Browser& b) {
  if (b.state().is_browsable()) return b.pos();
  auto left = b.go_while_or_count(Direction::Left, b.pos().col, not_browsable);
  if (left && left.value().pos().row == b.pos().row && left.value().state().is_browsable()) return left.value().pos();
  int room = b.raster().cols() - 1 - b.pos().col;
  if (room > 0) {
    auto right = b.go_while_or_count(Direction::Right, room, not_browsable);
    if (right && right.value().state().is_browsable()) return right.value().pos();
  }
  return make_error(ErrorKind::PredicateUnsatisfied, "no text on target line");
}

Editor::Editor(ITerminal& t)
  : term(t), tree(std::make_unique<CounterIdSource>()) {
  register_commands();
  render();
}

void Editor::run() {
  while (!quit_requested) {
    int ch = getch();
    handle_key(ch);
  }
}

void Editor::render() {
  RenderRequest req;
  req.active_id = tree.active_id();
  req.insert_offset = offset;
  req.mode = mode;
  if (!follow_anchor) req.cursor = cur;
  req.follow_active = follow_anchor;
  req.message = message;
  req.cmdline = cmdline;
  req.indent_width = indent_width;
  req.bullet_glyph = bullet_glyph;
  req.show_status = show_status;
  RenderResult r = renderer.render(term, tree, vp, req);
  raster = std::move(r.raster);
  anchor = r.anchor;
  total_lines = r.total_lines;
  if (follow_anchor && anchor) { cur = *anchor; want_col = cur.col; }
}

void Editor::handle_key(int ch) {
  if (ch == KEY_RESIZE) { render(); refocus_cursor(); return; }
  if (mode == Mode::Command) { handle_command_input(ch); render(); return; }
  message.clear();
  std::optional<Error> err = mode == Mode::Insert ? handle_insert_input(ch) : handle_normal_input(ch);
  if (err) message = err->message;
  render();
  refocus_cursor();
}

// Normal mode cursor must sit on text; fall back to the active bullet when it does not.
void Editor::refocus_cursor() {
  if (mode != Mode::Normal) return;
  auto c = raster.get(cur);
  if (c && c->is_browsable()) return;
  int len = static_cast<int>(tree.active_content().size());
  offset = std::clamp(offset, len > 0 ? 1 : 0, len);
  follow_anchor = true;
  render();
}

Outcome<Cell> Editor::activate_under_cursor() {
  auto c = raster.get(cur);
  if (!c || !c->is_browsable()) return make_error(ErrorKind::PredicateUnsatisfied, "cursor is not on a bullet");
  if (auto err = tree.activate(c->id)) return *err;
  return *c;
}

// Cursor goes to the first character of the active bullet.
void Editor::follow_start() {
  offset = static_cast<int>(tree.active_content().size());
  follow_anchor = true;
}

void Editor::follow_cell(const Cell& cell) {
  int len = static_cast<int>(tree.content(cell.id).size());
  offset = cell.is_text() ? len - cell.offset : 0;
  follow_anchor = true;
}

bool Editor::scroll(int delta) {
  int top = vp.top_line + delta;
  if (top < 0 || top >= total_lines) return false;
  if (delta > 0 && vp.top_line + raster.rows() >= total_lines) return false;
  vp.top_line = top;
  follow_anchor = false;
  render();
  return true;
}

std::optional<Error> Editor::handle_normal_input(int ch) {
  if ((ch >= '1' && ch <= '9') || (ch == '0' && input.has_count())) {
    input.consume_digit(ch);
    return std::nullopt;
  }
  if (ch == 'd' || ch == 'y' || ch == '>' || ch == '<') {
    if (!input.consume_pair(ch)) return std::nullopt;
    int n = input.take_count();
    input.reset();
    switch (ch) {
      case 'd': return delete_bullet();
      case 'y': return yank_bullet();
      case '>': return shift_bullet(true, n);
      default: return shift_bullet(false, n);
    }
  }
  int n = input.take_count();
  input.reset();
  std::optional<Error> err;
  switch (ch) {
    case 'h': case KEY_LEFT:
      for (int i = 0; i < n; ++i) if ((err = move_horizontal(Direction::Left))) break;
      break;
    case 'l': case KEY_RIGHT:
      for (int i = 0; i < n; ++i) if ((err = move_horizontal(Direction::Right))) break;
      break;
    case 'j': case KEY_DOWN:
      for (int i = 0; i < n; ++i) if ((err = move_vertical(Direction::Down))) break;
      break;
    case 'k': case KEY_UP:
      for (int i = 0; i < n; ++i) if ((err = move_vertical(Direction::Up))) break;
      break;
    case 'w': case 'b': case 'e':
      for (int i = 0; i < n; ++i) if ((err = move_word(ch))) break;
      break;
    case '0': return move_to_bullet_edge(false);
    case '$': return move_to_bullet_edge(true);
    case 'i': case 'a': case 'A': case 'I': return enter_insert(ch);
    case 'o': return open_bullet(true);
    case 'O': return open_bullet(false);
    case 'x':
      for (int i = 0; i < n; ++i) if ((err = delete_char())) break;
      break;
    case 'p': return paste(true, n);
    case 'P': return paste(false, n);
    case 'u': return undo();
    case CTRL_R: return redo();
    case ':': mode = Mode::Command; cmdline.clear(); break;
    default: break;
  }
  return err;
}

std::optional<Error> Editor::move_horizontal(Direction dir) {
  auto b = Browser::at(raster, cur);
  if (!b) return b.error();
  auto moved = b.value().go_while(dir, not_browsable);
  if (!moved) return moved.error();
  cur = moved.value().pos();
  want_col = cur.col;
  follow_anchor = false;
  return std::nullopt;
}

std::optional<Error> Editor::move_vertical(Direction dir) {
  Point from = cur;
  int top = vp.top_line;
  auto b = Browser::at(raster, cur);
  if (!b) return b.error();
  auto stepped = b.value().go_no_wrap(dir, 1);
  bool scrolled = false;
  if (!stepped) {
    if (stepped.error().kind != ErrorKind::OutOfBounds) return stepped.error();
    if (!scroll(dir == Direction::Down ? 1 : -1)) return stepped.error();
    // the next line scrolled into the row the cursor is on
    scrolled = true;
    stepped = Browser::at(raster, cur);
    if (!stepped) return stepped.error();
  }
  Browser at = stepped.value();
  int col = std::min(want_col, raster.cols() - 1);
  if (col != at.pos().col) {
    auto shifted = at.go_no_wrap(col > at.pos().col ? Direction::Right : Direction::Left, std::abs(col - at.pos().col));
    if (!shifted) return shifted.error();
    at = shifted.value();
  }
  auto target = find_browsable_near(at);
  if (!target) {
    cur = from;
    if (scrolled) { vp.top_line = top; render(); }
    return target.error();
  }
  cur = target.value();
  follow_anchor = false;
  return std::nullopt;
}

std::optional<Error> Editor::move_word(int key) {
  auto b = Browser::at(raster, cur);
  if (!b) return b.error();
  Cell cell = b.value().state();
  if (!cell.is_browsable()) return make_error(ErrorKind::PredicateUnsatisfied, "cursor is not on a bullet");
  Direction dir = key == 'b' ? Direction::Left : Direction::Right;

  if (cell.is_text()) {
    const std::string& s = tree.content(cell.id);
    std::optional<int> target;
    if (key == 'w') target = word_start_after(s, cell.offset);
    else if (key == 'e') target = word_end_after(s, cell.offset);
    else target = word_start_before(s, cell.offset);
    if (target) {
      auto moved = goto_offset(b.value(), *target);
      if (!moved) return moved.error();
      cur = moved.value().pos();
      want_col = cur.col;
      follow_anchor = false;
      return std::nullopt;
    }
  }

  // no boundary left in this bullet: continue in the neighbouring one
  auto crossed = b.value().go_while(dir, [id = cell.id](const Cell& c){ return !c.is_browsable() || c.id == id; });
  if (!crossed) return crossed.error();
  Browser next = crossed.value();
  Cell landed = next.state();
  if (landed.is_text()) {
    const std::string& s = tree.content(landed.id);
    int len = static_cast<int>(s.size());
    std::optional<int> target;
    if (key == 'w') {
      int j = 0;
      while (j < len && is_sep(s[j])) j++;
      if (j < len) target = j;
    } else if (key == 'e') {
      target = word_end_after(s, -1);
    } else {
      target = word_start_before(s, len);
    }
    if (target) {
      auto moved = goto_offset(next, *target);
      if (!moved) return moved.error();
      next = moved.value();
    }
  }
  cur = next.pos();
  want_col = cur.col;
  follow_anchor = false;
  return std::nullopt;
}

std::optional<Error> Editor::move_to_bullet_edge(bool end) {
  auto b = Browser::at(raster, cur);
  if (!b) return b.error();
  Cell cell = b.value().state();
  if (!cell.is_text()) return std::nullopt;
  int len = static_cast<int>(tree.content(cell.id).size());
  auto moved = goto_offset(b.value(), end ? len - 1 : 0);
  if (!moved) return moved.error();
  cur = moved.value().pos();
  want_col = cur.col;
  follow_anchor = false;
  return std::nullopt;
}

std::optional<Error> Editor::enter_insert(int key) {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  int len = static_cast<int>(tree.active_content().size());
  int at = cell.value().is_text() ? cell.value().offset : 0;
  switch (key) {
    case 'i': offset = len - at; break;
    case 'a': offset = std::max(0, len - at - 1); break;
    case 'A': offset = 0; break;
    default: offset = len; break; // I
  }
  mode = Mode::Insert;
  follow_anchor = true;
  return std::nullopt;
}

std::optional<Error> Editor::open_bullet(bool below) {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  tree.create_sibling(below);
  offset = 0;
  mode = Mode::Insert;
  follow_anchor = true;
  return std::nullopt;
}

std::optional<Error> Editor::delete_bullet() {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  Subtree sub = tree.get_subtree();
  if (auto err = tree.delete_active()) return err;
  clipboard = sub;
  um.record(std::move(sub));
  follow_start();
  return std::nullopt;
}

std::optional<Error> Editor::yank_bullet() {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  clipboard = tree.get_subtree();
  message = "yanked " + std::to_string(clipboard->size()) + (clipboard->size() == 1 ? " bullet" : " bullets");
  return std::nullopt;
}

std::optional<Error> Editor::paste(bool below, int count) {
  if (!clipboard) return make_error(ErrorKind::PredicateUnsatisfied, "nothing to paste");
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  for (int i = 0; i < count; ++i) tree.insert_subtree(*clipboard, below);
  follow_start();
  return std::nullopt;
}

std::optional<Error> Editor::shift_bullet(bool deeper, int count) {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  std::optional<Error> err;
  int done = 0;
  for (; done < count; ++done) {
    err = deeper ? tree.indent(false) : tree.unindent();
    if (err) break;
  }
  if (done > 0) {
    follow_cell(cell.value());
    return std::nullopt;
  }
  return err;
}

std::optional<Error> Editor::delete_char() {
  auto cell = activate_under_cursor();
  if (!cell) return cell.error();
  if (!cell.value().is_text()) return std::nullopt;
  std::string& s = tree.mutable_active_content();
  if (cell.value().offset >= static_cast<int>(s.size())) return std::nullopt;
  s.erase(static_cast<size_t>(cell.value().offset), 1);
  int len = static_cast<int>(s.size());
  offset = len == 0 ? 0 : len - std::min(cell.value().offset, len - 1);
  follow_anchor = true;
  return std::nullopt;
}

std::optional<Error> Editor::undo() {
  auto restored = um.undo(tree);
  if (!restored) return restored.error();
  size_t n = restored.value();
  message = "restored " + std::to_string(n) + (n == 1 ? " bullet" : " bullets");
  follow_start();
  return std::nullopt;
}

std::optional<Error> Editor::redo() {
  auto removed = um.redo(tree);
  if (!removed) return removed.error();
  size_t n = removed.value();
  message = "removed " + std::to_string(n) + (n == 1 ? " bullet" : " bullets");
  follow_start();
  return std::nullopt;
}

std::optional<Error> Editor::handle_insert_input(int ch) {
  follow_anchor = true;
  int len = static_cast<int>(tree.active_content().size());
  offset = std::clamp(offset, 0, len);
  switch (ch) {
    case ESC: case CTRL_C: leave_insert(); return std::nullopt;
    case KEY_BACKSPACE: case 127: case 8: return backspace();
    case '\n': case '\r': case KEY_ENTER: split_bullet(); return std::nullopt;
    case '\t': return tree.indent(false);
    case KEY_BTAB: return tree.unindent();
    case KEY_LEFT: offset = std::min(len, offset + 1); return std::nullopt;
    case KEY_RIGHT: offset = std::max(0, offset - 1); return std::nullopt;
    default: break;
  }
  if (ch >= 32 && ch < 127) {
    std::string& s = tree.mutable_active_content();
    s.insert(s.size() - static_cast<size_t>(offset), 1, static_cast<char>(ch));
  }
  return std::nullopt;
}

void Editor::leave_insert() {
  // the normal mode cursor sits on a character, not past the end
  if (offset == 0 && !tree.active_content().empty()) offset = 1;
  mode = Mode::Normal;
  follow_anchor = true;
}

std::optional<Error> Editor::backspace() {
  std::string& s = tree.mutable_active_content();
  int at = static_cast<int>(s.size()) - offset;
  if (at > 0) {
    s.erase(static_cast<size_t>(at - 1), 1);
    return std::nullopt;
  }
  if (!s.empty()) return std::nullopt;

  // land on the previous bullet: above sibling, else parent, else the one below
  int id = tree.active_id();
  std::optional<int> next = tree.sibling(id, Dir::Above);
  if (!next) {
    auto parent = tree.parent_of(id);
    if (parent && *parent != tree.root_id()) next = parent;
  }
  if (!next) next = tree.sibling(id, Dir::Below);
  if (!next) return make_error(ErrorKind::StructuralLimit, "cannot backspace over last bullet");
  Subtree sub = tree.get_subtree();
  if (auto err = tree.delete_active()) return err;
  um.record(std::move(sub));
  if (auto err = tree.activate(*next)) return err;
  offset = 0;
  return std::nullopt;
}

// Enter: the text after the cursor moves into a new bullet below.
void Editor::split_bullet() {
  std::string& s = tree.mutable_active_content();
  size_t at = s.size() - static_cast<size_t>(offset);
  std::string tail = s.substr(at);
  s.erase(at);
  tree.create_sibling(true);
  tree.mutable_active_content() = tail;
  offset = static_cast<int>(tail.size());
}
