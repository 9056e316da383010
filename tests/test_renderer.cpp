#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <memory>
#include <string>

static Tree new_tree() { return Tree(std::make_unique<CounterIdSource>()); }

static RenderRequest request_for(const Tree& t, int offset = 0) {
  RenderRequest req;
  req.active_id = t.active_id();
  req.insert_offset = offset;
  req.mode = Mode::Insert;
  return req;
}

static std::string pad(std::string s, size_t n) {
  s.resize(n, ' ');
  return s;
}

static void test_basic_grid() {
  Tree t = new_tree();
  t.mutable_active_content() = "hello";
  t.create_sibling(true);
  assert(!t.indent(false));

  HeadlessTerminal term(6, 20);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  const Raster& g = res.raster;
  assert(g.rows() == 5 && g.cols() == 20);
  assert(*g.get({0, 0}) == Cell::bullet(1));
  assert(*g.get({0, 1}) == Cell::filler(1));
  for (int i = 0; i < 5; ++i) assert(*g.get({0, 2 + i}) == Cell::text(1, i));
  assert(*g.get({0, 7}) == Cell::empty());
  assert(*g.get({1, 1}) == Cell::empty());
  assert(*g.get({1, 2}) == Cell::bullet(2));
  assert(*g.get({1, 3}) == Cell::filler(2));
  assert(*g.get({1, 4}) == Cell::placeholder(2));
  assert(*g.get({1, 5}) == Cell::empty());
  assert(*g.get({2, 0}) == Cell::empty());
  assert(res.anchor == (Point{1, 4}));
  assert(res.total_lines == 2);

  assert(term.row_text(0) == pad(std::string(BV_BULLET_GLYPH) + " hello", 20 + 2));
  assert(term.cell(1, 2) == BV_BULLET_GLYPH);
  assert(term.row_text(5).rfind("INSERT", 0) == 0);
  assert(term.cursor_row() == 1 && term.cursor_col() == 4);
  assert(term.refresh_count() == 1);
  assert(term.last_color_pair() == kColorStatus);
}

static void test_anchor_offset() {
  Tree t = new_tree();
  t.mutable_active_content() = "abc";
  HeadlessTerminal term(4, 20);
  Renderer r;
  Viewport vp;
  assert(r.render(term, t, vp, request_for(t, 0)).anchor == (Point{0, 5}));
  assert(r.render(term, t, vp, request_for(t, 1)).anchor == (Point{0, 4}));
  assert(r.render(term, t, vp, request_for(t, 3)).anchor == (Point{0, 2}));
}

static void test_wrapping() {
  Tree t = new_tree();
  t.mutable_active_content() = "abcdefghijkl";
  HeadlessTerminal term(5, 10);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  const Raster& g = res.raster;
  assert(*g.get({0, 9}) == Cell::text(1, 7));
  assert(*g.get({1, 0}) == Cell::filler(1));
  assert(*g.get({1, 1}) == Cell::filler(1));
  assert(*g.get({1, 2}) == Cell::text(1, 8));
  assert(*g.get({1, 5}) == Cell::text(1, 11));
  assert(*g.get({1, 6}) == Cell::empty());
  assert(res.anchor == (Point{1, 6}));
  assert(term.row_text(1).substr(0, 6) == "  ijkl");
}

static void test_exact_fill_adds_row() {
  Tree t = new_tree();
  t.mutable_active_content() = "abcdefgh";
  HeadlessTerminal term(5, 10);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  assert(res.total_lines == 2);
  assert(*res.raster.get({0, 9}) == Cell::text(1, 7));
  assert(*res.raster.get({1, 0}) == Cell::filler(1));
  assert(*res.raster.get({1, 2}) == Cell::empty());
  assert(res.anchor == (Point{1, 2}));

  // offset back onto the text: no extra row
  res = r.render(term, t, vp, request_for(t, 1));
  assert(res.total_lines == 1);
  assert(res.anchor == (Point{0, 9}));
}

static void test_deep_indent_clamped() {
  Tree t = new_tree();
  for (int i = 0; i < 5; ++i) {
    t.create_sibling(true);
    assert(!t.indent(false));
  }
  t.mutable_active_content() = "x";
  HeadlessTerminal term(8, 8);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  assert(t.depth_of(t.active_id()) == 5);
  assert(*res.raster.get({5, 5}) == Cell::bullet(t.active_id()));
  assert(*res.raster.get({5, 7}) == Cell::text(t.active_id(), 0));
}

static void test_very_deep_outline_layout() {
  Tree t = new_tree();
  for (int i = 0; i < 3000; ++i) {
    t.create_sibling(true);
    assert(!t.indent(false));
  }
  RenderRequest req = request_for(t);
  OutlineLayout layout = layout_outline(t, 20, req);
  assert(layout.lines.size() == 3001);
  assert(layout.lines[0][0] == Cell::bullet(1));
  assert(layout.lines[1][2] == Cell::bullet(2));
  assert(layout.lines.back()[17] == Cell::bullet(t.active_id()));
  assert(layout.anchor == (Point{3000, 19}));
}

static void test_too_narrow() {
  Tree t = new_tree();
  t.mutable_active_content() = "abc";
  HeadlessTerminal term(3, 2);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  assert(!res.anchor);
  assert(res.total_lines == 0);
  assert(*res.raster.get({0, 0}) == Cell::empty());
}

static void test_viewport_follows_anchor() {
  Tree t = new_tree();
  for (int i = 0; i < 4; ++i) t.create_sibling(true);
  HeadlessTerminal term(3, 20);
  Renderer r;
  Viewport vp;
  RenderResult res = r.render(term, t, vp, request_for(t));
  assert(res.total_lines == 5);
  assert(vp.top_line == 3);
  assert(*res.raster.get({0, 0}) == Cell::bullet(4));
  assert(res.anchor == (Point{1, 2}));

  assert(!t.activate(1));
  res = r.render(term, t, vp, request_for(t));
  assert(vp.top_line == 0);
  assert(res.anchor == (Point{0, 2}));

  // no follow: viewport stays, anchor off screen
  vp.top_line = 3;
  RenderRequest req = request_for(t);
  req.follow_active = false;
  res = r.render(term, t, vp, req);
  assert(vp.top_line == 3);
  assert(!res.anchor);
}

static void test_status_line() {
  Tree t = new_tree();
  HeadlessTerminal term(4, 20);
  Renderer r;
  Viewport vp;
  RenderRequest req = request_for(t);
  req.mode = Mode::Normal;
  req.message = "oops";
  r.render(term, t, vp, req);
  std::string status = term.row_text(3);
  assert(status.rfind("NORMAL", 0) == 0);
  assert(status.substr(16) == "oops");

  req.mode = Mode::Command;
  req.cmdline = "set";
  r.render(term, t, vp, req);
  assert(term.row_text(3).rfind(":set", 0) == 0);
  assert(term.cursor_row() == 3 && term.cursor_col() == 4);

  req.mode = Mode::Insert;
  req.show_status = false;
  RenderResult res = r.render(term, t, vp, req);
  assert(res.raster.rows() == 4);
  assert(term.last_color_pair() == kColorBullet);
}

static void test_custom_glyph_and_indent() {
  Tree t = new_tree();
  t.create_sibling(true);
  assert(!t.indent(false));
  HeadlessTerminal term(4, 20);
  Renderer r;
  Viewport vp;
  RenderRequest req = request_for(t);
  req.indent_width = 4;
  req.bullet_glyph = "-";
  RenderResult res = r.render(term, t, vp, req);
  assert(*res.raster.get({1, 4}) == Cell::bullet(2));
  assert(term.cell(1, 4) == "-");
  assert(term.row_text(0).rfind("- ", 0) == 0);
}

static void test_explicit_cursor() {
  Tree t = new_tree();
  t.mutable_active_content() = "abc";
  HeadlessTerminal term(4, 20);
  Renderer r;
  Viewport vp;
  RenderRequest req = request_for(t);
  req.cursor = Point{0, 3};
  r.render(term, t, vp, req);
  assert(term.cursor_row() == 0 && term.cursor_col() == 3);
}

int main() {
  test_basic_grid();
  test_anchor_offset();
  test_wrapping();
  test_exact_fill_adds_row();
  test_deep_indent_clamped();
  test_very_deep_outline_layout();
  test_too_narrow();
  test_viewport_follows_anchor();
  test_status_line();
  test_custom_glyph_and_indent();
  test_explicit_cursor();
  return 0;
}
