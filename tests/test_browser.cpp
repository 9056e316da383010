#include "browser.hpp"
#include <cassert>

static bool not_browsable(const Cell& c) { return !c.is_browsable(); }

// cols 0..7
// row 0: B1 F1 T1,0 T1,1 T1,2 .  .  .
// row 1: .  .  B2 F2 P2   .  .  .
// row 2: B3 F3 T3,0 T3,1 T3,2 T3,3 T3,4 T3,5
// row 3: F3 F3 T3,6 T3,7 .    .    .    .
static Raster sample() {
  Raster r(4, 8);
  assert(!r.push(Cell::bullet(1)));
  assert(!r.push(Cell::filler(1)));
  for (int i = 0; i < 3; ++i) assert(!r.push(Cell::text(1, i)));
  assert(!r.push_multiple(Cell::empty(), 5));
  assert(!r.push(Cell::bullet(2)));
  assert(!r.push(Cell::filler(2)));
  assert(!r.push(Cell::placeholder(2)));
  assert(!r.push_multiple(Cell::empty(), 3));
  assert(!r.push(Cell::bullet(3)));
  assert(!r.push(Cell::filler(3)));
  for (int i = 0; i < 6; ++i) assert(!r.push(Cell::text(3, i)));
  assert(!r.push_multiple(Cell::filler(3), 2));
  assert(!r.push(Cell::text(3, 6)));
  assert(!r.push(Cell::text(3, 7)));
  return r;
}

static Browser at(const Raster& r, Point p) {
  auto b = Browser::at(r, p);
  assert(b);
  return b.value();
}

static void test_at() {
  Raster r = sample();
  auto bad = Browser::at(r, {4, 0});
  assert(!bad && bad.error().kind == ErrorKind::OutOfBounds);
  assert(!Browser::at(r, {0, 8}));
  Browser b = at(r, {0, 2});
  assert(b.state() == Cell::text(1, 0));
  assert(b.pos() == (Point{0, 2}));
}

static void test_go_while() {
  Raster r = sample();
  Browser b = at(r, {0, 4});
  auto right = b.go_while(Direction::Right, not_browsable);
  assert(right && right.value().pos() == (Point{1, 4}));
  assert(right.value().state() == Cell::placeholder(2));

  auto left = right.value().go_while(Direction::Left, not_browsable);
  assert(left && left.value().pos() == (Point{0, 4}));

  // always moves at least one cell
  auto one = at(r, {0, 2}).go_while(Direction::Right, not_browsable);
  assert(one && one.value().pos() == (Point{0, 3}));

  auto off = at(r, {0, 2}).go_while(Direction::Left, not_browsable);
  assert(!off && off.error().kind == ErrorKind::OutOfBounds);
  assert(b.pos() == (Point{0, 4}));
}

static void test_go_while_or_count() {
  Raster r = sample();
  auto b = at(r, {1, 4}).go_while_or_count(Direction::Left, 2, not_browsable);
  assert(b && b.value().pos() == (Point{1, 2}));
  assert(b.value().state() == Cell::bullet(2));

  auto found = at(r, {3, 7}).go_while_or_count(Direction::Left, 7, not_browsable);
  assert(found && found.value().pos() == (Point{3, 3}));

  auto none = at(r, {0, 0}).go_while_or_count(Direction::Left, 0, not_browsable);
  assert(none && none.value().pos() == (Point{0, 0}));
}

static void test_go_until_count() {
  Raster r = sample();
  auto same = [](const Cell& c){ return c.is_text() && c.id == 3; };
  auto b = at(r, {2, 6}).go_until_count(Direction::Right, 3, same);
  assert(b && b.value().pos() == (Point{3, 3}));
  assert(b.value().state() == Cell::text(3, 7));

  auto back = b.value().go_until_count(Direction::Left, 7, same);
  assert(back && back.value().state() == Cell::text(3, 0));

  auto budget = at(r, {0, 0}).go_until_count(Direction::Right, 1, [](const Cell& c){ return c.kind == CellKind::Placeholder; }, 2);
  assert(!budget && budget.error().kind == ErrorKind::PredicateUnsatisfied);

  auto off = at(r, {3, 3}).go_until_count(Direction::Right, 1, [](const Cell& c){ return c.kind == CellKind::Bullet; });
  assert(!off && off.error().kind == ErrorKind::OutOfBounds);
}

static void test_go_wrap() {
  Raster r = sample();
  auto b = at(r, {0, 7}).go_wrap(Direction::Right);
  assert(b && b.value().pos() == (Point{1, 0}));
  auto down = at(r, {0, 3}).go_wrap(Direction::Down, 3);
  assert(down && down.value().pos() == (Point{3, 3}));
  assert(!at(r, {0, 0}).go_wrap(Direction::Left));
  assert(!at(r, {3, 7}).go_wrap(Direction::Right));
}

static void test_go_no_wrap() {
  Raster r = sample();
  auto edge = at(r, {0, 7}).go_no_wrap(Direction::Right, 1);
  assert(!edge && edge.error().kind == ErrorKind::OutOfBounds);
  auto down = at(r, {0, 3}).go_no_wrap(Direction::Down, 2);
  assert(down && down.value().pos() == (Point{2, 3}));
  assert(!at(r, {0, 0}).go_no_wrap(Direction::Up, 1));
  auto left = at(r, {2, 5}).go_no_wrap(Direction::Left, 5);
  assert(left && left.value().pos() == (Point{2, 0}));
}

// j with a remembered column: step down, then clamp left to the nearest text.
static void test_vertical_column_clamp() {
  Raster r = sample();
  auto to_text = [](const Browser& b) -> Outcome<Point> {
    if (b.state().is_browsable()) return b.pos();
    auto l = b.go_while_or_count(Direction::Left, b.pos().col, not_browsable);
    if (!l) return l.error();
    if (!l.value().state().is_browsable()) return make_error(ErrorKind::PredicateUnsatisfied, "no text on target line");
    return l.value().pos();
  };
  auto row1 = at(r, {0, 4}).go_no_wrap(Direction::Down, 1);
  assert(row1);
  auto p1 = row1.value().map(to_text);
  assert(p1 && p1.value() == (Point{1, 4}));

  auto row3 = at(r, {2, 7}).go_no_wrap(Direction::Down, 1);
  assert(row3);
  auto p3 = row3.value().map(to_text);
  assert(p3 && p3.value() == (Point{3, 3}));

  auto row1_start = at(r, {0, 2}).go_no_wrap(Direction::Down, 1);
  assert(row1_start);
  auto miss = row1_start.value().map(to_text);
  assert(!miss && miss.error().message == "no text on target line");
}

int main() {
  test_at();
  test_go_while();
  test_go_while_or_count();
  test_go_until_count();
  test_go_wrap();
  test_go_no_wrap();
  test_vertical_column_clamp();
  return 0;
}
