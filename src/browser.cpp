#include "browser.hpp"

Outcome<Browser> Browser::at(const Raster& raster, Point pos) {
  if (!raster.in_bounds(pos)) {
    return make_error(ErrorKind::OutOfBounds, "cursor position was out of bounds");
  }
  return Browser(&raster, pos);
}

Outcome<Point> Browser::step(Point from, Direction dir, int n) const {
  switch (dir) {
    case Direction::Left: return linear_move(from, raster_->bounds(), -n);
    case Direction::Right: return linear_move(from, raster_->bounds(), n);
    case Direction::Up: return linear_move(from, raster_->bounds(), -n * raster_->cols());
    case Direction::Down: return linear_move(from, raster_->bounds(), n * raster_->cols());
  }
  return make_error(ErrorKind::OutOfBounds, "ran off bounds");
}

Outcome<Browser> Browser::go_while(Direction dir, const CellPredicate& pred) const {
  Point p = pos_;
  while (true) {
    auto next = step(p, dir, 1);
    if (!next) return next.error();
    p = next.value();
    if (!pred(*raster_->get(p))) return Browser(raster_, p);
  }
}

Outcome<Browser> Browser::go_while_or_count(Direction dir, int max, const CellPredicate& pred) const {
  Point p = pos_;
  for (int i = 0; i < max; ++i) {
    auto next = step(p, dir, 1);
    if (!next) return next.error();
    p = next.value();
    if (!pred(*raster_->get(p))) break;
  }
  return Browser(raster_, p);
}

Outcome<Browser> Browser::go_until_count(Direction dir, int count, const CellPredicate& pred, int budget) const {
  Point p = pos_;
  int matched = 0;
  int steps = 0;
  while (matched < count) {
    if (budget >= 0 && steps >= budget) {
      return make_error(ErrorKind::PredicateUnsatisfied, "search budget exhausted");
    }
    auto next = step(p, dir, 1);
    if (!next) return next.error();
    p = next.value();
    steps++;
    if (pred(*raster_->get(p))) matched++;
  }
  return Browser(raster_, p);
}

Outcome<Browser> Browser::go_wrap(Direction dir, int n) const {
  auto next = step(pos_, dir, n);
  if (!next) return next.error();
  return Browser(raster_, next.value());
}

Outcome<Browser> Browser::go_no_wrap(Direction dir, int n) const {
  Point p = pos_;
  switch (dir) {
    case Direction::Left: p.col -= n; break;
    case Direction::Right: p.col += n; break;
    case Direction::Up: p.row -= n; break;
    case Direction::Down: p.row += n; break;
  }
  if (!raster_->in_bounds(p)) return make_error(ErrorKind::OutOfBounds, "ran off bounds");
  return Browser(raster_, p);
}
