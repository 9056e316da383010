#pragma once
/*
 * Browser
 *
 * Purpose: immutable, bounds-checked cursor over a Raster.
 * Motions return a new Browser (or an Error); the receiver stays valid, so callers can
 * branch exploration or inspect how far a failing search got.
 * Lifetime: borrows the Raster; discard browsers whenever the raster is rebuilt.
 */
#include <functional>
#include "raster.hpp"
#include "types.hpp"

using CellPredicate = std::function<bool(const Cell&)>;

class Browser {
public:
  static Outcome<Browser> at(const Raster& raster, Point pos);

  Point pos() const { return pos_; }
  Cell state() const { return *raster_->get(pos_); }
  const Raster& raster() const { return *raster_; }

  // Steps at least once, then keeps stepping while the reached cell satisfies pred.
  Outcome<Browser> go_while(Direction dir, const CellPredicate& pred) const;
  // As go_while but gives up after max steps and returns wherever it got.
  Outcome<Browser> go_while_or_count(Direction dir, int max, const CellPredicate& pred) const;
  // Stops on the count-th cell satisfying pred; budget < 0 means unbounded raw steps.
  Outcome<Browser> go_until_count(Direction dir, int count, const CellPredicate& pred, int budget = -1) const;
  // Exactly n linear steps, wrapping across rows.
  Outcome<Browser> go_wrap(Direction dir, int n = 1) const;
  // Plain coordinate addition, no row wrap.
  Outcome<Browser> go_no_wrap(Direction dir, int n = 1) const;

  template <typename F>
  auto map(F&& f) const { return std::forward<F>(f)(*this); }

private:
  Browser(const Raster* raster, Point pos) : raster_(raster), pos_(pos) {}
  Outcome<Point> step(Point from, Direction dir, int n) const;

  const Raster* raster_;
  Point pos_;
};
