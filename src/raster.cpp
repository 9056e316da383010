#include "raster.hpp"
#include <algorithm>

static int floor_div(int a, int b) { int q = a / b; if ((a % b != 0) && ((a < 0) != (b < 0))) q--; return q; }
static int floor_mod(int a, int b) { int m = a % b; if (m != 0 && ((m < 0) != (b < 0))) m += b; return m; }

std::string describe(const Cell& cell) {
  switch (cell.kind) {
    case CellKind::Empty: return "Empty";
    case CellKind::Bullet: return "Bullet(" + std::to_string(cell.id) + ")";
    case CellKind::Filler: return "Filler(" + std::to_string(cell.id) + ")";
    case CellKind::Text: return "Text(" + std::to_string(cell.id) + ", " + std::to_string(cell.offset) + ")";
    case CellKind::Placeholder: return "Placeholder(" + std::to_string(cell.id) + ")";
  }
  return "?";
}

Outcome<Point> linear_move(Point pos, Bounds bounds, int offset) {
  if (bounds.cols <= 0) return make_error(ErrorKind::OutOfBounds, "ran off bounds");
  int col = pos.col + offset;
  Point out{pos.row + floor_div(col, bounds.cols), floor_mod(col, bounds.cols)};
  if (out.row < 0 || out.row >= bounds.rows) return make_error(ErrorKind::OutOfBounds, "ran off bounds");
  return out;
}

Raster::Raster(int rows, int cols)
  : rows_(std::max(0, rows)), cols_(std::max(0, cols)), cells_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_)) {}

std::optional<Cell> Raster::get(Point p) const {
  if (!in_bounds(p)) return std::nullopt;
  return cells_[static_cast<size_t>(p.row) * cols_ + p.col];
}

std::optional<Error> Raster::set(Point p, const Cell& cell) {
  if (!in_bounds(p)) return make_error(ErrorKind::OutOfBounds, "cannot write outside raster");
  cells_[static_cast<size_t>(p.row) * cols_ + p.col] = cell;
  return std::nullopt;
}

std::optional<Error> Raster::push(const Cell& cell) {
  if (!in_bounds(fill_)) return make_error(ErrorKind::OutOfBounds, "cannot add to full raster");
  cells_[static_cast<size_t>(fill_.row) * cols_ + fill_.col] = cell;
  if (++fill_.col >= cols_) { fill_.col = 0; fill_.row++; }
  return std::nullopt;
}

std::optional<Error> Raster::push_multiple(const Cell& cell, int count) {
  for (int i = 0; i < count; ++i) {
    if (auto err = push(cell)) return err;
  }
  return std::nullopt;
}
