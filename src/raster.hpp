#pragma once
/*
 * Raster
 *
 * Purpose: fixed rows x cols grid classifying every screen cell of a rendered outline.
 * Addressing: linear-with-wrap; stepping past the last column continues at column 0 of the next row.
 * Lifetime: populated once by the renderer, then read-only; rebuild after any tree mutation.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class CellKind { Empty, Bullet, Filler, Text, Placeholder };

struct Cell {
  CellKind kind = CellKind::Empty;
  int id = -1;
  int offset = 0; // index into the node's content, Text only

  static Cell empty() { return {}; }
  static Cell bullet(int id) { return {CellKind::Bullet, id, 0}; }
  static Cell filler(int id) { return {CellKind::Filler, id, 0}; }
  static Cell text(int id, int offset) { return {CellKind::Text, id, offset}; }
  static Cell placeholder(int id) { return {CellKind::Placeholder, id, 0}; }

  bool is_text() const { return kind == CellKind::Text; }
  bool is_browsable() const { return kind == CellKind::Text || kind == CellKind::Placeholder; }
  bool has_id() const { return kind != CellKind::Empty; }
  bool operator==(const Cell&) const = default;
};

std::string describe(const Cell& cell);

// Moves pos by a signed number of cells along the flattened grid (floor division/modulo).
Outcome<Point> linear_move(Point pos, Bounds bounds, int offset);

class Raster {
public:
  Raster(int rows, int cols);

  int rows() const { return rows_; }
  int cols() const { return cols_; }
  Bounds bounds() const { return {rows_, cols_}; }
  bool in_bounds(Point p) const { return p.row >= 0 && p.row < rows_ && p.col >= 0 && p.col < cols_; }
  std::optional<Cell> get(Point p) const;

  /*population*/
  std::optional<Error> set(Point p, const Cell& cell);
  std::optional<Error> push(const Cell& cell);
  std::optional<Error> push_multiple(const Cell& cell, int count);
  Point fill_position() const { return fill_; }

private:
  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  Point fill_{0, 0};
};
