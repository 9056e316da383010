#pragma once
/*
 * Renderer
 *
 * Purpose: paint the outline and status line, and produce the Raster describing every cell.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from the caller-owned Viewport; call again after every tree change.
 *
 * Grid contract:
 *   indentation            Empty
 *   marker glyph           Bullet(id)
 *   space after the marker Filler(id)
 *   content character i    Text(id, i), reading order, wrapping at the right edge
 *   wrapped row margin     Filler(id)
 *   empty content          one Placeholder(id)
 *   everything else        Empty
 */
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "iterminal.hpp"
#include "outline_tree.hpp"
#include "raster.hpp"
#include "types.hpp"

struct RenderRequest {
  int active_id = -1;
  int insert_offset = 0;           // characters back from the end of the active content
  Mode mode = Mode::Normal;
  std::optional<Point> cursor;     // screen cursor; the active anchor when empty
  bool follow_active = true;       // scroll so the anchor stays visible
  std::string message;
  std::string cmdline;
  int indent_width = BV_INDENT_WIDTH;
  std::string bullet_glyph = BV_BULLET_GLYPH;
  bool show_status = true;
};

struct RenderResult {
  Raster raster;
  std::optional<Point> anchor; // screen position of the active insertion point, if visible
  int total_lines = 0;         // document rows before viewport clipping
};

// Whole-document cell layout, one entry per virtual row, before viewport clipping.
struct OutlineLayout {
  std::vector<std::vector<Cell>> lines;
  std::optional<Point> anchor;
};

OutlineLayout layout_outline(const Tree& tree, int cols, const RenderRequest& req);

class Renderer {
public:
  RenderResult render(ITerminal& term, const Tree& tree, Viewport& vp, const RenderRequest& req);
};
