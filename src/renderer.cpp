#include "renderer.hpp"
#include <algorithm>
#include <utility>

static std::vector<Cell> continuation_line(int id, int text_col, int cols) {
  std::vector<Cell> line(static_cast<size_t>(cols), Cell::empty());
  for (int c = 0; c < text_col; ++c) line[c] = Cell::filler(id);
  return line;
}

static void layout_bullet(const Tree& tree, int id, int depth, int cols, const RenderRequest& req, OutlineLayout& out) {
  const std::string& text = tree.content(id);
  int n = static_cast<int>(text.size());
  int margin = std::min(depth * std::max(0, req.indent_width), cols - 3);
  int text_col = margin + 2;
  bool active = id == req.active_id;
  int anchor_index = active ? n - std::clamp(req.insert_offset, 0, n) : -1;

  std::vector<Cell> line(static_cast<size_t>(cols), Cell::empty());
  line[margin] = Cell::bullet(id);
  line[margin + 1] = Cell::filler(id);
  if (text.empty()) {
    line[text_col] = Cell::placeholder(id);
    if (active) out.anchor = Point{static_cast<int>(out.lines.size()), text_col};
  } else {
    int col = text_col;
    for (int i = 0; i < n; ++i) {
      if (col >= cols) {
        out.lines.push_back(std::move(line));
        line = continuation_line(id, text_col, cols);
        col = text_col;
      }
      line[col] = Cell::text(id, i);
      if (i == anchor_index) out.anchor = Point{static_cast<int>(out.lines.size()), col};
      col++;
    }
    if (anchor_index == n) {
      // insertion point one past the last character
      if (col >= cols) {
        out.lines.push_back(std::move(line));
        line = continuation_line(id, text_col, cols);
        col = text_col;
      }
      out.anchor = Point{static_cast<int>(out.lines.size()), col};
    }
  }
  out.lines.push_back(std::move(line));
}

OutlineLayout layout_outline(const Tree& tree, int cols, const RenderRequest& req) {
  OutlineLayout out;
  if (cols < 3) return out; // no room for marker + one text cell
  // document order with an explicit stack; depth is unbounded under repeated >>
  std::vector<std::pair<int, int>> stack; // (id, depth)
  const auto& top = tree.children_of(tree.root_id());
  for (auto it = top.rbegin(); it != top.rend(); ++it) stack.emplace_back(*it, 0);
  while (!stack.empty()) {
    auto [id, depth] = stack.back();
    stack.pop_back();
    layout_bullet(tree, id, depth, cols, req, out);
    const auto& kids = tree.children_of(id);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.emplace_back(*it, depth + 1);
  }
  return out;
}

static std::string cell_glyph(const Tree& tree, const Cell& cell, const std::string& bullet) {
  switch (cell.kind) {
    case CellKind::Bullet: return bullet;
    case CellKind::Text: return std::string(1, tree.content(cell.id)[cell.offset]);
    default: return " ";
  }
}

static void render_status(ITerminal& term, int row, int cols, const RenderRequest& req) {
  std::string left;
  if (req.mode == Mode::Command) left = ":" + req.cmdline;
  else left = req.mode == Mode::Insert ? "INSERT" : "NORMAL";
  std::string line(static_cast<size_t>(std::max(0, cols)), ' ');
  line.replace(0, std::min(line.size(), left.size()), left.substr(0, line.size()));
  if (req.mode != Mode::Command && !req.message.empty()) {
    std::string msg = req.message.substr(0, std::max(0, cols - (int)left.size() - 2));
    if (!msg.empty()) line.replace(line.size() - msg.size(), msg.size(), msg);
  }
  term.draw_colored(row, 0, line, kColorStatus);
}

RenderResult Renderer::render(ITerminal& term, const Tree& tree, Viewport& vp, const RenderRequest& req) {
  TermSize sz = term.get_size();
  int rows = std::max(0, sz.rows), cols = std::max(0, sz.cols);
  int text_rows = req.show_status ? std::max(0, rows - 1) : rows;
  OutlineLayout layout = layout_outline(tree, cols, req);
  int total = static_cast<int>(layout.lines.size());

  if (req.follow_active && layout.anchor && text_rows > 0) {
    if (layout.anchor->row < vp.top_line) vp.top_line = layout.anchor->row;
    if (layout.anchor->row >= vp.top_line + text_rows) vp.top_line = layout.anchor->row - text_rows + 1;
  }
  vp.top_line = std::clamp(vp.top_line, 0, std::max(0, total - 1));

  RenderResult result{Raster(text_rows, cols), std::nullopt, total};
  term.clear();
  for (int i = 0; i < text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= total) break;
    const auto& line = layout.lines[line_idx];
    std::string s;
    int bullet_col = -1;
    for (int c = 0; c < cols; ++c) {
      if (result.raster.set({i, c}, line[c])) break;
      if (line[c].kind == CellKind::Bullet) bullet_col = c;
      s += cell_glyph(tree, line[c], req.bullet_glyph);
    }
    term.draw_text(i, 0, s);
    if (bullet_col >= 0) term.draw_colored(i, bullet_col, req.bullet_glyph, kColorBullet);
  }
  if (layout.anchor) {
    Point screen{layout.anchor->row - vp.top_line, layout.anchor->col};
    if (result.raster.in_bounds(screen)) result.anchor = screen;
  }
  if (req.show_status && rows > 0) render_status(term, rows - 1, cols, req);

  if (req.mode == Mode::Command && req.show_status && rows > 0) {
    term.move_cursor(rows - 1, std::min(cols - 1, 1 + (int)req.cmdline.size()));
  } else if (auto cur = req.cursor ? req.cursor : result.anchor) {
    term.move_cursor(cur->row, cur->col);
  }
  term.refresh();
  return result;
}
