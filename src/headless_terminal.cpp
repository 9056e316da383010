#include "headless_terminal.hpp"
#include <algorithm>

// Length of the UTF-8 sequence starting with lead byte c.
static size_t utf8_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

void HeadlessTerminal::clear() {
  screen_.assign(static_cast<size_t>(rows_), std::vector<std::string>(static_cast<size_t>(cols_), " "));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t n = utf8_len(static_cast<unsigned char>(text[i]));
    if (col >= 0) screen_[row][col] = text.substr(i, n);
    i += n;
    col++;
  }
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  last_color_pair_ = color_pair_id;
  draw_text(row, col, text);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) screen_[row][c] = " ";
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (const auto& c : screen_[row]) out += c;
  return out;
}

std::string HeadlessTerminal::cell(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return std::string();
  return screen_[row][col];
}
