#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Model: one UTF-8 sequence per screen cell; draws past the right edge are clipped.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  std::string row_text(int row) const;
  std::string cell(int row, int col) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }
  int last_color_pair() const { return last_color_pair_; }

private:
  int rows_;
  int cols_;
  std::vector<std::vector<std::string>> screen_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
  int last_color_pair_ = 0;
};
