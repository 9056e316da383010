#pragma once
/*
 * Input
 *
 * Purpose: parse Normal mode doubled-key operators (dd/yy/>>/<<) and count prefixes.
 * Extend: decoupled from concrete editing actions; Editor decides what a pair means.
 */

class Input {
public:
  // True when ch repeats the pending key; otherwise ch becomes the pending key.
  bool consume_pair(int ch);
  bool consume_digit(int ch);
  bool has_count() const { return pending_count_ > 0; }
  // Pending count, 1 when none was typed.
  int take_count();
  void reset();
private:
  int pending_key_ = 0;
  int pending_count_ = 0;
};
