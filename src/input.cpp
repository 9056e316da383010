#include "input.hpp"

static constexpr int kMaxCount = 9999;

bool Input::consume_pair(int ch) {
  if (pending_key_ == ch) { pending_key_ = 0; return true; }
  pending_key_ = ch;
  return false;
}

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + (ch - '0');
  } else if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
  } else {
    return false;
  }
  if (pending_count_ > kMaxCount) pending_count_ = kMaxCount;
  return true;
}

int Input::take_count() {
  int c = pending_count_ > 0 ? pending_count_ : 1;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_key_ = 0;
  pending_count_ = 0;
}
