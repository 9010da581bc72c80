#include "input.hpp"

static bool consume_double(bool& pending, int ch, int key) {
  if (ch != key) return false;
  if (pending) { pending = false; return true; }
  pending = true;
  return false;
}

bool Input::consume_dd(int ch) { return consume_double(pending_d_, ch, 'd'); }

bool Input::consume_gg(int ch) { return consume_double(pending_g_, ch, 'g'); }

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
    return true;
  }
  return false;
}

size_t Input::take_count() {
  size_t c = pending_count_ == 0 ? 1 : pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_d_ = false;
  pending_g_ = false;
}
