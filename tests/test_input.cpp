#include "input.hpp"
#include <cassert>

int main() {
  Input in;
  assert(!in.consume_dd('d'));
  assert(in.consume_dd('d'));
  assert(!in.consume_dd('d'));
  in.reset();
  assert(!in.consume_dd('d'));

  assert(!in.consume_gg('g'));
  assert(in.consume_gg('g'));

  assert(!in.has_count() && in.take_count() == 1);
  assert(!in.consume_digit('0'));
  assert(in.consume_digit('1'));
  assert(in.consume_digit('0'));
  assert(in.has_count());
  assert(in.take_count() == 10);
  assert(!in.has_count());
  return 0;
}
