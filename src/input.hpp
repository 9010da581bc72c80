#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: parse Normal mode double key prefixes (dd/gg) and count prefixes.
 * Extend: decoupled from concrete editing actions.
 */

class Input {
public:
  bool consume_dd(int ch);
  bool consume_gg(int ch);
  bool consume_digit(int ch);
  bool has_count() const { return pending_count_ > 0; }
  /* pending count, or 1 when none was typed */
  size_t take_count();
  void reset();
private:
  bool pending_d_ = false;
  bool pending_g_ = false;
  size_t pending_count_ = 0;
};
