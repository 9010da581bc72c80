#pragma once
/*
 * IdleTimers
 *
 * Purpose: one-shot timers that fire only while the command loop is idle.
 * Usage: the loop waits for input at most time_until_next(); when the wait
 *        times out it calls fire_due(). The clock is injectable for tests.
 */
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

using TimerId = std::uint64_t;

class IdleTimers {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  IdleTimers();
  explicit IdleTimers(NowFn now);

  TimerId schedule(Clock::duration delay, std::function<void(TimerId)> fn);
  bool cancel(TimerId id);
  /* runs every timer whose deadline has passed; returns how many ran */
  size_t fire_due();
  std::optional<Clock::duration> time_until_next() const;
  size_t pending() const { return entries_.size(); }

private:
  struct Entry {
    TimerId id;
    Clock::time_point deadline;
    std::function<void(TimerId)> fn;
  };
  NowFn now_;
  std::vector<Entry> entries_;
  TimerId next_id_ = 1;
};
