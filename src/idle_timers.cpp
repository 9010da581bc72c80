#include "idle_timers.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

IdleTimers::IdleTimers() : now_([] { return Clock::now(); }) {}

IdleTimers::IdleTimers(NowFn now) : now_(std::move(now)) {}

TimerId IdleTimers::schedule(Clock::duration delay, std::function<void(TimerId)> fn) {
  TimerId id = next_id_++;
  entries_.push_back(Entry{id, now_() + delay, std::move(fn)});
  return id;
}

bool IdleTimers::cancel(TimerId id) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e){ return e.id == id; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

size_t IdleTimers::fire_due() {
  Clock::time_point now = now_();
  std::vector<Entry> due;
  auto split = std::stable_partition(entries_.begin(), entries_.end(), [now](const Entry& e){ return e.deadline > now; });
  std::move(split, entries_.end(), std::back_inserter(due));
  entries_.erase(split, entries_.end());
  std::stable_sort(due.begin(), due.end(), [](const Entry& a, const Entry& b){ return a.deadline < b.deadline; });
  // callbacks may schedule or cancel, so they run after the queue is settled
  for (auto& e : due) e.fn(e.id);
  return due.size();
}

std::optional<IdleTimers::Clock::duration> IdleTimers::time_until_next() const {
  if (entries_.empty()) return std::nullopt;
  auto it = std::min_element(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b){ return a.deadline < b.deadline; });
  Clock::duration left = it->deadline - now_();
  return std::max(left, Clock::duration::zero());
}
