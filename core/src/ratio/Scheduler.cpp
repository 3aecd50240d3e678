#include "sp/ratio/Scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace sp {

TimerId Scheduler::schedulePeriodic(std::int64_t intervalMicros,
                                    std::function<void()> tick) {
  Timer t;
  t.id = nextId_++;
  t.interval = std::max<std::int64_t>(1, intervalMicros);
  t.nextDue = nowMicros() + t.interval;
  t.tick = std::move(tick);
  timers_.push_back(std::move(t));
  return timers_.back().id;
}

void Scheduler::cancel(TimerId id) {
  int idx = findIndex(id);
  if (idx >= 0) timers_.erase(timers_.begin() + idx);
}

bool Scheduler::isActive(TimerId id) const {
  return findIndex(id) >= 0;
}

std::size_t Scheduler::activeTimerCount() const {
  return timers_.size();
}

bool Scheduler::earliestDue(std::int64_t& out) const {
  if (timers_.empty()) return false;
  out = timers_.front().nextDue;
  for (const auto& t : timers_) out = std::min(out, t.nextDue);
  return true;
}

int Scheduler::findIndex(TimerId id) const {
  for (std::size_t i = 0; i < timers_.size(); i++) {
    if (timers_[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

void Scheduler::runDue(std::int64_t now, bool catchUp) {
  // Timers fired during this pass when catchUp is off.
  std::vector<TimerId> fired;

  for (;;) {
    // Earliest due timer first (ties: creation order).
    int best = -1;
    std::int64_t bestDue = std::numeric_limits<std::int64_t>::max();
    for (std::size_t i = 0; i < timers_.size(); i++) {
      const auto& t = timers_[i];
      if (t.nextDue > now || t.nextDue >= bestDue) continue;
      if (!catchUp && std::find(fired.begin(), fired.end(), t.id) != fired.end()) continue;
      best = static_cast<int>(i);
      bestDue = t.nextDue;
    }
    if (best < 0) break;

    TimerId id = timers_[best].id;
    timers_[best].nextDue += timers_[best].interval;
    fired.push_back(id);

    // The callback may cancel this timer or schedule new ones.
    auto tick = timers_[best].tick;
    tick();
  }
}

void ManualScheduler::advance(std::int64_t micros) {
  if (micros <= 0) return;
  std::int64_t target = now_ + micros;

  // Step the clock to each due tick so nowMicros() is exact inside callbacks.
  std::int64_t due = 0;
  while (earliestDue(due) && due <= target) {
    now_ = std::max(now_, due);
    runDue(now_, true);
  }
  now_ = target;
}

std::int64_t SteadyScheduler::nowMicros() const {
  using namespace std::chrono;
  return duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
}

void SteadyScheduler::pump() {
  runDue(nowMicros(), false);
}

} // namespace sp
