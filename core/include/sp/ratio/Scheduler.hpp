#pragma once
#include <cstdint>
#include <functional>
#include <vector>

namespace sp {

using TimerId = std::uint64_t;

// Cooperative periodic timer source. Nothing here blocks: ticks run when the
// owner advances time (ManualScheduler) or pumps the queue (SteadyScheduler).
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual std::int64_t nowMicros() const = 0;

  // Tick fires every intervalMicros (>= 1) until cancelled.
  TimerId schedulePeriodic(std::int64_t intervalMicros, std::function<void()> tick);
  void cancel(TimerId id);

  bool isActive(TimerId id) const;
  std::size_t activeTimerCount() const;

protected:
  // Fire every timer due at or before `now`. With catchUp, a timer that is
  // several intervals behind fires once per missed interval, in time order.
  void runDue(std::int64_t now, bool catchUp);

  // Due time of the next tick across all timers. False when none are active.
  bool earliestDue(std::int64_t& out) const;

private:
  struct Timer {
    TimerId id{0};
    std::int64_t interval{1};
    std::int64_t nextDue{0};
    std::function<void()> tick;
  };

  std::vector<Timer> timers_;
  TimerId nextId_{1};

  int findIndex(TimerId id) const;
};

// Deterministic clock for tests: time only moves through advance().
class ManualScheduler : public Scheduler {
public:
  std::int64_t nowMicros() const override { return now_; }

  // Moves the clock forward, firing each due tick at its own timestamp.
  void advance(std::int64_t micros);

private:
  std::int64_t now_{0};
};

// Wall-clock scheduler driven by the host event loop.
class SteadyScheduler : public Scheduler {
public:
  std::int64_t nowMicros() const override;

  // Fire due timers once each. Call once per host loop iteration.
  void pump();
};

} // namespace sp
