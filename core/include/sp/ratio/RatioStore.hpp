#pragma once
#include "sp/ids/Id.hpp"
#include "sp/ratio/Completion.hpp"
#include "sp/ratio/Easing.hpp"
#include "sp/ratio/Scheduler.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace sp {

class PointerRouter;

using ListenerId = std::uint32_t;

inline constexpr double kDefaultUpdateThreshold = 0.002;
inline constexpr std::int64_t kDefaultInterpolationMicros = 160000;
inline constexpr int kDefaultInterpolationSteps = 12;

// Holds the split ratio in [0,1] plus a separate dragging flag.
// Observers are notified in mutation order, after the new value is stored.
class RatioStore {
public:
  // Throws std::invalid_argument when initialRatio is outside [0,1].
  explicit RatioStore(double initialRatio = 0.5, bool tolerateReattach = false);
  ~RatioStore();

  RatioStore(const RatioStore&) = delete;
  RatioStore& operator=(const RatioStore&) = delete;

  double value() const { return value_; }
  bool isDragging() const { return dragging_; }

  // Clamps to [0,1]; applies only if the change exceeds threshold.
  // Returns true if the stored value changed.
  bool update(double ratio, double threshold = kDefaultUpdateThreshold);

  // Unconditional set. Throws std::invalid_argument when `to` is outside [0,1].
  void reset(double to = 0.5);

  // Tween to target over `steps` evenly spaced ticks of the attached
  // scheduler. Any running interpolation is cancelled and its completion
  // resolved first. Commits immediately without a scheduler.
  Completion interpolateTo(double target,
                           std::int64_t durationMicros = kDefaultInterpolationMicros,
                           EasingFn ease = easing::easeOut,
                           int steps = kDefaultInterpolationSteps);
  void cancelInterpolation();
  bool isInterpolating() const { return timer_ != 0; }

  void setScheduler(Scheduler* scheduler);
  Scheduler* scheduler() const { return scheduler_; }

  void setDragging(bool dragging);

  ListenerId addListener(std::function<void(double)> fn);
  void removeListener(ListenerId id);
  ListenerId addDraggingListener(std::function<void(bool)> fn);
  void removeDraggingListener(ListenerId id);
  std::size_t listenerCount() const { return listeners_.size(); }

  // Attachment to a single splitter. A second, different token throws
  // std::logic_error unless the store tolerates re-attachment.
  void attach(AttachToken token);
  void detach(AttachToken token);
  AttachToken owner() const { return owner_; }
  bool tolerateReattach() const { return tolerateReattach_; }

  // Hook used by PointerRouter to end an orphaned drag.
  void setStopDragCallback(std::function<void()> cb);
  bool hasStopDragCallback() const { return static_cast<bool>(stopDrag_); }
  void stopDrag();

  // Cancels interpolation, leaves the router, drops observers.
  // Later mutations are ignored.
  void dispose();
  bool isDisposed() const { return disposed_; }

private:
  friend class PointerRouter;

  struct ValueListener {
    ListenerId id;
    std::function<void(double)> fn;
  };
  struct DraggingListener {
    ListenerId id;
    std::function<void(bool)> fn;
  };

  double value_{0.5};
  bool dragging_{false};
  bool disposed_{false};
  bool tolerateReattach_{false};
  AttachToken owner_{kInvalidId};

  std::vector<ValueListener> listeners_;
  std::vector<DraggingListener> draggingListeners_;
  ListenerId nextListenerId_{1};

  Scheduler* scheduler_{nullptr};
  TimerId timer_{0};
  Completion pending_{Completion::resolved()};
  double interpStart_{0};
  double interpGoal_{0};
  int interpSteps_{0};
  int interpStep_{0};
  EasingFn interpEase_;

  std::function<void()> stopDrag_;
  PointerRouter* router_{nullptr};

  void onInterpolationTick();
  void setValue(double v);
  void notifyValue();
};

} // namespace sp
