#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace sp {

using SubscriptionId = std::uint32_t;

// Typed, ordered observer list. Handlers run in subscription order; a handler
// added or removed while emitting takes effect on the next emit.
template <typename T>
class EventEmitter {
public:
  using Handler = std::function<void(T)>;

  SubscriptionId subscribe(Handler fn) {
    if (!fn) return 0;
    SubscriptionId id = nextId_++;
    handlers_.push_back({id, std::move(fn)});
    return id;
  }

  void unsubscribe(SubscriptionId id) {
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
      if (it->first == id) {
        handlers_.erase(it);
        return;
      }
    }
  }

  void emit(T value) const {
    auto snapshot = handlers_;
    for (auto& h : snapshot) h.second(value);
  }

  std::size_t size() const { return handlers_.size(); }
  void clear() { handlers_.clear(); }

private:
  std::vector<std::pair<SubscriptionId, Handler>> handlers_;
  SubscriptionId nextId_{1};
};

// Notifications produced by one divider. Every event carries a ratio.
struct SplitterEvents {
  EventEmitter<double> dragStart;
  EventEmitter<double> dragEnd;
  EventEmitter<double> ratioChanged;
  EventEmitter<double> handleTap;
  EventEmitter<double> handleDoubleTap;

  void clear() {
    dragStart.clear();
    dragEnd.clear();
    ratioChanged.clear();
    handleTap.clear();
    handleDoubleTap.clear();
  }
};

} // namespace sp
