#pragma once
#include "sp/input/InputEvent.hpp"

#include <vector>

namespace sp {

class RatioStore;

// Process-wide drag registry. The host owns one instance and feeds it every
// pointer event it sees, including events delivered to foreign surfaces that
// never reach the divider. An Up/Cancel for the registered pointer id ends
// the drag through RatioStore::stopDrag().
class PointerRouter {
public:
  PointerRouter() = default;
  ~PointerRouter();

  PointerRouter(const PointerRouter&) = delete;
  PointerRouter& operator=(const PointerRouter&) = delete;

  void init();
  void teardown();
  bool isInitialized() const { return initialized_; }

  // Drops all state, including store registrations. For tests.
  void resetForTesting();

  // Lazily initialises the router.
  void registerStore(RatioStore* store);
  void unregisterStore(RatioStore* store);
  bool isRegistered(const RatioStore* store) const;

  // Supersedes any previous registration without stopping it.
  // pointerId < 0 means the pointer is not tracked precisely.
  void setDragging(RatioStore* store, int pointerId);
  void clearDragging();
  void clearDragging(const RatioStore* store);

  // Returns true if the event terminated a drag.
  bool handleGlobalEvent(const PointerEvent& ev);

  RatioStore* currentDragger() const { return currentDragger_; }
  int activePointerId() const { return activePointerId_; }

private:
  bool initialized_{false};
  RatioStore* currentDragger_{nullptr};
  int activePointerId_{-1};
  std::vector<RatioStore*> stores_;
};

} // namespace sp
