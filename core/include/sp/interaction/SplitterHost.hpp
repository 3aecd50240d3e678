#pragma once
#include "sp/input/InputEvent.hpp"

#include <cstdint>

namespace sp {

// Token for a host-side resource. 0 means "none acquired".
using HostToken = std::uint64_t;

// Side effects the core asks the embedding toolkit to perform.
// Every method has a no-op default; calls are fire-and-forget.
class SplitterHost {
public:
  virtual ~SplitterHost() = default;

  // Freeze the nearest scrollable while a drag is active.
  virtual HostToken acquireScrollHold() { return 0; }
  virtual void releaseScrollHold(HostToken /*token*/) {}

  // Full-window shield above foreign surfaces so they cannot steal the drag.
  virtual HostToken insertOverlay(Axis /*axis*/) { return 0; }
  virtual void removeOverlay(HostToken /*token*/) {}

  virtual void hapticTick() {}
  virtual void requestFocus() {}
};

} // namespace sp
