#pragma once
#include "sp/events/EventEmitter.hpp"
#include "sp/input/InputEvent.hpp"
#include "sp/interaction/SplitterHost.hpp"
#include "sp/layout/ConstraintResolver.hpp"
#include "sp/ratio/Completion.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sp {

class PointerRouter;
class RatioStore;

// States: Idle -> Armed (pending pointers on the handle) -> Dragging -> Idle
enum class DragState : std::uint8_t { Idle = 0, Armed, Dragging };

const char* dragStateName(DragState s);

struct DragOptions {
  Axis axis{Axis::Horizontal};
  bool resizable{true};
  bool overlayEnabled{true};
  bool holdScrollWhileDragging{false};
  double hitSlop{0.0};            // extra grab band on each side of the handle
  std::vector<double> snapPoints;
  double snapTolerance{0.02};
  std::optional<double> doubleTapResetTo;  // unset disables
  double updateThreshold{0.002};
};

// Current layout as seen by the handle, in global main-axis pixels.
struct DragGeometry {
  double extent{0.0};       // available extent (thickness already removed)
  double handleStart{0.0};  // leading edge of the divider
  double thickness{0.0};
  ConstraintConfig constraints;
};

// Snapshot handed to custom handle painters.
struct HandleDetails {
  bool isDragging{false};
  bool isHovering{false};
  bool isFocused{false};
  Axis axis{Axis::Horizontal};
  double thickness{0.0};
  bool resizable{true};
};

class DragStateMachine {
public:
  DragStateMachine(RatioStore& store, PointerRouter& router, SplitterEvents& events,
                   SplitterHost* host);
  ~DragStateMachine();

  DragStateMachine(const DragStateMachine&) = delete;
  DragStateMachine& operator=(const DragStateMachine&) = delete;

  void setOptions(const DragOptions& opts);
  const DragOptions& options() const { return opts_; }
  // Without a positive extent there is no handle; pending contacts are dropped.
  void setGeometry(const DragGeometry& geom);
  const DragGeometry& geometry() const { return geom_; }
  void setHost(SplitterHost* host) { host_ = host; }

  // Force-stops any active drag on the old store first.
  void setStore(RatioStore& store);

  // Raw pointer stream delivered to the handle.
  bool pointerDown(const PointerEvent& ev);
  void pointerMove(const PointerEvent& ev);
  void pointerUp(const PointerEvent& ev);
  void pointerCancel(const PointerEvent& ev);

  // Pointer events seen anywhere in the window. Stops this drag if its own
  // pointer ends while the router no longer tracks it.
  void globalPointer(const PointerEvent& ev);

  // Recognised drag gesture. `x, y` are global positions.
  bool dragStart(double x, double y, PointerKind kind = PointerKind::Unknown);
  bool dragUpdate(double x, double y);
  void dragEnd();
  void dragCancel();

  // Snap, release side effects, clear flags, emit dragEnd. Idempotent.
  void stopDrag();

  void hoverEnter() { hovering_ = true; }
  void hoverExit() { hovering_ = false; }
  void focusChanged(bool focused) { focused_ = focused; }

  void tap();
  // Emits handleDoubleTap; animates to doubleTapResetTo when configured.
  Completion doubleTap();

  bool hitTest(double x, double y) const;
  bool hasHandle() const;

  DragState state() const;
  bool isDragging() const { return dragging_; }
  bool isHovering() const { return hovering_; }
  bool isFocused() const { return focused_; }
  int activePointer() const { return activePointer_; }
  std::size_t pendingPointerCount() const { return pending_.size(); }
  HandleDetails handleDetails() const;

  // Tears down without emitting dragEnd. Safe to call twice.
  void dispose();
  bool isDisposed() const { return disposed_; }

private:
  struct PendingPointer {
    int id;
    double x, y;
  };

  RatioStore* store_;
  PointerRouter& router_;
  SplitterEvents& events_;
  SplitterHost* host_;
  DragOptions opts_;
  DragGeometry geom_;

  bool dragging_{false};
  bool hovering_{false};
  bool focused_{false};
  bool disposed_{false};

  // Active session
  double startPosition_{0.0};
  double startRatio_{0.0};
  int activePointer_{-1};
  HostToken scrollHold_{0};
  HostToken overlay_{0};

  std::vector<PendingPointer> pending_;

  // Expires on dispose so late animation continuations become no-ops.
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};

  int takePendingPointer(double x, double y);
  void removePending(int pointerId);
  void releaseSideEffects();
  void endSession(bool emitEnd);
};

} // namespace sp
