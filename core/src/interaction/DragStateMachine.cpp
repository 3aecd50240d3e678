#include "sp/interaction/DragStateMachine.hpp"
#include "sp/interaction/SnapEngine.hpp"
#include "sp/pointer/PointerRouter.hpp"
#include "sp/ratio/RatioStore.hpp"

#include <algorithm>
#include <cmath>

namespace sp {

namespace {

// Max squared distance between a pending pointer and the drag origin for the
// two to be considered the same contact.
constexpr double kPointerMatchToleranceSq = 16.0;

} // namespace

const char* dragStateName(DragState s) {
  switch (s) {
    case DragState::Armed: return "armed";
    case DragState::Dragging: return "dragging";
    case DragState::Idle:
    default: return "idle";
  }
}

DragStateMachine::DragStateMachine(RatioStore& store, PointerRouter& router,
                                   SplitterEvents& events, SplitterHost* host)
  : store_(&store), router_(router), events_(events), host_(host) {}

DragStateMachine::~DragStateMachine() {
  dispose();
}

void DragStateMachine::setOptions(const DragOptions& opts) {
  opts_ = opts;
  if (!opts_.resizable) pending_.clear();
}

void DragStateMachine::setGeometry(const DragGeometry& geom) {
  geom_ = geom;
  if (!hasHandle()) pending_.clear();
}

void DragStateMachine::setStore(RatioStore& store) {
  if (&store == store_) return;
  stopDrag();
  store_ = &store;
}

bool DragStateMachine::pointerDown(const PointerEvent& ev) {
  if (disposed_ || !opts_.resizable || dragging_) return false;

  bool primaryMouse = ev.kind == PointerKind::Mouse && ev.buttons == kPrimaryButton;
  bool touchLike = ev.kind != PointerKind::Mouse && isSupportedPointerKind(ev.kind);
  if (!primaryMouse && !touchLike) return false;
  if (!hitTest(ev.x, ev.y)) return false;

  removePending(ev.pointerId);
  pending_.push_back({ev.pointerId, ev.x, ev.y});
  return true;
}

void DragStateMachine::pointerMove(const PointerEvent& ev) {
  if (dragging_) return;
  for (auto& p : pending_) {
    if (p.id == ev.pointerId) {
      p.x = ev.x;
      p.y = ev.y;
      break;
    }
  }
}

void DragStateMachine::pointerUp(const PointerEvent& ev) {
  removePending(ev.pointerId);
}

void DragStateMachine::pointerCancel(const PointerEvent& ev) {
  removePending(ev.pointerId);
}

void DragStateMachine::globalPointer(const PointerEvent& ev) {
  if (!dragging_ || activePointer_ < 0 || ev.pointerId != activePointer_) return;
  if (ev.phase != PointerPhase::Up && ev.phase != PointerPhase::Cancel) return;
  if (router_.currentDragger() == store_ && router_.activePointerId() == activePointer_) {
    return;  // the router owns this termination
  }
  stopDrag();
}

bool DragStateMachine::dragStart(double x, double y, PointerKind kind) {
  if (disposed_ || !opts_.resizable || dragging_) return false;
  if (!isSupportedPointerKind(kind) || !hasHandle()) return false;

  dragging_ = true;
  store_->setDragging(true);

  startRatio_ = store_->value();
  startPosition_ = mainAxisOf(opts_.axis, x, y);

  activePointer_ = takePendingPointer(x, y);
  router_.setDragging(store_, activePointer_);
  store_->setStopDragCallback([this]() { stopDrag(); });

  if (opts_.holdScrollWhileDragging && host_) {
    if (scrollHold_ != 0) host_->releaseScrollHold(scrollHold_);
    scrollHold_ = host_->acquireScrollHold();
  }
  if (opts_.overlayEnabled && host_ && overlay_ == 0) {
    overlay_ = host_->insertOverlay(opts_.axis);
  }

  if (host_) {
    host_->hapticTick();
    host_->requestFocus();
  }
  events_.dragStart.emit(store_->value());
  return true;
}

bool DragStateMachine::dragUpdate(double x, double y) {
  if (!dragging_ || !(geom_.extent > 0.0)) return false;

  double delta = mainAxisOf(opts_.axis, x, y) - startPosition_;
  double proposed = startRatio_ + delta / geom_.extent;
  double clamped = clampToBounds(proposed, geom_.extent, geom_.constraints);

  double previous = store_->value();
  store_->update(clamped, opts_.updateThreshold);
  if (std::fabs(store_->value() - previous) > 1e-9) {
    events_.ratioChanged.emit(store_->value());
    return true;
  }
  return false;
}

void DragStateMachine::dragEnd() {
  stopDrag();
}

void DragStateMachine::dragCancel() {
  stopDrag();
}

void DragStateMachine::stopDrag() {
  if (!dragging_) return;
  endSession(!disposed_);
}

void DragStateMachine::endSession(bool emitEnd) {
  double result = store_->value();
  if (emitEnd) {
    double snapped = 0.0;
    bool changed = false;
    if (applySnap(*store_, opts_.snapPoints, opts_.snapTolerance, geom_.extent,
                  geom_.constraints, snapped, changed)) {
      result = snapped;
      if (changed) events_.ratioChanged.emit(store_->value());
    } else {
      result = store_->value();
    }
  }

  dragging_ = false;
  store_->setDragging(false);
  store_->setStopDragCallback(nullptr);
  router_.clearDragging(store_);
  releaseSideEffects();

  startPosition_ = 0.0;
  startRatio_ = 0.0;
  if (activePointer_ >= 0) removePending(activePointer_);
  activePointer_ = -1;

  if (emitEnd) events_.dragEnd.emit(result);
}

void DragStateMachine::releaseSideEffects() {
  if (host_ && overlay_ != 0) host_->removeOverlay(overlay_);
  overlay_ = 0;
  if (host_ && scrollHold_ != 0) host_->releaseScrollHold(scrollHold_);
  scrollHold_ = 0;
}

void DragStateMachine::tap() {
  if (disposed_) return;
  events_.handleTap.emit(store_->value());
}

Completion DragStateMachine::doubleTap() {
  if (disposed_) return Completion::resolved();

  events_.handleDoubleTap.emit(store_->value());
  if (!opts_.doubleTapResetTo || !opts_.resizable) return Completion::resolved();

  double startValue = store_->value();
  Completion done = store_->interpolateTo(*opts_.doubleTapResetTo);

  std::weak_ptr<bool> guard = alive_;
  done.then([this, guard, startValue]() {
    if (guard.expired()) return;
    double updated = store_->value();
    if (std::fabs(updated - startValue) > 1e-9) events_.ratioChanged.emit(updated);
  });
  return done;
}

bool DragStateMachine::hasHandle() const {
  return geom_.extent > 0.0;
}

bool DragStateMachine::hitTest(double x, double y) const {
  if (!hasHandle()) return false;
  double main = mainAxisOf(opts_.axis, x, y);
  double slop = std::max(0.0, opts_.hitSlop);
  return main >= geom_.handleStart - slop &&
         main <= geom_.handleStart + geom_.thickness + slop;
}

DragState DragStateMachine::state() const {
  if (dragging_) return DragState::Dragging;
  if (!pending_.empty()) return DragState::Armed;
  return DragState::Idle;
}

HandleDetails DragStateMachine::handleDetails() const {
  HandleDetails d;
  d.isDragging = dragging_;
  d.isHovering = hovering_;
  d.isFocused = focused_;
  d.axis = opts_.axis;
  d.thickness = geom_.thickness;
  d.resizable = opts_.resizable;
  return d;
}

void DragStateMachine::dispose() {
  if (disposed_) return;
  disposed_ = true;
  alive_.reset();
  if (dragging_) endSession(false);
  if (store_->hasStopDragCallback()) store_->setStopDragCallback(nullptr);
  releaseSideEffects();
  pending_.clear();
}

int DragStateMachine::takePendingPointer(double x, double y) {
  if (pending_.empty()) return -1;

  // Newest contact near the recognised origin, else the oldest contact.
  std::size_t matchIndex = 0;
  for (std::size_t i = pending_.size(); i-- > 0;) {
    double dx = pending_[i].x - x;
    double dy = pending_[i].y - y;
    if (dx * dx + dy * dy <= kPointerMatchToleranceSq) {
      matchIndex = i;
      break;
    }
  }

  int id = pending_[matchIndex].id;
  pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(matchIndex));
  return id;
}

void DragStateMachine::removePending(int pointerId) {
  pending_.erase(
    std::remove_if(pending_.begin(), pending_.end(),
                   [pointerId](const PendingPointer& p) { return p.id == pointerId; }),
    pending_.end());
}

} // namespace sp
