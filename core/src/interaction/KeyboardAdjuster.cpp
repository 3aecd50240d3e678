#include "sp/interaction/KeyboardAdjuster.hpp"
#include "sp/interaction/SnapEngine.hpp"
#include "sp/interaction/SplitterHost.hpp"
#include "sp/ratio/RatioStore.hpp"

#include <cmath>

namespace sp {

bool intentForKey(KeyCode key, Axis axis, AdjustIntent& out) {
  bool horizontal = axis == Axis::Horizontal;
  switch (key) {
    case KeyCode::Left:
      if (!horizontal) return false;
      out = {AdjustKind::Step, -1};
      return true;
    case KeyCode::Right:
      if (!horizontal) return false;
      out = {AdjustKind::Step, 1};
      return true;
    case KeyCode::Up:
      if (horizontal) return false;
      out = {AdjustKind::Step, -1};
      return true;
    case KeyCode::Down:
      if (horizontal) return false;
      out = {AdjustKind::Step, 1};
      return true;
    case KeyCode::PageUp:
      out = {AdjustKind::Page, -1};
      return true;
    case KeyCode::PageDown:
      out = {AdjustKind::Page, 1};
      return true;
    case KeyCode::Home:
      out = {AdjustKind::JumpToMin, 0};
      return true;
    case KeyCode::End:
      out = {AdjustKind::JumpToMax, 0};
      return true;
    case KeyCode::None:
    default:
      return false;
  }
}

KeyboardAdjuster::KeyboardAdjuster(RatioStore& store, SplitterEvents& events,
                                   SplitterHost* host)
  : store_(&store), events_(events), host_(host) {}

void KeyboardAdjuster::setGeometry(double extent, const ConstraintConfig& cfg) {
  extent_ = extent;
  constraints_ = cfg;
}

bool KeyboardAdjuster::apply(const AdjustIntent& intent) {
  if (!opts_.enabled || store_->isDisposed()) return false;

  const double previous = store_->value();
  double target = previous;
  switch (intent.kind) {
    case AdjustKind::Step:
      target = previous + intent.direction * opts_.keyboardStep;
      break;
    case AdjustKind::Page:
      target = previous + intent.direction * opts_.pageStep;
      break;
    case AdjustKind::JumpToMin:
      target = constraints_.minRatio;
      break;
    case AdjustKind::JumpToMax:
      target = constraints_.maxRatio;
      break;
  }

  store_->update(clampToBounds(target, extent_, constraints_), 0.0);
  adjusted_ = true;

  bool changed = std::fabs(store_->value() - previous) > 1e-9;
  if (changed) events_.ratioChanged.emit(store_->value());
  if (host_) host_->hapticTick();
  return changed;
}

bool KeyboardAdjuster::handleKey(KeyCode key, Axis axis) {
  AdjustIntent intent;
  if (!intentForKey(key, axis, intent)) return false;
  return apply(intent);
}

bool KeyboardAdjuster::endAdjustment() {
  if (!adjusted_) return false;
  adjusted_ = false;
  if (!opts_.enabled) return false;

  double snapped = 0.0;
  bool changed = false;
  if (!applySnap(*store_, opts_.snapPoints, opts_.snapTolerance, extent_, constraints_,
                 snapped, changed)) {
    return false;
  }
  if (changed) events_.ratioChanged.emit(store_->value());
  return true;
}

} // namespace sp
