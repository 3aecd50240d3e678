#pragma once
#include "sp/events/EventEmitter.hpp"
#include "sp/input/InputEvent.hpp"
#include "sp/layout/ConstraintResolver.hpp"

#include <cstdint>
#include <vector>

namespace sp {

class RatioStore;
class SplitterHost;

enum class AdjustKind : std::uint8_t { Step, Page, JumpToMin, JumpToMax };

struct AdjustIntent {
  AdjustKind kind{AdjustKind::Step};
  int direction{1};  // +1 grows the start region, -1 shrinks it (Step/Page only)
};

// Arrow keys along the splitter axis step, PageUp/PageDown page,
// Home/End jump. Arrows across the axis map to nothing.
bool intentForKey(KeyCode key, Axis axis, AdjustIntent& out);

struct KeyboardOptions {
  bool enabled{true};  // false when keyboard is off or the divider is fixed
  double keyboardStep{0.01};
  double pageStep{0.1};
  std::vector<double> snapPoints;
  double snapTolerance{0.02};
};

class KeyboardAdjuster {
public:
  KeyboardAdjuster(RatioStore& store, SplitterEvents& events, SplitterHost* host);

  void setOptions(const KeyboardOptions& opts) { opts_ = opts; }
  const KeyboardOptions& options() const { return opts_; }
  void setGeometry(double extent, const ConstraintConfig& cfg);
  void setStore(RatioStore& store) { store_ = &store; }
  void setHost(SplitterHost* host) { host_ = host; }

  // Returns true if the ratio changed.
  bool apply(const AdjustIntent& intent);
  bool handleKey(KeyCode key, Axis axis);

  // Accessibility increase/decrease actions.
  bool increase() { return apply({AdjustKind::Step, 1}); }
  bool decrease() { return apply({AdjustKind::Step, -1}); }

  // Closes the adjustment session: snaps once if any intent was applied.
  bool endAdjustment();
  bool hasPendingAdjustment() const { return adjusted_; }

private:
  RatioStore* store_;
  SplitterEvents& events_;
  SplitterHost* host_;
  KeyboardOptions opts_;
  double extent_{0.0};
  ConstraintConfig constraints_;
  bool adjusted_{false};
};

} // namespace sp
