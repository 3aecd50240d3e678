#pragma once
#include "sp/input/InputEvent.hpp"
#include "sp/layout/ConstraintResolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sp {

// Shared numeric defaults, layered under per-splitter values.
struct SplitterDefaults {
  double dividerThickness{6.0};
  double handleHitSlop{0.0};
  bool overlayEnabled{true};
  bool enableKeyboard{true};
  double keyboardStep{0.01};
  double pageStep{0.1};
  UnboundedPolicy unboundedPolicy{UnboundedPolicy::FlexExpand};
  double fallbackExtent{500.0};
  bool pixelSnap{false};
};

struct SplitterConfig {
  Axis axis{Axis::Horizontal};
  double initialRatio{0.5};
  double minRatio{0.0};
  double maxRatio{1.0};

  // Shared fallback; an unset per-side value uses minPanelSize.
  double minPanelSize{100.0};
  std::optional<double> minStartPanelSize;
  std::optional<double> minEndPanelSize;

  double dividerThickness{6.0};
  bool enableKeyboard{true};
  double keyboardStep{0.01};
  double pageStep{0.1};

  std::vector<double> snapPoints;
  double snapTolerance{0.02};

  OverflowPolicy overflowPolicy{OverflowPolicy::FavorStart};
  bool resizable{true};
  double handleHitSlop{0.0};
  std::optional<double> doubleTapResetTo;  // unset disables
  bool pixelSnap{false};
  UnboundedPolicy unboundedPolicy{UnboundedPolicy::FlexExpand};
  double fallbackExtent{500.0};
  bool overlayEnabled{true};
  bool holdScrollWhileDragging{false};

  double updateThreshold{0.002};
  bool tolerateReattach{false};

  double effectiveMinStart() const {
    return minStartPanelSize.value_or(minPanelSize);
  }
  double effectiveMinEnd() const {
    return minEndPanelSize.value_or(minPanelSize);
  }

  ConstraintConfig constraints() const;
};

// Which fields of a SplitterConfig were set explicitly; the rest come from
// SplitterDefaults in resolveConfig().
struct SplitterOverrides {
  bool dividerThickness{false};
  bool handleHitSlop{false};
  bool overlayEnabled{false};
  bool enableKeyboard{false};
  bool keyboardStep{false};
  bool pageStep{false};
  bool unboundedPolicy{false};
  bool fallbackExtent{false};
  bool pixelSnap{false};
};

SplitterConfig resolveConfig(const SplitterConfig& cfg, const SplitterOverrides& set,
                             const SplitterDefaults& defaults);

struct ConfigError {
  std::string code;     // e.g. "CONFIG_RATIO_BOUNDS"
  std::string message;
};

// Returns false and fills `err` on the first invalid field.
bool validateSplitterConfig(const SplitterConfig& cfg, ConfigError& err);

// Reads the JSON schema written by serializeSplitterConfig(). Absent members
// keep their current values in `out`. `set` records the members present.
bool parseSplitterConfig(const std::string& json, SplitterConfig& out,
                         SplitterOverrides& set, ConfigError& err);
bool parseSplitterConfig(const std::string& json, SplitterConfig& out, ConfigError& err);

bool parseSplitterDefaults(const std::string& json, SplitterDefaults& out, ConfigError& err);

std::string serializeSplitterConfig(const SplitterConfig& cfg);

} // namespace sp
