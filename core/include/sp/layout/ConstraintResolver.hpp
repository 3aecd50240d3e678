#pragma once
#include <cstdint>

namespace sp {

// Which region keeps its minimum when both minimums cannot fit.
enum class OverflowPolicy : std::uint8_t {
  FavorStart = 0,
  FavorEnd,
  Proportional
};

// What to do when the main-axis extent is unbounded or not positive.
enum class UnboundedPolicy : std::uint8_t {
  FlexExpand = 0,  // equal split, no divider
  LimitedBox       // lay out inside fallbackExtent
};

struct ConstraintConfig {
  double minRatio{0.0};
  double maxRatio{1.0};
  double minStartPixels{0.0};
  double minEndPixels{0.0};
  OverflowPolicy overflowPolicy{OverflowPolicy::FavorStart};
  bool pixelSnap{false};  // floor the start extent to whole pixels
};

struct RatioBounds {
  double lo{0.0};
  double hi{1.0};
  bool cramped{false};  // lo > hi
};

struct ResolvedSplit {
  double ratio{0.0};
  double firstExtent{0.0};
  double secondExtent{0.0};
  bool cramped{false};
};

struct ExtentResolution {
  double extent{0.0};  // space left for the two regions
  bool bounded{true};  // false: caller should fall back to an equal split
};

// Effective ratio range for the given geometry (minimums clamped to extent).
RatioBounds computeBounds(double extent, const ConstraintConfig& cfg);

// Maps any ratio onto the legal ratio for this geometry, applying the
// overflow policy when cramped. Without geometry (extent <= 0) only the
// ratio bounds apply.
double clampToBounds(double ratio, double extent, const ConstraintConfig& cfg);

// Ratio plus available extent -> legal pixel split. Pure and deterministic.
ResolvedSplit resolveSplit(double ratio, double extent, const ConstraintConfig& cfg);

// Main-axis size minus divider thickness, honouring the unbounded policy.
ExtentResolution availableExtent(double mainAxisMax, double dividerThickness,
                                 UnboundedPolicy policy, double fallbackExtent);

// Two equal halves of whatever extent the parent assigns once the main axis
// turns out to be unbounded. No divider is shown in that mode.
ResolvedSplit equalSplit(double assignedExtent);

const char* overflowPolicyName(OverflowPolicy p);
bool parseOverflowPolicy(const char* name, OverflowPolicy& out);
const char* unboundedPolicyName(UnboundedPolicy p);
bool parseUnboundedPolicy(const char* name, UnboundedPolicy& out);

} // namespace sp
