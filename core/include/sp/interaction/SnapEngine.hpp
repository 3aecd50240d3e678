#pragma once
#include "sp/layout/ConstraintResolver.hpp"

#include <vector>

namespace sp {

class RatioStore;

struct SnapResult {
  bool found{false};
  double point{0.0};     // nearest snap point (valid when found)
  double distance{0.0};
};

// Nearest point by absolute distance; ties go to the earliest entry.
// found is true only when distance <= tolerance.
SnapResult findSnap(double value, const std::vector<double>& points, double tolerance);

// Commits the nearest snap point (clamped to the effective bounds) with a
// zero threshold. Returns true and writes `snapped` when a point was in
// range. `changed` reports whether the store value moved.
bool applySnap(RatioStore& store, const std::vector<double>& points, double tolerance,
               double extent, const ConstraintConfig& cfg,
               double& snapped, bool& changed);

} // namespace sp
