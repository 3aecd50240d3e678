#include "sp/interaction/SnapEngine.hpp"
#include "sp/ratio/RatioStore.hpp"

#include <cmath>
#include <limits>

namespace sp {

SnapResult findSnap(double value, const std::vector<double>& points, double tolerance) {
  SnapResult r;
  if (points.empty()) return r;

  double best = std::numeric_limits<double>::infinity();
  double nearest = value;
  for (double p : points) {
    double d = std::fabs(value - p);
    if (d < best) {
      best = d;
      nearest = p;
    }
  }

  r.point = nearest;
  r.distance = best;
  r.found = best <= tolerance;
  return r;
}

bool applySnap(RatioStore& store, const std::vector<double>& points, double tolerance,
               double extent, const ConstraintConfig& cfg,
               double& snapped, bool& changed) {
  changed = false;
  if (points.empty() || !(extent > 0.0)) return false;

  SnapResult r = findSnap(store.value(), points, tolerance);
  if (!r.found) return false;

  snapped = clampToBounds(r.point, extent, cfg);
  if (std::fabs(snapped - store.value()) > 1e-9) {
    double previous = store.value();
    store.update(snapped, 0.0);
    changed = std::fabs(store.value() - previous) > 1e-9;
  }
  return true;
}

} // namespace sp
