#include "sp/ratio/Easing.hpp"

#include <algorithm>
#include <cmath>

namespace sp {
namespace easing {

namespace {

double bezierComponent(double a, double b, double m) {
  return 3.0 * a * (1 - m) * (1 - m) * m + 3.0 * b * (1 - m) * m * m + m * m * m;
}

} // namespace

double linear(double t) {
  return std::max(0.0, std::min(1.0, t));
}

double cubicBezier(double x1, double y1, double x2, double y2, double t) {
  if (t <= 0.0) return 0.0;
  if (t >= 1.0) return 1.0;

  // Bisection on the x curve; x(m) is monotonic for x1,x2 in [0,1].
  double lo = 0.0, hi = 1.0;
  for (int i = 0; i < 64; i++) {
    double mid = (lo + hi) * 0.5;
    double x = bezierComponent(x1, x2, mid);
    if (std::fabs(t - x) < 1e-9) return bezierComponent(y1, y2, mid);
    if (x < t) lo = mid;
    else hi = mid;
  }
  return bezierComponent(y1, y2, (lo + hi) * 0.5);
}

double easeIn(double t) { return cubicBezier(0.42, 0.0, 1.0, 1.0, t); }
double easeOut(double t) { return cubicBezier(0.0, 0.0, 0.58, 1.0, t); }
double easeInOut(double t) { return cubicBezier(0.42, 0.0, 0.58, 1.0, t); }

} // namespace easing
} // namespace sp
