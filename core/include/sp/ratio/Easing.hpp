#pragma once
#include <functional>

namespace sp {

// Maps linear progress t in [0,1] to eased progress. f(0)=0 and f(1)=1.
using EasingFn = std::function<double(double)>;

namespace easing {

double linear(double t);

// Cubic bezier through (0,0), (x1,y1), (x2,y2), (1,1), solved for x == t.
double cubicBezier(double x1, double y1, double x2, double y2, double t);

double easeIn(double t);     // (0.42, 0, 1, 1)
double easeOut(double t);    // (0, 0, 0.58, 1)
double easeInOut(double t);  // (0.42, 0, 0.58, 1)

} // namespace easing
} // namespace sp
