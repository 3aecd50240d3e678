// D2.1 - Constraint resolver test (pure C++, no GL)
// Tests: pixel minimums, ratio bounds, overflow policies, idempotence,
// pixel snapping, missing geometry, available extent.

#include "sp/layout/ConstraintResolver.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

static sp::ConstraintConfig pixels(double minStart, double minEnd,
                                   sp::OverflowPolicy policy = sp::OverflowPolicy::FavorStart) {
  sp::ConstraintConfig c;
  c.minStartPixels = minStart;
  c.minEndPixels = minEnd;
  c.overflowPolicy = policy;
  return c;
}

int main() {
  const double inf = std::numeric_limits<double>::infinity();

  // --- Test 1: start minimum lifts a small ratio (300 - 10 divider) ---
  {
    sp::ExtentResolution avail = sp::availableExtent(300.0, 10.0,
                                                     sp::UnboundedPolicy::FlexExpand, 500.0);
    requireTrue(avail.bounded, "bounded");
    requireClose(avail.extent, 290.0, 1e-12, "available = 290");

    sp::ResolvedSplit s = sp::resolveSplit(0.1, avail.extent, pixels(200.0, 50.0));
    requireTrue(!s.cramped, "not cramped");
    requireClose(s.firstExtent, 200.0, 1e-9, "first = 200");
    requireClose(s.secondExtent, 90.0, 1e-9, "second = 90");
    std::printf("  Test 1 (start minimum) PASS\n");
  }

  // --- Test 2: both minimums fit; end minimum caps a large ratio ---
  {
    sp::ExtentResolution avail = sp::availableExtent(360.0, 8.0,
                                                     sp::UnboundedPolicy::FlexExpand, 500.0);
    requireClose(avail.extent, 352.0, 1e-12, "available = 352");

    sp::RatioBounds b = sp::computeBounds(avail.extent, pixels(200.0, 150.0));
    requireTrue(!b.cramped, "350 <= 352 is not cramped");
    requireClose(b.lo, 200.0 / 352.0, 1e-12, "lo from start minimum");
    requireClose(b.hi, 1.0 - 150.0 / 352.0, 1e-12, "hi from end minimum");

    sp::ResolvedSplit s = sp::resolveSplit(0.8, avail.extent, pixels(200.0, 150.0));
    requireClose(s.firstExtent, 202.0, 1e-9, "first = 202");
    requireClose(s.secondExtent, 150.0, 1e-9, "second keeps its minimum");
    std::printf("  Test 2 (end minimum) PASS\n");
  }

  // --- Test 3: cramped, each overflow policy ---
  {
    const double extent = 290.0;  // 200 + 150 do not fit

    sp::ResolvedSplit fs = sp::resolveSplit(0.5, extent, pixels(200.0, 150.0));
    requireTrue(fs.cramped, "cramped");
    requireClose(fs.firstExtent, 200.0, 1e-9, "favorStart: first = 200");
    requireClose(fs.secondExtent, 90.0, 1e-9, "favorStart: second = 90");

    sp::ResolvedSplit fe = sp::resolveSplit(0.5, extent,
                                            pixels(200.0, 150.0, sp::OverflowPolicy::FavorEnd));
    requireClose(fe.firstExtent, 140.0, 1e-9, "favorEnd: first = 140");
    requireClose(fe.secondExtent, 150.0, 1e-9, "favorEnd: second = 150");

    sp::ResolvedSplit pr = sp::resolveSplit(0.9, extent,
                                            pixels(200.0, 150.0, sp::OverflowPolicy::Proportional));
    requireClose(pr.ratio, 200.0 / 350.0, 1e-12, "proportional ratio");
    requireClose(pr.firstExtent, extent * 200.0 / 350.0, 1e-9, "proportional first");
    requireClose(pr.firstExtent + pr.secondExtent, extent, 1e-9, "extents fill the space");

    // Input ratio is irrelevant once cramped.
    sp::ResolvedSplit fs2 = sp::resolveSplit(0.01, extent, pixels(200.0, 150.0));
    requireClose(fs2.firstExtent, fs.firstExtent, 1e-12, "cramped result independent of input");

    // The favoured side gets its minimum exactly, with no rounding residue.
    sp::ResolvedSplit exactStart = sp::resolveSplit(0.5, 78.0, pixels(50.0, 50.0));
    requireTrue(exactStart.firstExtent == 50.0, "favorStart: first is exactly 50");
    requireTrue(exactStart.secondExtent == 28.0, "favorStart: second is exactly 28");
    sp::ResolvedSplit exactEnd = sp::resolveSplit(0.5, 78.0,
                                                  pixels(50.0, 50.0, sp::OverflowPolicy::FavorEnd));
    requireTrue(exactEnd.secondExtent == 50.0, "favorEnd: second is exactly 50");
    requireTrue(exactEnd.firstExtent == 28.0, "favorEnd: first is exactly 28");
    std::printf("  Test 3 (overflow policies) PASS\n");
  }

  // --- Test 4: minimums larger than the extent are clamped to it ---
  {
    sp::ResolvedSplit s = sp::resolveSplit(0.5, 100.0, pixels(500.0, 0.0));
    requireClose(s.firstExtent, 100.0, 1e-9, "start takes everything");
    requireClose(s.secondExtent, 0.0, 1e-9, "end collapses");

    sp::ResolvedSplit p = sp::resolveSplit(0.5, 100.0,
                                           pixels(0.0, 0.0, sp::OverflowPolicy::Proportional));
    requireClose(p.firstExtent, 50.0, 1e-9, "no minimums: ratio respected");
    std::printf("  Test 4 (oversized minimums) PASS\n");
  }

  // --- Test 5: ratio bounds intersect pixel bounds ---
  {
    sp::ConstraintConfig c = pixels(100.0, 0.0);
    c.minRatio = 0.1;
    c.maxRatio = 0.6;
    requireClose(sp::clampToBounds(0.0, 400.0, c), 0.25, 1e-12, "pixel minimum wins over 0.1");
    requireClose(sp::clampToBounds(0.9, 400.0, c), 0.6, 1e-12, "maxRatio caps");
    requireClose(sp::clampToBounds(0.4, 400.0, c), 0.4, 1e-12, "inside bounds untouched");
    requireClose(sp::clampToBounds(0.0, 0.0, c), 0.1, 1e-12, "no geometry: ratio bounds only");
    std::printf("  Test 5 (bounds intersection) PASS\n");
  }

  // --- Test 6: idempotence ---
  {
    sp::ConstraintConfig c = pixels(120.0, 80.0);
    c.minRatio = 0.05;
    c.maxRatio = 0.95;
    const double inputs[] = {-1.0, 0.0, 0.2, 0.5, 0.77, 1.0, 3.0};
    for (double in : inputs) {
      sp::ResolvedSplit a = sp::resolveSplit(in, 500.0, c);
      sp::ResolvedSplit b = sp::resolveSplit(a.ratio, 500.0, c);
      requireClose(a.ratio, b.ratio, 1e-12, "resolved ratio is a fixed point");
      requireClose(a.firstExtent, b.firstExtent, 1e-9, "first extent stable");
    }
    std::printf("  Test 6 (idempotence) PASS\n");
  }

  // --- Test 7: pixel snapping floors the start region ---
  {
    sp::ConstraintConfig c;
    c.pixelSnap = true;
    sp::ResolvedSplit s = sp::resolveSplit(0.5, 301.0, c);
    requireClose(s.firstExtent, 150.0, 1e-12, "floor(150.5) = 150");
    requireClose(s.secondExtent, 151.0, 1e-12, "remainder to the end region");

    sp::ConstraintConfig m = pixels(200.0, 50.0);
    m.pixelSnap = true;
    sp::ResolvedSplit ms = sp::resolveSplit(0.1, 290.0, m);
    requireClose(ms.firstExtent, 200.0, 1e-12, "floor never drops below the start minimum");

    sp::ConstraintConfig cramped = pixels(200.0, 150.0);
    cramped.pixelSnap = true;
    sp::ResolvedSplit cs = sp::resolveSplit(0.5, 290.0, cramped);
    requireClose(cs.firstExtent, 200.0, 1e-12, "cramped favorStart keeps start minimum");

    cramped.overflowPolicy = sp::OverflowPolicy::FavorEnd;
    sp::ResolvedSplit ce = sp::resolveSplit(0.5, 290.0, cramped);
    requireClose(ce.firstExtent, 140.0, 1e-12, "cramped favorEnd keeps end minimum");

    cramped.overflowPolicy = sp::OverflowPolicy::Proportional;
    sp::ResolvedSplit cp = sp::resolveSplit(0.5, 290.0, cramped);
    requireClose(cp.firstExtent, 290.0 * 200.0 / 350.0, 1e-9,
                 "cramped proportional uses configured minimums");
    std::printf("  Test 7 (pixel snap) PASS\n");
  }

  // --- Test 8: missing or non-finite geometry ---
  {
    sp::ConstraintConfig c;
    c.minRatio = 0.2;
    c.maxRatio = 0.6;
    sp::ResolvedSplit z = sp::resolveSplit(0.7, 0.0, c);
    requireClose(z.firstExtent, 0.0, 1e-12, "zero extent: first 0");
    requireClose(z.secondExtent, 0.0, 1e-12, "zero extent: second 0");
    requireClose(z.ratio, 0.6, 1e-12, "ratio still bounded");

    sp::ResolvedSplit n = sp::resolveSplit(0.3, std::nan(""), c);
    requireClose(n.firstExtent, 0.0, 1e-12, "NaN extent: first 0");
    requireClose(n.ratio, 0.3, 1e-12, "NaN extent: ratio kept");
    std::printf("  Test 8 (missing geometry) PASS\n");
  }

  // --- Test 9: available extent and unbounded policies ---
  {
    sp::ExtentResolution flex = sp::availableExtent(inf, 6.0, sp::UnboundedPolicy::FlexExpand, 500.0);
    requireTrue(!flex.bounded, "flexExpand: unbounded");

    sp::ExtentResolution box = sp::availableExtent(inf, 6.0, sp::UnboundedPolicy::LimitedBox, 500.0);
    requireTrue(box.bounded, "limitedBox: bounded");
    requireClose(box.extent, 494.0, 1e-12, "fallback minus divider");

    sp::ExtentResolution zero = sp::availableExtent(0.0, 6.0, sp::UnboundedPolicy::LimitedBox, 500.0);
    requireClose(zero.extent, 494.0, 1e-12, "zero extent uses fallback");

    sp::ExtentResolution thin = sp::availableExtent(4.0, 6.0, sp::UnboundedPolicy::FlexExpand, 500.0);
    requireTrue(thin.bounded, "tiny extent stays bounded");
    requireClose(thin.extent, 0.0, 1e-12, "divider wider than extent -> 0");

    sp::ResolvedSplit eq = sp::equalSplit(401.0);
    requireClose(eq.firstExtent, 200.5, 1e-12, "equal split first");
    requireClose(eq.secondExtent, 200.5, 1e-12, "equal split second");
    std::printf("  Test 9 (available extent) PASS\n");
  }

  // --- Test 10: policy names ---
  {
    sp::OverflowPolicy p = sp::OverflowPolicy::FavorStart;
    requireTrue(sp::parseOverflowPolicy("proportional", p), "parse proportional");
    requireTrue(p == sp::OverflowPolicy::Proportional, "proportional parsed");
    requireTrue(!sp::parseOverflowPolicy("middle", p), "unknown policy rejected");
    requireTrue(std::strcmp(sp::overflowPolicyName(sp::OverflowPolicy::FavorEnd), "favorEnd") == 0,
                "favorEnd name");

    sp::UnboundedPolicy u = sp::UnboundedPolicy::FlexExpand;
    requireTrue(sp::parseUnboundedPolicy("limitedBox", u), "parse limitedBox");
    requireTrue(u == sp::UnboundedPolicy::LimitedBox, "limitedBox parsed");
    std::printf("  Test 10 (policy names) PASS\n");
  }

  std::printf("D2.1 constraint resolver: ALL PASS\n");
  return 0;
}
