#include "sp/layout/ConstraintResolver.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace sp {

namespace {

double clampd(double v, double lo, double hi) {
  return std::max(lo, std::min(hi, v));
}

bool usableExtent(double extent) {
  return std::isfinite(extent) && extent > 0.0;
}

// Ratio used when the two minimums cannot both be honoured.
double crampedRatio(const RatioBounds& b, double minStart, double minEnd,
                    OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::FavorEnd:
      return clampd(b.hi, 0.0, 1.0);
    case OverflowPolicy::Proportional: {
      double sum = minStart + minEnd;
      return sum <= 0.0 ? 0.5 : clampd(minStart / sum, 0.0, 1.0);
    }
    case OverflowPolicy::FavorStart:
    default:
      return clampd(b.lo, 0.0, 1.0);
  }
}

} // namespace

RatioBounds computeBounds(double extent, const ConstraintConfig& cfg) {
  RatioBounds b;
  if (!usableExtent(extent)) {
    b.lo = clampd(cfg.minRatio, 0.0, 1.0);
    b.hi = clampd(cfg.maxRatio, 0.0, 1.0);
    b.cramped = b.lo > b.hi;
    return b;
  }

  double minStart = clampd(cfg.minStartPixels, 0.0, extent);
  double minEnd = clampd(cfg.minEndPixels, 0.0, extent);

  double pixelMinRatio = clampd(minStart / extent, 0.0, 1.0);
  double pixelMaxRatio = clampd(1.0 - minEnd / extent, 0.0, 1.0);

  b.lo = std::max(cfg.minRatio, pixelMinRatio);
  b.hi = std::min(cfg.maxRatio, pixelMaxRatio);
  b.cramped = b.lo > b.hi;
  return b;
}

double clampToBounds(double ratio, double extent, const ConstraintConfig& cfg) {
  if (std::isnan(ratio)) ratio = cfg.minRatio;
  RatioBounds b = computeBounds(extent, cfg);
  if (!b.cramped) return clampd(clampd(ratio, b.lo, b.hi), 0.0, 1.0);

  double minStart = usableExtent(extent) ? clampd(cfg.minStartPixels, 0.0, extent) : 0.0;
  double minEnd = usableExtent(extent) ? clampd(cfg.minEndPixels, 0.0, extent) : 0.0;
  return crampedRatio(b, minStart, minEnd, cfg.overflowPolicy);
}

ResolvedSplit resolveSplit(double ratio, double extent, const ConstraintConfig& cfg) {
  ResolvedSplit out;
  if (!usableExtent(extent)) {
    out.ratio = clampToBounds(ratio, 0.0, cfg);
    return out;
  }

  double minStart = clampd(cfg.minStartPixels, 0.0, extent);
  double minEnd = clampd(cfg.minEndPixels, 0.0, extent);

  RatioBounds b = computeBounds(extent, cfg);
  out.cramped = b.cramped;
  out.ratio = clampToBounds(ratio, extent, cfg);

  double first = extent * out.ratio;
  if (b.cramped && !cfg.pixelSnap) {
    // Honour the favoured minimum exactly when it set the bound.
    if (cfg.overflowPolicy == OverflowPolicy::FavorStart && minStart / extent >= cfg.minRatio) {
      first = minStart;
    } else if (cfg.overflowPolicy == OverflowPolicy::FavorEnd &&
               1.0 - minEnd / extent <= cfg.maxRatio) {
      first = extent - minEnd;
    }
  } else if (cfg.pixelSnap) {
    first = std::floor(first);
    double maxAllowed = clampd(extent - minEnd, 0.0, extent);
    if (minStart <= maxAllowed) {
      first = clampd(first, minStart, maxAllowed);
    } else {
      switch (cfg.overflowPolicy) {
        case OverflowPolicy::FavorEnd:
          first = maxAllowed;
          break;
        case OverflowPolicy::Proportional: {
          // Derived from the configured minimums, not the floored extent.
          double sum = minStart + minEnd;
          double share = sum <= 0.0 ? 0.5 : clampd(minStart / sum, 0.0, 1.0);
          first = clampd(extent * share, 0.0, extent);
          break;
        }
        case OverflowPolicy::FavorStart:
        default:
          first = minStart;
          break;
      }
    }
  }

  out.firstExtent = first;
  out.secondExtent = clampd(extent - first, 0.0, extent);
  return out;
}

ExtentResolution availableExtent(double mainAxisMax, double dividerThickness,
                                 UnboundedPolicy policy, double fallbackExtent) {
  ExtentResolution r;
  double thickness = std::max(0.0, dividerThickness);

  double size = mainAxisMax;
  if (!usableExtent(size)) {
    if (policy != UnboundedPolicy::LimitedBox || !usableExtent(fallbackExtent)) {
      r.bounded = false;
      r.extent = 0.0;
      return r;
    }
    size = fallbackExtent;
  }

  r.extent = std::max(0.0, size - thickness);
  return r;
}

ResolvedSplit equalSplit(double assignedExtent) {
  ResolvedSplit r;
  r.ratio = 0.5;
  if (!usableExtent(assignedExtent)) return r;
  r.firstExtent = assignedExtent * 0.5;
  r.secondExtent = assignedExtent - r.firstExtent;
  return r;
}

const char* overflowPolicyName(OverflowPolicy p) {
  switch (p) {
    case OverflowPolicy::FavorEnd: return "favorEnd";
    case OverflowPolicy::Proportional: return "proportional";
    case OverflowPolicy::FavorStart:
    default: return "favorStart";
  }
}

bool parseOverflowPolicy(const char* name, OverflowPolicy& out) {
  if (!name) return false;
  if (std::strcmp(name, "favorStart") == 0) { out = OverflowPolicy::FavorStart; return true; }
  if (std::strcmp(name, "favorEnd") == 0) { out = OverflowPolicy::FavorEnd; return true; }
  if (std::strcmp(name, "proportional") == 0) { out = OverflowPolicy::Proportional; return true; }
  return false;
}

const char* unboundedPolicyName(UnboundedPolicy p) {
  return p == UnboundedPolicy::LimitedBox ? "limitedBox" : "flexExpand";
}

bool parseUnboundedPolicy(const char* name, UnboundedPolicy& out) {
  if (!name) return false;
  if (std::strcmp(name, "flexExpand") == 0) { out = UnboundedPolicy::FlexExpand; return true; }
  if (std::strcmp(name, "limitedBox") == 0) { out = UnboundedPolicy::LimitedBox; return true; }
  return false;
}

} // namespace sp
