// D5.2 - Splitter configuration test (pure C++, no GL)
// Tests: validation codes, JSON load of non-default fields, type errors,
// shared defaults layering, serialize/parse agreement.

#include "sp/splitter/SplitterConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

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

static std::string rejectCode(const sp::SplitterConfig& cfg) {
  sp::ConfigError err;
  if (sp::validateSplitterConfig(cfg, err)) return "OK";
  return err.code;
}

int main() {
  // --- Test 1: validation ---
  {
    sp::SplitterConfig ok;
    requireTrue(rejectCode(ok) == "OK", "defaults are valid");

    sp::SplitterConfig c = ok;
    c.minRatio = 0.6; c.maxRatio = 0.6;
    requireTrue(rejectCode(c) == "CONFIG_RATIO_BOUNDS", "min == max rejected");
    c = ok; c.maxRatio = 1.2;
    requireTrue(rejectCode(c) == "CONFIG_RATIO_BOUNDS", "max > 1 rejected");
    c = ok; c.initialRatio = -0.1;
    requireTrue(rejectCode(c) == "CONFIG_INITIAL_RATIO", "initial < 0 rejected");
    c = ok; c.minPanelSize = -5.0;
    requireTrue(rejectCode(c) == "CONFIG_MIN_SIZE", "negative min size rejected");
    c = ok; c.minStartPanelSize = -5.0;
    requireTrue(rejectCode(c) == "CONFIG_MIN_SIZE", "negative start minimum rejected");
    c = ok; c.minEndPanelSize = -1.0;
    requireTrue(rejectCode(c) == "CONFIG_MIN_SIZE", "negative end minimum rejected");
    c = ok; c.minStartPanelSize = 0.0;
    requireTrue(rejectCode(c) == "OK", "zero start minimum accepted");
    c = ok; c.dividerThickness = -1.0;
    requireTrue(rejectCode(c) == "CONFIG_THICKNESS", "negative thickness rejected");
    c = ok; c.handleHitSlop = -2.0;
    requireTrue(rejectCode(c) == "CONFIG_HIT_SLOP", "negative slop rejected");
    c = ok; c.pageStep = -0.1;
    requireTrue(rejectCode(c) == "CONFIG_STEP", "negative page step rejected");
    c = ok; c.snapTolerance = -0.01;
    requireTrue(rejectCode(c) == "CONFIG_SNAP", "negative tolerance rejected");
    c = ok; c.snapPoints = {0.5, 1.5};
    requireTrue(rejectCode(c) == "CONFIG_SNAP", "snap point outside [0,1] rejected");
    c = ok; c.doubleTapResetTo = 1.5;
    requireTrue(rejectCode(c) == "CONFIG_DOUBLE_TAP", "reset target > 1 rejected");
    c = ok; c.doubleTapResetTo = -0.2;
    requireTrue(rejectCode(c) == "CONFIG_DOUBLE_TAP", "negative reset target rejected");
    c = ok; c.fallbackExtent = 0.0;
    requireTrue(rejectCode(c) == "CONFIG_FALLBACK_EXTENT", "zero fallback rejected");
    std::printf("  Test 1 (validation) PASS\n");
  }

  // --- Test 2: per-side minimums fall back to the shared one ---
  {
    sp::SplitterConfig c;
    c.minPanelSize = 80.0;
    c.minEndPanelSize = 20.0;
    requireClose(c.effectiveMinStart(), 80.0, 1e-12, "start uses fallback");
    requireClose(c.effectiveMinEnd(), 20.0, 1e-12, "end uses its own value");
    sp::ConstraintConfig cc = c.constraints();
    requireClose(cc.minStartPixels, 80.0, 1e-12, "constraints start");
    requireClose(cc.minEndPixels, 20.0, 1e-12, "constraints end");
    std::printf("  Test 2 (effective minimums) PASS\n");
  }

  // --- Test 3: JSON load of non-default fields ---
  {
    const char* json = R"({
      "axis": "vertical",
      "initialRatio": 0.3,
      "minRatio": 0.1,
      "maxRatio": 0.9,
      "minPanelSize": 40,
      "minEndPanelSize": 60,
      "dividerThickness": 10,
      "snapPoints": [0.25, 0.5, 0.75],
      "snapTolerance": 0.05,
      "overflowPolicy": "proportional",
      "unboundedPolicy": "limitedBox",
      "doubleTapResetTo": 0.5,
      "pixelSnap": true,
      "holdScrollWhileDragging": true
    })";
    sp::SplitterConfig c;
    sp::SplitterOverrides set;
    sp::ConfigError err;
    requireTrue(sp::parseSplitterConfig(json, c, set, err), "parsed");

    requireTrue(c.axis == sp::Axis::Vertical, "axis");
    requireClose(c.initialRatio, 0.3, 1e-12, "initialRatio");
    requireTrue(c.minEndPanelSize.has_value(), "minEndPanelSize set");
    requireClose(*c.minEndPanelSize, 60.0, 1e-12, "minEndPanelSize");
    requireTrue(!c.minStartPanelSize, "absent minStartPanelSize stays unset");
    requireClose(c.effectiveMinStart(), 40.0, 1e-12, "start falls back to 40");
    requireTrue(c.snapPoints.size() == 3, "snap points");
    requireTrue(c.overflowPolicy == sp::OverflowPolicy::Proportional, "overflow policy");
    requireTrue(c.unboundedPolicy == sp::UnboundedPolicy::LimitedBox, "unbounded policy");
    requireTrue(c.pixelSnap && c.holdScrollWhileDragging, "flags");
    requireClose(c.keyboardStep, 0.01, 1e-12, "absent field keeps default");
    requireTrue(c.resizable, "absent bool keeps default");

    requireTrue(set.dividerThickness && set.unboundedPolicy && set.pixelSnap, "overrides recorded");
    requireTrue(!set.keyboardStep && !set.fallbackExtent, "absent overrides stay false");
    requireTrue(sp::validateSplitterConfig(c, err), "loaded config valid");
    std::printf("  Test 3 (JSON load) PASS\n");
  }

  // --- Test 4: parse and type errors ---
  {
    sp::SplitterConfig c;
    sp::ConfigError err;
    requireTrue(!sp::parseSplitterConfig("{not json", c, err), "malformed rejected");
    requireTrue(err.code == "CONFIG_PARSE", "CONFIG_PARSE");
    requireTrue(!sp::parseSplitterConfig("[1,2]", c, err), "array rejected");
    requireTrue(err.code == "CONFIG_PARSE", "array is CONFIG_PARSE");

    requireTrue(!sp::parseSplitterConfig(R"({"minRatio":"low"})", c, err), "string ratio");
    requireTrue(err.code == "CONFIG_TYPE", "CONFIG_TYPE for number");
    requireTrue(!sp::parseSplitterConfig(R"({"axis":"diagonal"})", c, err), "bad axis");
    requireTrue(err.code == "CONFIG_TYPE", "CONFIG_TYPE for enum");
    requireTrue(!sp::parseSplitterConfig(R"({"snapPoints":[0.5,"x"]})", c, err), "bad snap entry");
    requireTrue(!sp::parseSplitterConfig(R"({"resizable":1})", c, err), "int is not bool");
    requireTrue(!sp::parseSplitterConfig(R"({"minEndPanelSize":"wide"})", c, err), "string minimum");
    requireTrue(err.code == "CONFIG_TYPE", "CONFIG_TYPE for optional number");

    sp::SplitterConfig typo;
    requireTrue(sp::parseSplitterConfig(R"({"minStartPanelSize":-5})", typo, err),
                "negative minimum parses");
    requireTrue(!sp::validateSplitterConfig(typo, err), "negative minimum fails validation");
    requireTrue(err.code == "CONFIG_MIN_SIZE", "CONFIG_MIN_SIZE from JSON");

    sp::SplitterConfig cleared;
    cleared.minStartPanelSize = 30.0;
    cleared.doubleTapResetTo = 0.5;
    requireTrue(sp::parseSplitterConfig(R"({"minStartPanelSize":null,"doubleTapResetTo":null})",
                                        cleared, err),
                "null members parse");
    requireTrue(!cleared.minStartPanelSize && !cleared.doubleTapResetTo, "null clears the value");

    sp::SplitterConfig untouched;
    untouched.initialRatio = 0.4;
    requireTrue(!sp::parseSplitterConfig(R"({"initialRatio":0.9,"pageStep":"x"})", untouched, err),
                "partial failure");
    requireClose(untouched.initialRatio, 0.4, 1e-12, "output untouched on failure");
    std::printf("  Test 4 (errors) PASS\n");
  }

  // --- Test 5: shared defaults under explicit values ---
  {
    sp::SplitterDefaults defs;
    sp::ConfigError err;
    requireTrue(sp::parseSplitterDefaults(
                  R"({"dividerThickness":12,"keyboardStep":0.05,"overlayEnabled":false})",
                  defs, err),
                "defaults parsed");

    sp::SplitterConfig c;
    sp::SplitterOverrides set;
    requireTrue(sp::parseSplitterConfig(R"({"dividerThickness":4})", c, set, err), "config parsed");

    sp::SplitterConfig r = sp::resolveConfig(c, set, defs);
    requireClose(r.dividerThickness, 4.0, 1e-12, "explicit value wins");
    requireClose(r.keyboardStep, 0.05, 1e-12, "default fills the gap");
    requireTrue(!r.overlayEnabled, "default overlay flag applied");
    requireClose(r.pageStep, 0.1, 1e-12, "untouched default");

    requireTrue(!sp::parseSplitterDefaults(R"({"fallbackExtent":0})", defs, err), "bad fallback");
    requireTrue(err.code == "CONFIG_FALLBACK_EXTENT", "fallback code");
    std::printf("  Test 5 (defaults layering) PASS\n");
  }

  // --- Test 6: serialized config parses back to the same values ---
  {
    sp::SplitterConfig c;
    c.axis = sp::Axis::Vertical;
    c.initialRatio = 0.35;
    c.minStartPanelSize = 25.0;
    c.snapPoints = {0.2, 0.8};
    c.overflowPolicy = sp::OverflowPolicy::FavorEnd;
    c.unboundedPolicy = sp::UnboundedPolicy::LimitedBox;
    c.fallbackExtent = 720.0;
    c.tolerateReattach = true;

    std::string json = sp::serializeSplitterConfig(c);
    sp::SplitterConfig back;
    sp::ConfigError err;
    requireTrue(sp::parseSplitterConfig(json, back, err), "serialized text parses");
    requireTrue(back.axis == sp::Axis::Vertical, "axis");
    requireClose(back.initialRatio, 0.35, 1e-12, "initialRatio");
    requireTrue(back.minStartPanelSize.has_value(), "minStartPanelSize kept");
    requireClose(*back.minStartPanelSize, 25.0, 1e-12, "minStartPanelSize");
    requireTrue(!back.minEndPanelSize, "unset side stays unset");
    requireTrue(!back.doubleTapResetTo, "unset reset target stays unset");
    requireTrue(back.snapPoints.size() == 2, "snap points");
    requireTrue(back.overflowPolicy == sp::OverflowPolicy::FavorEnd, "overflow");
    requireTrue(back.unboundedPolicy == sp::UnboundedPolicy::LimitedBox, "unbounded");
    requireClose(back.fallbackExtent, 720.0, 1e-12, "fallback");
    requireTrue(back.tolerateReattach, "tolerateReattach");
    requireTrue(json == sp::serializeSplitterConfig(back), "stable text");
    std::printf("  Test 6 (serialize) PASS\n");
  }

  std::printf("D5.2 config JSON: ALL PASS\n");
  return 0;
}
