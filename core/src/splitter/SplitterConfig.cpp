#include "sp/splitter/SplitterConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstring>

namespace sp {

ConstraintConfig SplitterConfig::constraints() const {
  ConstraintConfig c;
  c.minRatio = minRatio;
  c.maxRatio = maxRatio;
  c.minStartPixels = effectiveMinStart();
  c.minEndPixels = effectiveMinEnd();
  c.overflowPolicy = overflowPolicy;
  c.pixelSnap = pixelSnap;
  return c;
}

SplitterConfig resolveConfig(const SplitterConfig& cfg, const SplitterOverrides& set,
                             const SplitterDefaults& defaults) {
  SplitterConfig out = cfg;
  if (!set.dividerThickness) out.dividerThickness = defaults.dividerThickness;
  if (!set.handleHitSlop) out.handleHitSlop = defaults.handleHitSlop;
  if (!set.overlayEnabled) out.overlayEnabled = defaults.overlayEnabled;
  if (!set.enableKeyboard) out.enableKeyboard = defaults.enableKeyboard;
  if (!set.keyboardStep) out.keyboardStep = defaults.keyboardStep;
  if (!set.pageStep) out.pageStep = defaults.pageStep;
  if (!set.unboundedPolicy) out.unboundedPolicy = defaults.unboundedPolicy;
  if (!set.fallbackExtent) out.fallbackExtent = defaults.fallbackExtent;
  if (!set.pixelSnap) out.pixelSnap = defaults.pixelSnap;
  return out;
}

// -------------------- validation --------------------

static bool fail(ConfigError& err, const char* code, const char* message) {
  err.code = code;
  err.message = message;
  return false;
}

static bool inUnit(double v) {
  return v >= 0.0 && v <= 1.0;
}

bool validateSplitterConfig(const SplitterConfig& cfg, ConfigError& err) {
  if (!inUnit(cfg.minRatio) || !inUnit(cfg.maxRatio))
    return fail(err, "CONFIG_RATIO_BOUNDS", "minRatio and maxRatio must be between 0.0 and 1.0");
  if (!(cfg.minRatio < cfg.maxRatio))
    return fail(err, "CONFIG_RATIO_BOUNDS", "minRatio must be less than maxRatio");
  if (!inUnit(cfg.initialRatio))
    return fail(err, "CONFIG_INITIAL_RATIO", "initialRatio must be between 0.0 and 1.0");

  // NaN fails every comparison below, so it is rejected with the negatives.
  if (!(cfg.minPanelSize >= 0.0))
    return fail(err, "CONFIG_MIN_SIZE", "minPanelSize must be non-negative");
  if (cfg.minStartPanelSize && !(*cfg.minStartPanelSize >= 0.0))
    return fail(err, "CONFIG_MIN_SIZE", "minStartPanelSize must be non-negative");
  if (cfg.minEndPanelSize && !(*cfg.minEndPanelSize >= 0.0))
    return fail(err, "CONFIG_MIN_SIZE", "minEndPanelSize must be non-negative");
  if (!(cfg.dividerThickness >= 0.0))
    return fail(err, "CONFIG_THICKNESS", "dividerThickness must be non-negative");
  if (!(cfg.handleHitSlop >= 0.0))
    return fail(err, "CONFIG_HIT_SLOP", "handleHitSlop must be non-negative");
  if (!(cfg.keyboardStep >= 0.0))
    return fail(err, "CONFIG_STEP", "keyboardStep must be non-negative");
  if (!(cfg.pageStep >= 0.0))
    return fail(err, "CONFIG_STEP", "pageStep must be non-negative");
  if (!(cfg.snapTolerance >= 0.0))
    return fail(err, "CONFIG_SNAP", "snapTolerance must be non-negative");
  for (double p : cfg.snapPoints) {
    if (!inUnit(p)) return fail(err, "CONFIG_SNAP", "snap points must be between 0.0 and 1.0");
  }
  if (cfg.doubleTapResetTo && !inUnit(*cfg.doubleTapResetTo))
    return fail(err, "CONFIG_DOUBLE_TAP", "doubleTapResetTo must be between 0.0 and 1.0");
  if (!(cfg.fallbackExtent > 0.0))
    return fail(err, "CONFIG_FALLBACK_EXTENT", "fallbackExtent must be greater than zero");
  if (!(cfg.updateThreshold >= 0.0))
    return fail(err, "CONFIG_THRESHOLD", "updateThreshold must be non-negative");
  return true;
}

// -------------------- JSON --------------------

namespace {

bool typeError(ConfigError& err, const char* key, const char* expected) {
  err.code = "CONFIG_TYPE";
  err.message = std::string("member '") + key + "' must be " + expected;
  return false;
}

bool readNumber(const rapidjson::Value& obj, const char* key, double& out,
                bool& present, ConfigError& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) return typeError(err, key, "a number");
  out = it->value.GetDouble();
  present = true;
  return true;
}

// Absent or null leaves the member unset.
bool readOptionalNumber(const rapidjson::Value& obj, const char* key,
                        std::optional<double>& out, ConfigError& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (it->value.IsNull()) {
    out.reset();
    return true;
  }
  if (!it->value.IsNumber()) return typeError(err, key, "a number or null");
  out = it->value.GetDouble();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out,
              bool& present, ConfigError& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) return typeError(err, key, "a boolean");
  out = it->value.GetBool();
  present = true;
  return true;
}

bool readUnbounded(const rapidjson::Value& obj, UnboundedPolicy& out,
                   bool& present, ConfigError& err) {
  auto it = obj.FindMember("unboundedPolicy");
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsString() || !parseUnboundedPolicy(it->value.GetString(), out))
    return typeError(err, "unboundedPolicy", "\"flexExpand\" or \"limitedBox\"");
  present = true;
  return true;
}

bool parseDocument(const std::string& json, rapidjson::Document& d, ConfigError& err) {
  d.Parse(json.c_str());
  if (d.HasParseError() || !d.IsObject()) {
    err.code = "CONFIG_PARSE";
    err.message = "configuration must be a JSON object";
    return false;
  }
  return true;
}

} // namespace

bool parseSplitterConfig(const std::string& json, SplitterConfig& out,
                         SplitterOverrides& set, ConfigError& err) {
  rapidjson::Document d;
  if (!parseDocument(json, d, err)) return false;

  SplitterConfig cfg = out;
  bool ignored = false;

  auto axisIt = d.FindMember("axis");
  if (axisIt != d.MemberEnd()) {
    const auto& v = axisIt->value;
    if (v.IsString() && std::strcmp(v.GetString(), "horizontal") == 0) cfg.axis = Axis::Horizontal;
    else if (v.IsString() && std::strcmp(v.GetString(), "vertical") == 0) cfg.axis = Axis::Vertical;
    else return typeError(err, "axis", "\"horizontal\" or \"vertical\"");
  }

  auto policyIt = d.FindMember("overflowPolicy");
  if (policyIt != d.MemberEnd()) {
    if (!policyIt->value.IsString() ||
        !parseOverflowPolicy(policyIt->value.GetString(), cfg.overflowPolicy)) {
      return typeError(err, "overflowPolicy", "\"favorStart\", \"favorEnd\" or \"proportional\"");
    }
  }

  auto snapIt = d.FindMember("snapPoints");
  if (snapIt != d.MemberEnd()) {
    if (!snapIt->value.IsArray()) return typeError(err, "snapPoints", "an array of numbers");
    cfg.snapPoints.clear();
    for (const auto& p : snapIt->value.GetArray()) {
      if (!p.IsNumber()) return typeError(err, "snapPoints", "an array of numbers");
      cfg.snapPoints.push_back(p.GetDouble());
    }
  }

  if (!readNumber(d, "initialRatio", cfg.initialRatio, ignored, err)) return false;
  if (!readNumber(d, "minRatio", cfg.minRatio, ignored, err)) return false;
  if (!readNumber(d, "maxRatio", cfg.maxRatio, ignored, err)) return false;
  if (!readNumber(d, "minPanelSize", cfg.minPanelSize, ignored, err)) return false;
  if (!readOptionalNumber(d, "minStartPanelSize", cfg.minStartPanelSize, err)) return false;
  if (!readOptionalNumber(d, "minEndPanelSize", cfg.minEndPanelSize, err)) return false;
  if (!readNumber(d, "dividerThickness", cfg.dividerThickness, set.dividerThickness, err)) return false;
  if (!readBool(d, "enableKeyboard", cfg.enableKeyboard, set.enableKeyboard, err)) return false;
  if (!readNumber(d, "keyboardStep", cfg.keyboardStep, set.keyboardStep, err)) return false;
  if (!readNumber(d, "pageStep", cfg.pageStep, set.pageStep, err)) return false;
  if (!readNumber(d, "snapTolerance", cfg.snapTolerance, ignored, err)) return false;
  if (!readBool(d, "resizable", cfg.resizable, ignored, err)) return false;
  if (!readNumber(d, "handleHitSlop", cfg.handleHitSlop, set.handleHitSlop, err)) return false;
  if (!readOptionalNumber(d, "doubleTapResetTo", cfg.doubleTapResetTo, err)) return false;
  if (!readBool(d, "pixelSnap", cfg.pixelSnap, set.pixelSnap, err)) return false;
  if (!readUnbounded(d, cfg.unboundedPolicy, set.unboundedPolicy, err)) return false;
  if (!readNumber(d, "fallbackExtent", cfg.fallbackExtent, set.fallbackExtent, err)) return false;
  if (!readBool(d, "overlayEnabled", cfg.overlayEnabled, set.overlayEnabled, err)) return false;
  if (!readBool(d, "holdScrollWhileDragging", cfg.holdScrollWhileDragging, ignored, err)) return false;
  if (!readNumber(d, "updateThreshold", cfg.updateThreshold, ignored, err)) return false;
  if (!readBool(d, "tolerateReattach", cfg.tolerateReattach, ignored, err)) return false;

  out = cfg;
  return true;
}

bool parseSplitterConfig(const std::string& json, SplitterConfig& out, ConfigError& err) {
  SplitterOverrides set;
  return parseSplitterConfig(json, out, set, err);
}

bool parseSplitterDefaults(const std::string& json, SplitterDefaults& out, ConfigError& err) {
  rapidjson::Document d;
  if (!parseDocument(json, d, err)) return false;

  SplitterDefaults defs = out;
  bool ignored = false;
  if (!readNumber(d, "dividerThickness", defs.dividerThickness, ignored, err)) return false;
  if (!readNumber(d, "handleHitSlop", defs.handleHitSlop, ignored, err)) return false;
  if (!readBool(d, "overlayEnabled", defs.overlayEnabled, ignored, err)) return false;
  if (!readBool(d, "enableKeyboard", defs.enableKeyboard, ignored, err)) return false;
  if (!readNumber(d, "keyboardStep", defs.keyboardStep, ignored, err)) return false;
  if (!readNumber(d, "pageStep", defs.pageStep, ignored, err)) return false;
  if (!readUnbounded(d, defs.unboundedPolicy, ignored, err)) return false;
  if (!readNumber(d, "fallbackExtent", defs.fallbackExtent, ignored, err)) return false;
  if (!readBool(d, "pixelSnap", defs.pixelSnap, ignored, err)) return false;

  if (defs.dividerThickness < 0.0 || defs.handleHitSlop < 0.0 ||
      defs.keyboardStep < 0.0 || defs.pageStep < 0.0) {
    err.code = "CONFIG_DEFAULTS";
    err.message = "default sizes and steps must be non-negative";
    return false;
  }
  if (!(defs.fallbackExtent > 0.0)) {
    err.code = "CONFIG_FALLBACK_EXTENT";
    err.message = "fallbackExtent must be greater than zero";
    return false;
  }

  out = defs;
  return true;
}

static rapidjson::Value optionalNumber(const std::optional<double>& v) {
  rapidjson::Value out;
  if (v) out.SetDouble(*v);
  return out;
}

std::string serializeSplitterConfig(const SplitterConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("axis", rapidjson::Value(axisName(cfg.axis), alloc), alloc);
  doc.AddMember("initialRatio", cfg.initialRatio, alloc);
  doc.AddMember("minRatio", cfg.minRatio, alloc);
  doc.AddMember("maxRatio", cfg.maxRatio, alloc);
  doc.AddMember("minPanelSize", cfg.minPanelSize, alloc);
  doc.AddMember("minStartPanelSize", optionalNumber(cfg.minStartPanelSize), alloc);
  doc.AddMember("minEndPanelSize", optionalNumber(cfg.minEndPanelSize), alloc);
  doc.AddMember("dividerThickness", cfg.dividerThickness, alloc);
  doc.AddMember("enableKeyboard", cfg.enableKeyboard, alloc);
  doc.AddMember("keyboardStep", cfg.keyboardStep, alloc);
  doc.AddMember("pageStep", cfg.pageStep, alloc);

  rapidjson::Value snaps(rapidjson::kArrayType);
  for (double p : cfg.snapPoints) snaps.PushBack(p, alloc);
  doc.AddMember("snapPoints", snaps, alloc);
  doc.AddMember("snapTolerance", cfg.snapTolerance, alloc);

  doc.AddMember("overflowPolicy",
                rapidjson::Value(overflowPolicyName(cfg.overflowPolicy), alloc), alloc);
  doc.AddMember("resizable", cfg.resizable, alloc);
  doc.AddMember("handleHitSlop", cfg.handleHitSlop, alloc);
  doc.AddMember("doubleTapResetTo", optionalNumber(cfg.doubleTapResetTo), alloc);
  doc.AddMember("pixelSnap", cfg.pixelSnap, alloc);
  doc.AddMember("unboundedPolicy",
                rapidjson::Value(unboundedPolicyName(cfg.unboundedPolicy), alloc), alloc);
  doc.AddMember("fallbackExtent", cfg.fallbackExtent, alloc);
  doc.AddMember("overlayEnabled", cfg.overlayEnabled, alloc);
  doc.AddMember("holdScrollWhileDragging", cfg.holdScrollWhileDragging, alloc);
  doc.AddMember("updateThreshold", cfg.updateThreshold, alloc);
  doc.AddMember("tolerateReattach", cfg.tolerateReattach, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace sp
