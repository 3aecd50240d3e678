#include "sp/commands/CommandProcessor.hpp"

#include "sp/interaction/DragStateMachine.hpp"
#include "sp/layout/ConstraintResolver.hpp"
#include "sp/ratio/RatioStore.hpp"
#include "sp/splitter/Splitter.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

namespace sp {

CommandProcessor::CommandProcessor(Splitter& splitter)
  : splitter_(splitter) {}

CmdResult CommandProcessor::ok() {
  CmdResult r;
  r.ok = true;
  return r;
}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool CommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return true;
}

// Absent member -> fallback. Present but not a number -> false.
bool CommandProcessor::getNumberOr(const rapidjson::Value& obj, const char* key,
                                   double fallback, double& out) {
  const auto* v = getMember(obj, key);
  if (!v) {
    out = fallback;
    return true;
  }
  if (!v->IsNumber()) return false;
  out = v->GetDouble();
  return true;
}

bool CommandProcessor::getBool(const rapidjson::Value& obj, const char* key, bool& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsBool()) return false;
  out = v->GetBool();
  return true;
}

bool CommandProcessor::readPointer(const rapidjson::Value& obj, PointerEvent& ev,
                                   CmdResult& err) {
  const auto* idV = getMember(obj, "pointer");
  if (!idV || !idV->IsInt()) {
    err = fail("BAD_COMMAND", "pointer event: missing integer field: pointer");
    return false;
  }
  ev.pointerId = idV->GetInt();

  if (!getNumber(obj, "x", ev.x) || !getNumber(obj, "y", ev.y)) {
    err = fail("BAD_COMMAND", "pointer event: missing numeric fields: x, y");
    return false;
  }

  ev.kind = PointerKind::Mouse;
  if (const auto* kindV = getMember(obj, "kind")) {
    if (!kindV->IsString() || !parsePointerKind(kindV->GetString(), ev.kind)) {
      err = fail("BAD_COMMAND", "pointer event: unknown pointer kind");
      return false;
    }
  }

  ev.buttons = kPrimaryButton;
  if (const auto* buttonsV = getMember(obj, "buttons")) {
    if (!buttonsV->IsUint()) {
      err = fail("BAD_COMMAND", "pointer event: buttons must be an unsigned integer");
      return false;
    }
    ev.buttons = buttonsV->GetUint();
  }
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "layout") return cmdLayout(obj);

  // raw pointer stream on the handle
  if (cmd == "pointerDown") return cmdPointer(obj, PointerPhase::Down);
  if (cmd == "pointerMove") return cmdPointer(obj, PointerPhase::Move);
  if (cmd == "pointerUp") return cmdPointer(obj, PointerPhase::Up);
  if (cmd == "pointerCancel") return cmdPointer(obj, PointerPhase::Cancel);
  if (cmd == "globalPointer") return cmdGlobalPointer(obj);

  // recognised gesture
  if (cmd == "dragStart") return cmdDragStart(obj);
  if (cmd == "dragUpdate") return cmdDragUpdate(obj);
  if (cmd == "dragEnd") { splitter_.dragEnd(); return ok(); }
  if (cmd == "dragCancel") { splitter_.dragCancel(); return ok(); }
  if (cmd == "tap") { splitter_.tap(); return ok(); }
  if (cmd == "doubleTap") { splitter_.doubleTap(); return ok(); }

  if (cmd == "hover") return cmdHover(obj);
  if (cmd == "focus") return cmdFocus(obj);
  if (cmd == "key") return cmdKey(obj);
  if (cmd == "increase") { splitter_.increase(); return ok(); }
  if (cmd == "decrease") { splitter_.decrease(); return ok(); }

  // programmatic ratio control
  if (cmd == "setRatio") return cmdSetRatio(obj);
  if (cmd == "reset") return cmdReset(obj);
  if (cmd == "animateTo") return cmdAnimateTo(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- handlers --------------------

CmdResult CommandProcessor::cmdLayout(const rapidjson::Value& obj) {
  // Absent or null extent means the parent imposes no main-axis bound.
  double extent = std::numeric_limits<double>::infinity();
  const auto* extV = getMember(obj, "extent");
  if (extV && !extV->IsNull()) {
    if (!extV->IsNumber()) return fail("BAD_COMMAND", "layout: extent must be a number or null");
    extent = extV->GetDouble();
  }
  double origin = 0.0;
  if (!getNumberOr(obj, "origin", 0.0, origin)) {
    return fail("BAD_COMMAND", "layout: origin must be a number");
  }
  splitter_.layout(extent, origin);
  return ok();
}

CmdResult CommandProcessor::cmdPointer(const rapidjson::Value& obj, PointerPhase phase) {
  PointerEvent ev;
  CmdResult err;
  if (!readPointer(obj, ev, err)) return err;
  ev.phase = phase;

  switch (phase) {
    case PointerPhase::Down: splitter_.pointerDown(ev); break;
    case PointerPhase::Move: splitter_.pointerMove(ev); break;
    case PointerPhase::Up: splitter_.pointerUp(ev); break;
    case PointerPhase::Cancel: splitter_.pointerCancel(ev); break;
  }
  return ok();
}

CmdResult CommandProcessor::cmdGlobalPointer(const rapidjson::Value& obj) {
  const auto* typeV = getMember(obj, "type");
  if (!typeV || !typeV->IsString()) {
    return fail("BAD_COMMAND", "globalPointer: missing string field: type");
  }

  PointerEvent ev;
  CmdResult err;
  if (!readPointer(obj, ev, err)) return err;

  const char* type = typeV->GetString();
  if (std::strcmp(type, "down") == 0) ev.phase = PointerPhase::Down;
  else if (std::strcmp(type, "move") == 0) ev.phase = PointerPhase::Move;
  else if (std::strcmp(type, "up") == 0) ev.phase = PointerPhase::Up;
  else if (std::strcmp(type, "cancel") == 0) ev.phase = PointerPhase::Cancel;
  else {
    return fail("BAD_COMMAND", "globalPointer: type must be down|move|up|cancel",
                std::string(R"({"type":")") + type + R"("})");
  }

  splitter_.globalPointer(ev);
  return ok();
}

CmdResult CommandProcessor::cmdDragStart(const rapidjson::Value& obj) {
  double x = 0, y = 0;
  if (!getNumber(obj, "x", x) || !getNumber(obj, "y", y)) {
    return fail("BAD_COMMAND", "dragStart: missing numeric fields: x, y");
  }
  PointerKind kind = PointerKind::Unknown;
  if (const auto* kindV = getMember(obj, "kind")) {
    if (!kindV->IsString() || !parsePointerKind(kindV->GetString(), kind)) {
      return fail("BAD_COMMAND", "dragStart: unknown pointer kind");
    }
  }
  splitter_.dragStart(x, y, kind);
  return ok();
}

CmdResult CommandProcessor::cmdDragUpdate(const rapidjson::Value& obj) {
  double x = 0, y = 0;
  if (!getNumber(obj, "x", x) || !getNumber(obj, "y", y)) {
    return fail("BAD_COMMAND", "dragUpdate: missing numeric fields: x, y");
  }
  splitter_.dragUpdate(x, y);
  return ok();
}

CmdResult CommandProcessor::cmdHover(const rapidjson::Value& obj) {
  bool inside = false;
  if (!getBool(obj, "inside", inside)) {
    return fail("BAD_COMMAND", "hover: missing bool field: inside");
  }
  if (inside) splitter_.hoverEnter();
  else splitter_.hoverExit();
  return ok();
}

CmdResult CommandProcessor::cmdFocus(const rapidjson::Value& obj) {
  bool focused = false;
  if (!getBool(obj, "focused", focused)) {
    return fail("BAD_COMMAND", "focus: missing bool field: focused");
  }
  splitter_.focusChanged(focused);
  return ok();
}

CmdResult CommandProcessor::cmdKey(const rapidjson::Value& obj) {
  const auto* keyV = getMember(obj, "key");
  if (!keyV || !keyV->IsString()) {
    return fail("BAD_COMMAND", "key: missing string field: key");
  }
  KeyCode key = KeyCode::None;
  if (!parseKeyName(keyV->GetString(), key)) {
    return fail("BAD_KEY", "key: unknown key name",
                std::string(R"({"key":")") + keyV->GetString() + R"("})");
  }
  splitter_.handleKey(key);
  return ok();
}

CmdResult CommandProcessor::cmdSetRatio(const rapidjson::Value& obj) {
  double ratio = 0, threshold = 0;
  if (!getNumber(obj, "ratio", ratio)) {
    return fail("BAD_COMMAND", "setRatio: missing numeric field: ratio");
  }
  if (!getNumberOr(obj, "threshold", kDefaultUpdateThreshold, threshold)) {
    return fail("BAD_COMMAND", "setRatio: threshold must be a number");
  }
  splitter_.store().update(ratio, threshold);
  return ok();
}

CmdResult CommandProcessor::cmdReset(const rapidjson::Value& obj) {
  double to = 0.5;
  if (!getNumberOr(obj, "to", 0.5, to)) {
    return fail("BAD_COMMAND", "reset: to must be a number");
  }
  if (!(to >= 0.0 && to <= 1.0)) {
    return fail("BAD_COMMAND", "reset: to must be between 0.0 and 1.0");
  }
  splitter_.store().reset(to);
  return ok();
}

CmdResult CommandProcessor::cmdAnimateTo(const rapidjson::Value& obj) {
  double target = 0, durationMs = 0, steps = 0;
  if (!getNumber(obj, "target", target)) {
    return fail("BAD_COMMAND", "animateTo: missing numeric field: target");
  }
  if (!getNumberOr(obj, "durationMs", kDefaultInterpolationMicros / 1000.0, durationMs) ||
      !getNumberOr(obj, "steps", kDefaultInterpolationSteps, steps)) {
    return fail("BAD_COMMAND", "animateTo: durationMs and steps must be numbers");
  }
  // Range-check before the integer conversions below.
  const double maxDurationMs =
    static_cast<double>(std::numeric_limits<std::int64_t>::max() / 1000);
  if (!std::isfinite(target) || !(durationMs >= 0.0 && durationMs <= maxDurationMs)) {
    return fail("BAD_COMMAND", "animateTo: target and durationMs out of range");
  }
  if (!(steps >= 0.0 && steps <= static_cast<double>(std::numeric_limits<int>::max()))) {
    return fail("BAD_COMMAND", "animateTo: steps out of range");
  }
  splitter_.store().interpolateTo(target,
                                  static_cast<std::int64_t>(durationMs * 1000.0),
                                  easing::easeOut,
                                  static_cast<int>(steps));
  return ok();
}

std::string CommandProcessor::stateJson() const {
  // Extents follow the current ratio within the last laid-out geometry.
  const SplitLayout& lay = splitter_.lastLayout();
  double first = lay.firstExtent;
  double second = lay.secondExtent;
  if (lay.bounded) {
    ResolvedSplit split = resolveSplit(splitter_.store().value(), lay.availableExtent,
                                       splitter_.config().constraints());
    first = split.firstExtent;
    second = split.secondExtent;
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("ratio"); w.Double(splitter_.store().value());
  w.Key("dragging"); w.Bool(splitter_.isDragging());
  w.Key("state"); w.String(dragStateName(splitter_.state()));
  w.Key("first"); w.Double(first);
  w.Key("second"); w.Double(second);
  w.EndObject();
  return sb.GetString();
}

} // namespace sp
