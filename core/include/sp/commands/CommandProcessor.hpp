#pragma once
#include "sp/input/InputEvent.hpp"

#include <string>

#include <rapidjson/document.h>

namespace sp {

class Splitter;

struct CmdError {
  std::string code;     // e.g. "BAD_COMMAND"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
};

// Drives one Splitter from JSON command objects, e.g.
//   {"cmd":"layout","extent":800}
//   {"cmd":"dragStart","x":400,"y":10,"kind":"mouse"}
class CommandProcessor {
public:
  explicit CommandProcessor(Splitter& splitter);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // {"ratio":..,"dragging":..,"state":"idle|armed|dragging","first":..,"second":..}
  std::string stateJson() const;

private:
  Splitter& splitter_;

  // ---- handlers ----
  CmdResult cmdLayout(const rapidjson::Value& obj);
  CmdResult cmdPointer(const rapidjson::Value& obj, PointerPhase phase);
  CmdResult cmdGlobalPointer(const rapidjson::Value& obj);
  CmdResult cmdDragStart(const rapidjson::Value& obj);
  CmdResult cmdDragUpdate(const rapidjson::Value& obj);
  CmdResult cmdHover(const rapidjson::Value& obj);
  CmdResult cmdFocus(const rapidjson::Value& obj);
  CmdResult cmdKey(const rapidjson::Value& obj);
  CmdResult cmdSetRatio(const rapidjson::Value& obj);
  CmdResult cmdReset(const rapidjson::Value& obj);
  CmdResult cmdAnimateTo(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  static bool getNumberOr(const rapidjson::Value& obj, const char* key, double fallback,
                          double& out);
  static bool getBool(const rapidjson::Value& obj, const char* key, bool& out);
  static bool readPointer(const rapidjson::Value& obj, PointerEvent& ev, CmdResult& err);
  static CmdResult ok();
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace sp
