#include "sp/input/InputEvent.hpp"

#include <cstring>

namespace sp {

namespace {

struct KeyNameEntry {
  KeyCode key;
  const char* name;
};

constexpr KeyNameEntry kKeyNames[] = {
  {KeyCode::Left, "left"},
  {KeyCode::Right, "right"},
  {KeyCode::Up, "up"},
  {KeyCode::Down, "down"},
  {KeyCode::PageUp, "pageUp"},
  {KeyCode::PageDown, "pageDown"},
  {KeyCode::Home, "home"},
  {KeyCode::End, "end"},
};

} // namespace

const char* axisName(Axis axis) {
  return axis == Axis::Horizontal ? "horizontal" : "vertical";
}

const char* keyName(KeyCode key) {
  for (const auto& e : kKeyNames) {
    if (e.key == key) return e.name;
  }
  return "none";
}

bool parseKeyName(const char* name, KeyCode& out) {
  if (!name) return false;
  for (const auto& e : kKeyNames) {
    if (std::strcmp(e.name, name) == 0) {
      out = e.key;
      return true;
    }
  }
  return false;
}

bool parsePointerKind(const char* name, PointerKind& out) {
  if (!name) return false;
  if (std::strcmp(name, "mouse") == 0) { out = PointerKind::Mouse; return true; }
  if (std::strcmp(name, "touch") == 0) { out = PointerKind::Touch; return true; }
  if (std::strcmp(name, "stylus") == 0) { out = PointerKind::Stylus; return true; }
  if (std::strcmp(name, "invertedStylus") == 0) { out = PointerKind::InvertedStylus; return true; }
  if (std::strcmp(name, "trackpad") == 0) { out = PointerKind::Trackpad; return true; }
  if (std::strcmp(name, "unknown") == 0) { out = PointerKind::Unknown; return true; }
  return false;
}

} // namespace sp
