#pragma once
#include <cstdint>

namespace sp {

enum class Axis : std::uint8_t { Horizontal, Vertical };

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, Up, Down, PageUp, PageDown, Home, End
};

enum class PointerKind : std::uint8_t {
  Unknown = 0, Mouse, Touch, Stylus, InvertedStylus, Trackpad
};

enum class PointerPhase : std::uint8_t { Down, Move, Up, Cancel };

inline constexpr std::uint32_t kPrimaryButton = 0x01;

// Generic pointer event, NOT tied to any windowing toolkit.
struct PointerEvent {
  int pointerId{0};
  double x{0}, y{0};       // global pixels, 0=left/top
  PointerKind kind{PointerKind::Mouse};
  PointerPhase phase{PointerPhase::Down};
  std::uint32_t buttons{kPrimaryButton};
};

inline double mainAxisOf(Axis axis, double x, double y) {
  return axis == Axis::Horizontal ? x : y;
}

// Kinds that may start a drag on the handle.
inline bool isSupportedPointerKind(PointerKind kind) {
  switch (kind) {
    case PointerKind::Mouse:
    case PointerKind::Touch:
    case PointerKind::Stylus:
    case PointerKind::InvertedStylus:
    case PointerKind::Trackpad:
    case PointerKind::Unknown:
      return true;
  }
  return false;
}

const char* axisName(Axis axis);
const char* keyName(KeyCode key);
bool parseKeyName(const char* name, KeyCode& out);
bool parsePointerKind(const char* name, PointerKind& out);

} // namespace sp
