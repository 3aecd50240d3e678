#pragma once
#include "sp/input/InputEvent.hpp"

#ifdef SP_HAS_GLFW

#include <vector>

struct GLFWwindow;
struct GLFWcursor;

namespace sp {

// Everything the window produced since the last poll, already translated
// into toolkit-neutral events.
struct WindowInput {
  std::vector<PointerEvent> pointers;
  std::vector<KeyCode> keys;
  bool focusLost{false};
  bool shouldClose{false};
};

class GlfwContext {
public:
  GlfwContext();
  ~GlfwContext();

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height, const char* title);
  void swapBuffers();

  int width() const { return width_; }
  int height() const { return height_; }

  WindowInput pollInput();
  bool shouldClose() const;

  // Resize cursor while a drag shield is up.
  void setResizeCursor(bool on, Axis axis);

private:
  GLFWwindow* window_{nullptr};
  GLFWcursor* hResize_{nullptr};
  GLFWcursor* vResize_{nullptr};
  int width_{0};
  int height_{0};

  WindowInput pending_;
  double cursorX_{0};
  double cursorY_{0};
  bool buttonDown_{false};

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void focusCallback(GLFWwindow* w, int focused);
};

} // namespace sp

#endif // SP_HAS_GLFW
