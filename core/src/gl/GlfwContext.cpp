#ifdef SP_HAS_GLFW

#include "sp/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>
#include <utility>

namespace sp {

namespace {

// The mouse is the only pointer GLFW reports.
constexpr int kMousePointerId = 1;

KeyCode translateKey(int key) {
  switch (key) {
    case GLFW_KEY_LEFT: return KeyCode::Left;
    case GLFW_KEY_RIGHT: return KeyCode::Right;
    case GLFW_KEY_UP: return KeyCode::Up;
    case GLFW_KEY_DOWN: return KeyCode::Down;
    case GLFW_KEY_PAGE_UP: return KeyCode::PageUp;
    case GLFW_KEY_PAGE_DOWN: return KeyCode::PageDown;
    case GLFW_KEY_HOME: return KeyCode::Home;
    case GLFW_KEY_END: return KeyCode::End;
    default: return KeyCode::None;
  }
}

} // namespace

GlfwContext::GlfwContext() = default;

GlfwContext::~GlfwContext() {
  if (hResize_) glfwDestroyCursor(hResize_);
  if (vResize_) glfwDestroyCursor(vResize_);
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height, const char* title) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, title, nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);
  hResize_ = glfwCreateStandardCursor(GLFW_HRESIZE_CURSOR);
  vResize_ = glfwCreateStandardCursor(GLFW_VRESIZE_CURSOR);

  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetWindowFocusCallback(window_, focusCallback);

  glfwGetCursorPos(window_, &cursorX_, &cursorY_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

WindowInput GlfwContext::pollInput() {
  glfwPollEvents();

  if (window_) {
    glfwGetFramebufferSize(window_, &width_, &height_);
  }

  WindowInput out = std::move(pending_);
  pending_ = WindowInput{};
  out.shouldClose = shouldClose();
  return out;
}

void GlfwContext::setResizeCursor(bool on, Axis axis) {
  if (!window_) return;
  GLFWcursor* c = nullptr;
  if (on) c = axis == Axis::Horizontal ? hResize_ : vResize_;
  glfwSetCursor(window_, c);
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->cursorX_ = x;
  self->cursorY_ = y;

  PointerEvent ev;
  ev.pointerId = kMousePointerId;
  ev.x = x;
  ev.y = y;
  ev.kind = PointerKind::Mouse;
  ev.phase = PointerPhase::Move;
  ev.buttons = self->buttonDown_ ? kPrimaryButton : 0u;
  self->pending_.pointers.push_back(ev);
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  PointerEvent ev;
  ev.pointerId = kMousePointerId;
  ev.x = self->cursorX_;
  ev.y = self->cursorY_;
  ev.kind = PointerKind::Mouse;
  ev.phase = action == GLFW_PRESS ? PointerPhase::Down : PointerPhase::Up;
  // Non-primary buttons still produce events; the splitter filters them.
  ev.buttons = button == GLFW_MOUSE_BUTTON_LEFT ? kPrimaryButton : 0x02u;

  if (button == GLFW_MOUSE_BUTTON_LEFT) self->buttonDown_ = (action == GLFW_PRESS);
  self->pending_.pointers.push_back(ev);
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || action == GLFW_RELEASE) return;

  if (key == GLFW_KEY_ESCAPE) {
    glfwSetWindowShouldClose(w, GLFW_TRUE);
    return;
  }
  KeyCode code = translateKey(key);
  if (code != KeyCode::None) self->pending_.keys.push_back(code);
}

void GlfwContext::focusCallback(GLFWwindow* w, int focused) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (self && !focused) self->pending_.focusLost = true;
}

} // namespace sp

#endif // SP_HAS_GLFW
