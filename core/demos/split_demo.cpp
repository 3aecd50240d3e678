// D7.1 - Interactive split demo
// GLFW: two panes and a draggable divider, arrow/page/home/end keys,
// double-click resets to the configured ratio.
// Usage: split_demo [config.json]

#include "sp/gl/GlfwContext.hpp"
#include "sp/interaction/SplitterHost.hpp"
#include "sp/pointer/PointerRouter.hpp"
#include "sp/ratio/RatioStore.hpp"
#include "sp/ratio/Scheduler.hpp"
#include "sp/splitter/Splitter.hpp"
#include "sp/splitter/SplitterConfig.hpp"

#include <glad/gl.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {

constexpr std::int64_t kDoubleClickMicros = 300000;

bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// Swaps the cursor while the drag shield is up.
class DemoHost : public sp::SplitterHost {
public:
  explicit DemoHost(sp::GlfwContext& ctx) : ctx_(ctx) {}

  sp::HostToken insertOverlay(sp::Axis axis) override {
    ctx_.setResizeCursor(true, axis);
    return ++nextToken_;
  }
  void removeOverlay(sp::HostToken) override {
    ctx_.setResizeCursor(false, sp::Axis::Horizontal);
  }

private:
  sp::GlfwContext& ctx_;
  sp::HostToken nextToken_{0};
};

void fillRect(int x, int y, int w, int h, int fbHeight, float r, float g, float b) {
  if (w <= 0 || h <= 0) return;
  glScissor(x, fbHeight - y - h, w, h);  // GL origin is bottom-left
  glClearColor(r, g, b, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);
}

} // namespace

int main(int argc, char** argv) {
  sp::SplitterConfig cfg;
  cfg.minPanelSize = 120.0;
  cfg.snapPoints = {0.25, 0.5, 0.75};
  cfg.doubleTapResetTo = 0.5;
  cfg.dividerThickness = 8.0;

  if (argc > 1) {
    std::string text;
    sp::ConfigError err;
    if (!readFile(argv[1], text)) {
      std::fprintf(stderr, "split_demo: cannot read %s, using defaults\n", argv[1]);
    } else if (!sp::parseSplitterConfig(text, cfg, err) ||
               !sp::validateSplitterConfig(cfg, err)) {
      std::fprintf(stderr, "split_demo: rejected %s: %s (%s)\n",
                   argv[1], err.message.c_str(), err.code.c_str());
      return 1;
    }
  }

  sp::GlfwContext ctx;
  if (!ctx.init(960, 600, "SplitPane")) return 1;

  sp::SteadyScheduler scheduler;
  sp::PointerRouter router;
  DemoHost host(ctx);
  sp::Splitter splitter(router, cfg, &host, &scheduler);

  splitter.events().dragEnd.subscribe([](double r) {
    std::printf("drag end at %.3f\n", r);
  });

  std::int64_t lastDown = -kDoubleClickMicros;
  glEnable(GL_SCISSOR_TEST);

  while (true) {
    sp::WindowInput in = ctx.pollInput();
    if (in.shouldClose) break;

    const bool horizontal = cfg.axis == sp::Axis::Horizontal;
    const int mainSize = horizontal ? ctx.width() : ctx.height();
    sp::SplitLayout lay = splitter.layout(mainSize);

    for (const auto& ev : in.pointers) {
      splitter.globalPointer(ev);
      switch (ev.phase) {
        case sp::PointerPhase::Down:
          if (splitter.pointerDown(ev)) {
            std::int64_t now = scheduler.nowMicros();
            if (now - lastDown < kDoubleClickMicros) {
              splitter.pointerUp(ev);
              splitter.doubleTap();
            } else {
              splitter.dragStart(ev.x, ev.y, ev.kind);
            }
            lastDown = now;
          }
          break;
        case sp::PointerPhase::Move:
          if (splitter.isDragging()) splitter.dragUpdate(ev.x, ev.y);
          else if (splitter.dragMachine().hitTest(ev.x, ev.y)) splitter.hoverEnter();
          else splitter.hoverExit();
          break;
        case sp::PointerPhase::Up:
          splitter.pointerUp(ev);
          splitter.dragEnd();
          break;
        case sp::PointerPhase::Cancel:
          splitter.pointerCancel(ev);
          splitter.dragCancel();
          break;
      }
    }

    if (!in.keys.empty()) splitter.focusChanged(true);
    for (sp::KeyCode key : in.keys) splitter.handleKey(key);
    if (in.focusLost) splitter.focusChanged(false);

    scheduler.pump();
    lay = splitter.layout(mainSize);

    const int W = ctx.width();
    const int H = ctx.height();
    glViewport(0, 0, W, H);

    int first = static_cast<int>(lay.firstExtent);
    int thick = lay.showDivider ? static_cast<int>(cfg.dividerThickness) : 0;
    int second = static_cast<int>(lay.secondExtent);
    if (!lay.bounded) {
      first = mainSize / 2;
      second = mainSize - first;
    }

    sp::HandleDetails hd = splitter.handleDetails();
    float dv = hd.isDragging ? 0.85f : (hd.isHovering || hd.isFocused ? 0.6f : 0.4f);

    if (horizontal) {
      fillRect(0, 0, first, H, H, 0.12f, 0.16f, 0.22f);
      fillRect(first, 0, thick, H, H, dv, dv, dv);
      fillRect(first + thick, 0, second, H, H, 0.18f, 0.13f, 0.13f);
    } else {
      fillRect(0, 0, W, first, H, 0.12f, 0.16f, 0.22f);
      fillRect(0, first, W, thick, H, dv, dv, dv);
      fillRect(0, first + thick, W, second, H, 0.18f, 0.13f, 0.13f);
    }

    ctx.swapBuffers();
  }

  return 0;
}
