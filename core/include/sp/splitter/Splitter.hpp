#pragma once
#include "sp/events/EventEmitter.hpp"
#include "sp/ids/Id.hpp"
#include "sp/input/InputEvent.hpp"
#include "sp/interaction/DragStateMachine.hpp"
#include "sp/interaction/KeyboardAdjuster.hpp"
#include "sp/splitter/SplitterConfig.hpp"

#include <memory>

namespace sp {

class PointerRouter;
class RatioStore;
class Scheduler;
class SplitterHost;

// Result of one layout pass, in main-axis pixels relative to the splitter.
struct SplitLayout {
  bool bounded{true};       // false: unbounded FlexExpand, regions share equally
  bool showDivider{true};
  double ratio{0.5};
  double firstExtent{0.0};
  double secondExtent{0.0};
  double dividerOffset{0.0};  // leading edge of the divider
  double availableExtent{0.0};
  bool cramped{false};
};

// One two-pane divider: a RatioStore (owned or borrowed), the drag state
// machine, the keyboard adjuster and the last resolved geometry.
class Splitter {
public:
  // Owns a store created with config.initialRatio.
  // Throws std::invalid_argument on an invalid configuration.
  Splitter(PointerRouter& router, const SplitterConfig& config,
           SplitterHost* host = nullptr, Scheduler* scheduler = nullptr);

  // Borrows a caller store. Throws std::logic_error when the store is
  // already attached to another splitter.
  Splitter(PointerRouter& router, RatioStore& store, const SplitterConfig& config,
           SplitterHost* host = nullptr, Scheduler* scheduler = nullptr);

  ~Splitter();

  Splitter(const Splitter&) = delete;
  Splitter& operator=(const Splitter&) = delete;

  const SplitterConfig& config() const { return config_; }
  // Throws std::invalid_argument and keeps the old config when invalid.
  void setConfig(const SplitterConfig& config);

  RatioStore& store() { return *store_; }
  const RatioStore& store() const { return *store_; }
  bool ownsStore() const { return ownedStore_ != nullptr; }
  AttachToken token() const { return token_; }

  // Detaches from the current store and attaches to `store`. A previously
  // owned store is disposed.
  void setStore(RatioStore& store);

  void setHost(SplitterHost* host);

  // `origin` is the global main-axis position of the splitter's leading edge,
  // used for hit testing.
  SplitLayout layout(double mainAxisMax, double origin = 0.0);
  const SplitLayout& lastLayout() const { return layout_; }

  // ---- input ----
  bool pointerDown(const PointerEvent& ev) { return machine_.pointerDown(ev); }
  void pointerMove(const PointerEvent& ev) { machine_.pointerMove(ev); }
  void pointerUp(const PointerEvent& ev) { machine_.pointerUp(ev); }
  void pointerCancel(const PointerEvent& ev) { machine_.pointerCancel(ev); }

  // Window-wide pointer stream: router first, then the defensive check.
  void globalPointer(const PointerEvent& ev);

  bool dragStart(double x, double y, PointerKind kind = PointerKind::Unknown);
  bool dragUpdate(double x, double y);
  void dragEnd();
  void dragCancel();

  void hoverEnter() { machine_.hoverEnter(); }
  void hoverExit() { machine_.hoverExit(); }
  // Losing focus closes the keyboard adjustment and snaps.
  void focusChanged(bool focused);

  bool handleKey(KeyCode key);
  bool increase();
  bool decrease();
  bool endKeyboardAdjustment();

  void tap() { machine_.tap(); }
  Completion doubleTap() { return machine_.doubleTap(); }

  DragState state() const { return machine_.state(); }
  bool isDragging() const { return machine_.isDragging(); }
  HandleDetails handleDetails() const { return machine_.handleDetails(); }

  SplitterEvents& events() { return events_; }
  DragStateMachine& dragMachine() { return machine_; }
  KeyboardAdjuster& keyboard() { return keyboard_; }

  void dispose();
  bool isDisposed() const { return disposed_; }

private:
  PointerRouter& router_;
  SplitterHost* host_;
  Scheduler* scheduler_;
  SplitterConfig config_;
  AttachToken token_;

  std::unique_ptr<RatioStore> ownedStore_;
  RatioStore* store_;

  SplitterEvents events_;
  DragStateMachine machine_;
  KeyboardAdjuster keyboard_;

  SplitLayout layout_;
  double origin_{0.0};
  bool disposed_{false};

  void attachStore();
  void applyOptions();
  void pushGeometry();
};

} // namespace sp
