#include "sp/splitter/Splitter.hpp"

#include "sp/layout/ConstraintResolver.hpp"
#include "sp/pointer/PointerRouter.hpp"
#include "sp/ratio/RatioStore.hpp"

#include <stdexcept>

namespace sp {

namespace {

const SplitterConfig& validated(const SplitterConfig& cfg) {
  ConfigError err;
  if (!validateSplitterConfig(cfg, err)) {
    throw std::invalid_argument("Splitter: " + err.code + ": " + err.message);
  }
  return cfg;
}

} // namespace

Splitter::Splitter(PointerRouter& router, const SplitterConfig& config,
                   SplitterHost* host, Scheduler* scheduler)
  : router_(router), host_(host), scheduler_(scheduler),
    config_(validated(config)), token_(nextAttachToken()),
    ownedStore_(std::make_unique<RatioStore>(config.initialRatio, config.tolerateReattach)),
    store_(ownedStore_.get()),
    machine_(*store_, router, events_, host),
    keyboard_(*store_, events_, host) {
  attachStore();
  applyOptions();
}

Splitter::Splitter(PointerRouter& router, RatioStore& store, const SplitterConfig& config,
                   SplitterHost* host, Scheduler* scheduler)
  : router_(router), host_(host), scheduler_(scheduler),
    config_(validated(config)), token_(nextAttachToken()),
    store_(&store),
    machine_(store, router, events_, host),
    keyboard_(store, events_, host) {
  attachStore();
  applyOptions();
}

Splitter::~Splitter() {
  dispose();
}

void Splitter::attachStore() {
  store_->attach(token_);
  router_.registerStore(store_);
  if (scheduler_) store_->setScheduler(scheduler_);
}

void Splitter::applyOptions() {
  DragOptions d;
  d.axis = config_.axis;
  d.resizable = config_.resizable;
  d.overlayEnabled = config_.overlayEnabled;
  d.holdScrollWhileDragging = config_.holdScrollWhileDragging;
  d.hitSlop = config_.handleHitSlop;
  d.snapPoints = config_.snapPoints;
  d.snapTolerance = config_.snapTolerance;
  d.doubleTapResetTo = config_.doubleTapResetTo;
  d.updateThreshold = config_.updateThreshold;
  machine_.setOptions(d);

  KeyboardOptions k;
  k.enabled = config_.enableKeyboard && config_.resizable;
  k.keyboardStep = config_.keyboardStep;
  k.pageStep = config_.pageStep;
  k.snapPoints = config_.snapPoints;
  k.snapTolerance = config_.snapTolerance;
  keyboard_.setOptions(k);

  pushGeometry();
}

void Splitter::pushGeometry() {
  DragGeometry g;
  g.extent = layout_.bounded ? layout_.availableExtent : 0.0;
  g.handleStart = origin_ + layout_.dividerOffset;
  g.thickness = layout_.showDivider ? config_.dividerThickness : 0.0;
  g.constraints = config_.constraints();
  machine_.setGeometry(g);
  keyboard_.setGeometry(g.extent, g.constraints);
}

void Splitter::setConfig(const SplitterConfig& config) {
  validated(config);
  if (config.axis != config_.axis || !config.resizable) machine_.stopDrag();
  config_ = config;
  applyOptions();
}

void Splitter::setStore(RatioStore& store) {
  if (disposed_ || &store == store_) return;

  // Attach first so a rejected store leaves this splitter untouched.
  store.attach(token_);

  RatioStore* previous = store_;
  machine_.setStore(store);
  keyboard_.setStore(store);

  previous->detach(token_);
  router_.unregisterStore(previous);
  std::unique_ptr<RatioStore> retired = std::move(ownedStore_);
  if (retired) retired->dispose();

  store_ = &store;
  router_.registerStore(store_);
  if (scheduler_) store_->setScheduler(scheduler_);
}

void Splitter::setHost(SplitterHost* host) {
  host_ = host;
  machine_.setHost(host);
  keyboard_.setHost(host);
}

SplitLayout Splitter::layout(double mainAxisMax, double origin) {
  SplitLayout out;
  origin_ = origin;

  ExtentResolution avail = availableExtent(mainAxisMax, config_.dividerThickness,
                                           config_.unboundedPolicy, config_.fallbackExtent);
  if (!avail.bounded) {
    out.bounded = false;
    out.showDivider = false;
    out.ratio = store_->value();
    layout_ = out;
    pushGeometry();
    return out;
  }

  ResolvedSplit split = resolveSplit(store_->value(), avail.extent, config_.constraints());
  out.availableExtent = avail.extent;
  out.ratio = split.ratio;
  out.firstExtent = split.firstExtent;
  out.secondExtent = split.secondExtent;
  out.dividerOffset = split.firstExtent;
  out.cramped = split.cramped;
  layout_ = out;
  pushGeometry();
  return out;
}

void Splitter::globalPointer(const PointerEvent& ev) {
  if (disposed_) return;
  router_.handleGlobalEvent(ev);
  machine_.globalPointer(ev);
}

bool Splitter::dragStart(double x, double y, PointerKind kind) {
  return machine_.dragStart(x, y, kind);
}

bool Splitter::dragUpdate(double x, double y) {
  return machine_.dragUpdate(x, y);
}

void Splitter::dragEnd() {
  machine_.dragEnd();
}

void Splitter::dragCancel() {
  machine_.dragCancel();
}

void Splitter::focusChanged(bool focused) {
  machine_.focusChanged(focused);
  if (!focused) keyboard_.endAdjustment();
}

bool Splitter::handleKey(KeyCode key) {
  if (disposed_) return false;
  return keyboard_.handleKey(key, config_.axis);
}

bool Splitter::increase() {
  if (disposed_) return false;
  return keyboard_.increase();
}

bool Splitter::decrease() {
  if (disposed_) return false;
  return keyboard_.decrease();
}

bool Splitter::endKeyboardAdjustment() {
  if (disposed_) return false;
  return keyboard_.endAdjustment();
}

void Splitter::dispose() {
  if (disposed_) return;
  disposed_ = true;

  machine_.dispose();
  if (ownedStore_) {
    ownedStore_->detach(token_);
    ownedStore_->dispose();
  } else {
    store_->detach(token_);
    router_.unregisterStore(store_);
  }
  events_.clear();
}

} // namespace sp
