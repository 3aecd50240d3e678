#include "sp/pointer/PointerRouter.hpp"
#include "sp/ratio/RatioStore.hpp"

#include <algorithm>

namespace sp {

PointerRouter::~PointerRouter() {
  resetForTesting();
}

void PointerRouter::init() {
  initialized_ = true;
}

void PointerRouter::teardown() {
  initialized_ = false;
  currentDragger_ = nullptr;
  activePointerId_ = -1;
}

void PointerRouter::resetForTesting() {
  teardown();
  for (auto* s : stores_) s->router_ = nullptr;
  stores_.clear();
}

void PointerRouter::registerStore(RatioStore* store) {
  init();
  if (!store || isRegistered(store)) return;
  if (store->router_ && store->router_ != this) {
    store->router_->unregisterStore(store);
  }
  stores_.push_back(store);
  store->router_ = this;
}

void PointerRouter::unregisterStore(RatioStore* store) {
  if (!store) return;
  if (currentDragger_ == store) {
    currentDragger_ = nullptr;
    activePointerId_ = -1;
  }
  stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
  if (store->router_ == this) store->router_ = nullptr;
}

bool PointerRouter::isRegistered(const RatioStore* store) const {
  return std::find(stores_.begin(), stores_.end(), store) != stores_.end();
}

void PointerRouter::setDragging(RatioStore* store, int pointerId) {
  if (store) registerStore(store);
  currentDragger_ = store;
  activePointerId_ = store ? pointerId : -1;
}

void PointerRouter::clearDragging() {
  currentDragger_ = nullptr;
  activePointerId_ = -1;
}

void PointerRouter::clearDragging(const RatioStore* store) {
  if (store && currentDragger_ == store) clearDragging();
}

bool PointerRouter::handleGlobalEvent(const PointerEvent& ev) {
  if (!initialized_) return false;

  bool isUp = ev.phase == PointerPhase::Up || ev.phase == PointerPhase::Cancel;
  if (!isUp || !currentDragger_ || activePointerId_ < 0 ||
      ev.pointerId != activePointerId_) {
    return false;
  }

  RatioStore* store = currentDragger_;
  currentDragger_ = nullptr;
  activePointerId_ = -1;
  store->stopDrag();
  return true;
}

} // namespace sp
