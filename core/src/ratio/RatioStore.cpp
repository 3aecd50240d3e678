#include "sp/ratio/RatioStore.hpp"
#include "sp/pointer/PointerRouter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace sp {

namespace {

double clampUnit(double v) {
  if (std::isnan(v)) return 0.0;
  return std::max(0.0, std::min(1.0, v));
}

} // namespace

RatioStore::RatioStore(double initialRatio, bool tolerateReattach)
  : tolerateReattach_(tolerateReattach) {
  if (!(initialRatio >= 0.0 && initialRatio <= 1.0)) {
    throw std::invalid_argument("RatioStore: initialRatio must be between 0.0 and 1.0");
  }
  value_ = initialRatio;
}

RatioStore::~RatioStore() {
  dispose();
}

bool RatioStore::update(double ratio, double threshold) {
  if (disposed_) return false;
  double clamped = clampUnit(ratio);
  if (std::fabs(clamped - value_) > threshold) {
    setValue(clamped);
    return true;
  }
  return false;
}

void RatioStore::reset(double to) {
  if (!(to >= 0.0 && to <= 1.0)) {
    throw std::invalid_argument("RatioStore::reset: to must be between 0.0 and 1.0");
  }
  if (disposed_) return;
  setValue(to);
}

Completion RatioStore::interpolateTo(double target, std::int64_t durationMicros,
                                     EasingFn ease, int steps) {
  if (disposed_) return Completion::resolved();

  double goal = clampUnit(target);
  cancelInterpolation();

  if (std::fabs(goal - value_) < 1e-7 || durationMicros <= 0 || steps <= 0 ||
      !scheduler_) {
    setValue(goal);
    return Completion::resolved();
  }

  const std::int64_t interval = std::max<std::int64_t>(1, durationMicros / steps);

  interpStart_ = value_;
  interpGoal_ = goal;
  interpSteps_ = steps;
  interpStep_ = 0;
  interpEase_ = ease ? std::move(ease) : EasingFn(easing::linear);

  Completion done;
  pending_ = done;
  timer_ = scheduler_->schedulePeriodic(interval, [this]() { onInterpolationTick(); });
  return done;
}

void RatioStore::onInterpolationTick() {
  interpStep_ += 1;
  if (interpStep_ >= interpSteps_) {
    scheduler_->cancel(timer_);
    timer_ = 0;
    Completion finished = pending_;
    pending_ = Completion::resolved();
    setValue(interpGoal_);
    finished.resolve();
    return;
  }
  double t = std::min(1.0, static_cast<double>(interpStep_) / interpSteps_);
  setValue(clampUnit(interpStart_ + (interpGoal_ - interpStart_) * interpEase_(t)));
}

void RatioStore::cancelInterpolation() {
  if (timer_ != 0 && scheduler_) {
    scheduler_->cancel(timer_);
  }
  timer_ = 0;
  Completion unfinished = pending_;
  pending_ = Completion::resolved();
  unfinished.resolve();
}

void RatioStore::setScheduler(Scheduler* scheduler) {
  if (scheduler_ == scheduler) return;
  cancelInterpolation();
  scheduler_ = scheduler;
}

void RatioStore::setDragging(bool dragging) {
  if (disposed_ && dragging) return;
  if (dragging_ == dragging) return;
  dragging_ = dragging;
  auto snapshot = draggingListeners_;
  for (auto& l : snapshot) l.fn(dragging_);
}

ListenerId RatioStore::addListener(std::function<void(double)> fn) {
  if (disposed_ || !fn) return 0;
  ListenerId id = nextListenerId_++;
  listeners_.push_back({id, std::move(fn)});
  return id;
}

void RatioStore::removeListener(ListenerId id) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
                   [id](const ValueListener& l) { return l.id == id; }),
    listeners_.end());
}

ListenerId RatioStore::addDraggingListener(std::function<void(bool)> fn) {
  if (disposed_ || !fn) return 0;
  ListenerId id = nextListenerId_++;
  draggingListeners_.push_back({id, std::move(fn)});
  return id;
}

void RatioStore::removeDraggingListener(ListenerId id) {
  draggingListeners_.erase(
    std::remove_if(draggingListeners_.begin(), draggingListeners_.end(),
                   [id](const DraggingListener& l) { return l.id == id; }),
    draggingListeners_.end());
}

void RatioStore::attach(AttachToken token) {
  if (token == kInvalidId || owner_ == token) return;
  if (owner_ != kInvalidId) {
    if (!tolerateReattach_) {
      throw std::logic_error(
        "RatioStore is already attached to another splitter. "
        "A store must not be shared across splitters simultaneously.");
    }
    std::fprintf(stderr,
                 "RatioStore: re-attached from owner %llu to %llu\n",
                 static_cast<unsigned long long>(owner_),
                 static_cast<unsigned long long>(token));
  }
  owner_ = token;
}

void RatioStore::detach(AttachToken token) {
  if (owner_ == token) owner_ = kInvalidId;
}

void RatioStore::setStopDragCallback(std::function<void()> cb) {
  stopDrag_ = std::move(cb);
}

void RatioStore::stopDrag() {
  auto cb = std::move(stopDrag_);
  stopDrag_ = nullptr;
  if (cb) cb();
}

void RatioStore::dispose() {
  if (disposed_) return;
  if (router_) router_->unregisterStore(this);
  cancelInterpolation();
  stopDrag_ = nullptr;
  dragging_ = false;
  disposed_ = true;
  listeners_.clear();
  draggingListeners_.clear();
}

void RatioStore::setValue(double v) {
  if (v == value_) return;
  value_ = v;
  notifyValue();
}

void RatioStore::notifyValue() {
  auto snapshot = listeners_;
  for (auto& l : snapshot) l.fn(value_);
}

} // namespace sp
