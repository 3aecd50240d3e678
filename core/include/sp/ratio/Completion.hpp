#pragma once
#include <functional>
#include <memory>
#include <vector>

namespace sp {

// Single-threaded completion signal returned by RatioStore::interpolateTo().
// Copies share state. A Completion is resolved exactly once; continuations
// registered after resolution run immediately.
class Completion {
public:
  Completion();

  static Completion resolved();

  bool isDone() const { return state_->done; }

  void then(std::function<void()> fn);

  // Marks done and runs continuations in registration order.
  void resolve();

private:
  struct State {
    bool done{false};
    std::vector<std::function<void()>> continuations;
  };
  std::shared_ptr<State> state_;
};

} // namespace sp
