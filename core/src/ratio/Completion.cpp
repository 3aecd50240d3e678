#include "sp/ratio/Completion.hpp"

namespace sp {

Completion::Completion() : state_(std::make_shared<State>()) {}

Completion Completion::resolved() {
  Completion c;
  c.state_->done = true;
  return c;
}

void Completion::then(std::function<void()> fn) {
  if (!fn) return;
  if (state_->done) {
    fn();
    return;
  }
  state_->continuations.push_back(std::move(fn));
}

void Completion::resolve() {
  if (state_->done) return;
  state_->done = true;
  auto pending = std::move(state_->continuations);
  state_->continuations.clear();
  for (auto& fn : pending) fn();
}

} // namespace sp
