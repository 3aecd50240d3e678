#include "sp/ids/Id.hpp"

#include <atomic>

namespace sp {

AttachToken nextAttachToken() {
  static std::atomic<AttachToken> counter{0};
  return ++counter;
}

} // namespace sp
