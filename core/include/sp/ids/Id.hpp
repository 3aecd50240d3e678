#pragma once
#include <cstdint>

namespace sp {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Identifies the splitter currently attached to a RatioStore.
// Issued by nextAttachToken(), compared by value.
using AttachToken = Id;

AttachToken nextAttachToken();

} // namespace sp
