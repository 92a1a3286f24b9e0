#pragma once
#include <cstdint>

namespace parcelday {

using Id = std::int32_t;

// Location 0 is the hub, so "unset" is negative.
constexpr Id kInvalidId = -1;

} // namespace parcelday
