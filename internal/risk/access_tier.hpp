#pragma once

#include <cstdint>

namespace vault::risk {

// Ordered from least to most restrictive.
enum class AccessTier : std::uint8_t {
  kFull     = 1,
  kStandard = 2,
  kElevated = 3, // step-up verification required
  kDenied   = 4,
};

constexpr const char* ToString(AccessTier tier) {
  switch (tier) {
    case AccessTier::kFull:
      return "FULL";
    case AccessTier::kStandard:
      return "STANDARD";
    case AccessTier::kElevated:
      return "ELEVATED";
    case AccessTier::kDenied:
      return "DENIED";
  }
  return "UNKNOWN";
}

constexpr bool MoreRestrictive(AccessTier a, AccessTier b) {
  return static_cast<std::uint8_t>(a) > static_cast<std::uint8_t>(b);
}

} // namespace vault::risk
