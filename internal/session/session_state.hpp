#pragma once

#include <cstdint>

namespace vault::session {

enum class SessionStatus : std::uint8_t {
  kIssued    = 1,
  kActive    = 2,
  kExpired   = 3,
  kRevoked   = 4,
  kExhausted = 5,
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kExpired || status == SessionStatus::kRevoked || status == SessionStatus::kExhausted;
}

constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionStatus::kIssued) {
    return false;
  }
  return true;
}

constexpr const char* ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kIssued:
      return "ISSUED";
    case SessionStatus::kActive:
      return "ACTIVE";
    case SessionStatus::kExpired:
      return "EXPIRED";
    case SessionStatus::kRevoked:
      return "REVOKED";
    case SessionStatus::kExhausted:
      return "EXHAUSTED";
  }
  return "UNKNOWN";
}

} // namespace vault::session
