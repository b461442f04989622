#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vault::access {

/*
  Stable denial reasons. The string names are part of the audit record
  format and must not change.
*/
enum class DenyReason : std::uint8_t {
  kNotFound = 1,
  kExpired,
  kRevoked,
  kExhausted,
  kRiskTooHigh,
  kStepUpRequired,
  kActorMismatch,
  kNoDomainAssigned,
  kCrossDomainViolation,
  kActionNotPermitted,
  kCategoryForbidden,
  kCategoryNotAllowed,
  kLockedOut,
};

const char* ToString(DenyReason reason);

enum class Action : std::uint8_t {
  kRead = 1,
  kWrite,
  kLearn,
  kInference,
};

const char*           ToString(Action action);
std::optional<Action> ParseAction(std::string_view value);

struct Decision {
  bool                      allowed = false;
  std::optional<DenyReason> reason;

  static Decision Allow() {
    return {true, std::nullopt};
  }

  static Decision Deny(DenyReason r) {
    return {false, r};
  }

  explicit operator bool() const {
    return allowed;
  }
};

} // namespace vault::access
