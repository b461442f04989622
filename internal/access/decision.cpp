#include "internal/access/decision.hpp"

namespace vault::access {

const char* ToString(DenyReason reason) {
  switch (reason) {
    case DenyReason::kNotFound:
      return "NOT_FOUND";
    case DenyReason::kExpired:
      return "EXPIRED";
    case DenyReason::kRevoked:
      return "REVOKED";
    case DenyReason::kExhausted:
      return "EXHAUSTED";
    case DenyReason::kRiskTooHigh:
      return "RISK_TOO_HIGH";
    case DenyReason::kStepUpRequired:
      return "STEP_UP_REQUIRED";
    case DenyReason::kActorMismatch:
      return "ACTOR_MISMATCH";
    case DenyReason::kNoDomainAssigned:
      return "NO_DOMAIN_ASSIGNED";
    case DenyReason::kCrossDomainViolation:
      return "CROSS_DOMAIN_VIOLATION";
    case DenyReason::kActionNotPermitted:
      return "ACTION_NOT_PERMITTED";
    case DenyReason::kCategoryForbidden:
      return "CATEGORY_FORBIDDEN";
    case DenyReason::kCategoryNotAllowed:
      return "CATEGORY_NOT_ALLOWED";
    case DenyReason::kLockedOut:
      return "LOCKED_OUT";
  }
  return "UNKNOWN";
}

const char* ToString(Action action) {
  switch (action) {
    case Action::kRead:
      return "read";
    case Action::kWrite:
      return "write";
    case Action::kLearn:
      return "learn";
    case Action::kInference:
      return "inference";
  }
  return "unknown";
}

std::optional<Action> ParseAction(std::string_view value) {
  if (value == "read") return Action::kRead;
  if (value == "write") return Action::kWrite;
  if (value == "learn") return Action::kLearn;
  if (value == "inference") return Action::kInference;
  return std::nullopt;
}

} // namespace vault::access
