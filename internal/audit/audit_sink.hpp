#pragma once

#include <optional>
#include <string>

#include "internal/access/decision.hpp"
#include "internal/identity/hash_key.hpp"
#include "internal/risk/access_tier.hpp"
#include "internal/util/time.hpp"

namespace vault::audit {

struct DecisionEvent {
  util::TimePoint                   timestamp{};
  identity::HashKey                 actor_hk{};
  bool                              allowed = false;
  std::optional<access::DenyReason> reason;
  std::string                       resource_domain;
  std::string                       action;
  double                            risk_score = 0.0;
  std::optional<risk::AccessTier>   tier;
  // the authorized operation itself failed; allowed is false
  std::string error;
  // delivered before the caller proceeds (risk escalation into DENIED)
  bool urgent = false;
};

struct MutationEvent {
  util::TimePoint   timestamp{};
  identity::HashKey hash_key{};
  // "hub", "link" or the satellite family name
  std::string record_family;
  std::string version_id;
  std::string record_source;
};

/*
  AuditSink

  Append-only destination for decisions and mutations. Implementations
  may throw; callers log delivery failures and never let them alter the
  decision or roll back the mutation.
*/
class AuditSink {
 public:
  virtual ~AuditSink() = default;

  virtual void RecordDecision(const DecisionEvent& event) = 0;
  virtual void RecordMutation(const MutationEvent& event) = 0;

  // Blocks until everything accepted so far has been delivered.
  virtual void Flush() {
  }
};

class NullAuditSink final : public AuditSink {
 public:
  void RecordDecision(const DecisionEvent&) override {
  }
  void RecordMutation(const MutationEvent&) override {
  }
};

class LoggingAuditSink final : public AuditSink {
 public:
  void RecordDecision(const DecisionEvent& event) override;
  void RecordMutation(const MutationEvent& event) override;
};

// "<hex hash key>@<unix micros>"
std::string VersionId(const identity::HashKey& hash_key, util::TimePoint effective_from);

// Delivery helpers used by every emitter: failures are logged, never thrown.
void SafeRecord(AuditSink* sink, const DecisionEvent& event) noexcept;
void SafeRecord(AuditSink* sink, const MutationEvent& event) noexcept;

} // namespace vault::audit
