#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/access/decision.hpp"
#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/risk/risk_engine.hpp"
#include "internal/session/failure_tracker.hpp"
#include "internal/session/session_state.hpp"
#include "internal/util/time.hpp"
#include "internal/version/version_store.hpp"

namespace vault::core::v1 {
class SessionState;
}

namespace vault::session {

inline constexpr const char* kSessionSatellite = "session_state_s";
inline constexpr const char* kSessionSource    = "vault.sessions";

struct SessionLimits {
  util::Micros  default_ttl    = std::chrono::minutes(10);
  util::Micros  max_ttl        = std::chrono::hours(8);
  std::uint64_t max_requests   = 100;
  std::uint64_t max_bytes      = 10ull * 1024 * 1024;
  util::Micros  failure_window = std::chrono::minutes(15);
  std::uint32_t token_bytes    = 32;
  // failures within failure_window that lock the actor out; 0 disables
  std::uint32_t lockout_threshold = 0;
};

enum class RefreshReason : std::uint8_t {
  kNoRefreshNeeded = 1,
  kThresholdReached,
  kForceRefresh,
  kExpired,
};

const char* ToString(RefreshReason reason);

// Client characteristics captured at issue; later requests are compared to them.
struct SessionBinding {
  std::string client_fingerprint;
  std::string ip_address;
};

struct Session {
  // only populated by Issue() and Refresh(); never persisted
  std::string token;

  identity::HashKey session_hk{};
  identity::HashKey actor_hk{};
  identity::HashKey tenant_hk{};
  util::TimePoint   issued_at{};
  util::TimePoint   expires_at{};
  SessionStatus     status = SessionStatus::kIssued;
  std::string       status_reason;
  SessionBinding    binding;

  std::uint64_t requests_made = 0;
  std::uint64_t max_requests  = 0;
  std::uint64_t bytes_moved   = 0;
  std::uint64_t max_bytes     = 0;

  double                          risk_score = 0.0;
  std::optional<risk::AccessTier> tier;

  // refresh chain; zero when absent
  identity::HashKey predecessor_hk{};
  identity::HashKey successor_hk{};
};

struct SessionCheck {
  std::optional<Session>            session;
  std::optional<access::DenyReason> denied;

  explicit operator bool() const {
    return !denied.has_value();
  }
};

struct Validation {
  std::optional<Session>            session;
  std::optional<risk::Assessment>   assessment;
  std::optional<access::DenyReason> denied;

  explicit operator bool() const {
    return !denied.has_value();
  }
};

// On success session is the one to use from now on: the successor, or the
// input session when reason is kNoRefreshNeeded.
struct RefreshOutcome {
  std::optional<Session>            session;
  std::optional<RefreshReason>      reason;
  std::optional<access::DenyReason> denied;

  explicit operator bool() const {
    return !denied.has_value();
  }
};

/*
  SessionManager

  Sessions are hubs in a dedicated scope whose state lives in the
  session_state_s satellite: every transition appends a version, nothing
  is deleted. The hub business key is derived from SHA-256(token), so the
  raw token never reaches storage.
*/
class SessionManager {
 public:
  SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> identity,
                 std::shared_ptr<risk::RiskEngine> risk, std::shared_ptr<util::Clock> clock, std::shared_ptr<audit::AuditSink> audit,
                 SessionLimits limits);

  static identity::HashKey SessionScope();
  static identity::HashKey SessionKey(const std::string& token);

  // ttl of zero selects the default. Throws util::NotFound for an unknown
  // actor, util::ValidationError for a ttl above the maximum and
  // util::LockedOut while the actor is locked out.
  Session Issue(const identity::HashKey& actor_hk, util::Micros ttl, const SessionBinding& binding);

  // Status-only check. An ACTIVE session past its expiry is moved to EXPIRED.
  SessionCheck Authenticate(const std::string& token);

  // Authenticate plus a fresh risk assessment, persisted on the session.
  Validation Validate(const std::string& token, const risk::RequestContext& context);

  // Replaces the session with a successor bound to the same actor and
  // client when forced, when it has expired, or when it expires within
  // threshold. The old session becomes terminal and records the successor;
  // refreshing it a second time is denied with kRevoked. Throws
  // util::NotFound for an unknown token.
  RefreshOutcome Refresh(const std::string& token, util::Micros threshold, bool force = false);

  // false if the session was already terminal. Throws util::NotFound.
  bool Revoke(const std::string& token, const std::string& reason);

  // Charges usage. Reaching a limit moves the session to EXHAUSTED; a
  // charge that would exceed it is denied and not applied.
  SessionCheck Consume(const std::string& token, std::uint64_t requests, std::uint64_t bytes);

  void RecordFailure(const identity::HashKey& actor_hk);
  bool IsLockedOut(const identity::HashKey& actor_hk);

  std::optional<Session> Find(const std::string& token);

  // every recorded state, oldest first
  std::vector<Session> Lifecycle(const std::string& token);

  const SessionLimits& Limits() const {
    return limits_;
  }

 private:
  using StateMutator = std::function<bool(vault::core::v1::SessionState& state)>;

  // Applies mutate to the current state under the entity lock. Returns the
  // resulting session, or nullopt if the session does not exist.
  std::optional<Session> Mutate(const identity::HashKey& session_hk, const StateMutator& mutate);

  std::optional<Session> Expire(const identity::HashKey& session_hk);

  // Creates the hub and first ACTIVE state of a new session.
  Session Open(const identity::HashKey& actor_hk, const identity::HashKey& tenant_hk, util::Micros ttl, const SessionBinding& binding,
               std::string token, const identity::HashKey* predecessor_hk, std::optional<RefreshReason> reason);

  std::shared_ptr<identity::IdentityResolver> identity_;
  std::shared_ptr<risk::RiskEngine>           risk_;
  std::shared_ptr<util::Clock>                clock_;
  std::shared_ptr<audit::AuditSink>           audit_;
  SessionLimits                               limits_;
  version::VersionStore                       states_;
  FailureTracker                              failures_;
};

} // namespace vault::session
