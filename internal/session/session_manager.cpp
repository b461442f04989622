#include "internal/session/session_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"
#include "vault/core/v1/session.pb.h"

namespace vault::session {

using observability::DoubleField;
using observability::IntField;
using observability::KeyField;
using observability::StringField;

namespace pb = vault::core::v1;

namespace {

pb::SessionStatus ToProto(SessionStatus status) {
  switch (status) {
    case SessionStatus::kIssued:
      return pb::SESSION_STATUS_ISSUED;
    case SessionStatus::kActive:
      return pb::SESSION_STATUS_ACTIVE;
    case SessionStatus::kExpired:
      return pb::SESSION_STATUS_EXPIRED;
    case SessionStatus::kRevoked:
      return pb::SESSION_STATUS_REVOKED;
    case SessionStatus::kExhausted:
      return pb::SESSION_STATUS_EXHAUSTED;
  }
  return pb::SESSION_STATUS_UNSPECIFIED;
}

SessionStatus FromProto(pb::SessionStatus status) {
  switch (status) {
    case pb::SESSION_STATUS_ISSUED:
      return SessionStatus::kIssued;
    case pb::SESSION_STATUS_ACTIVE:
      return SessionStatus::kActive;
    case pb::SESSION_STATUS_EXPIRED:
      return SessionStatus::kExpired;
    case pb::SESSION_STATUS_REVOKED:
      return SessionStatus::kRevoked;
    case pb::SESSION_STATUS_EXHAUSTED:
      return SessionStatus::kExhausted;
    default:
      throw std::runtime_error("session state: unknown status " + std::to_string(static_cast<int>(status)));
  }
}

pb::AccessTier ToProto(risk::AccessTier tier) {
  switch (tier) {
    case risk::AccessTier::kFull:
      return pb::ACCESS_TIER_FULL;
    case risk::AccessTier::kStandard:
      return pb::ACCESS_TIER_STANDARD;
    case risk::AccessTier::kElevated:
      return pb::ACCESS_TIER_ELEVATED;
    case risk::AccessTier::kDenied:
      return pb::ACCESS_TIER_DENIED;
  }
  return pb::ACCESS_TIER_UNSPECIFIED;
}

std::optional<risk::AccessTier> FromProto(pb::AccessTier tier) {
  switch (tier) {
    case pb::ACCESS_TIER_FULL:
      return risk::AccessTier::kFull;
    case pb::ACCESS_TIER_STANDARD:
      return risk::AccessTier::kStandard;
    case pb::ACCESS_TIER_ELEVATED:
      return risk::AccessTier::kElevated;
    case pb::ACCESS_TIER_DENIED:
      return risk::AccessTier::kDenied;
    default:
      return std::nullopt;
  }
}

pb::SessionState Parse(const std::string& payload) {
  pb::SessionState state;
  if (!state.ParseFromString(payload)) {
    throw std::runtime_error("session state: corrupt payload");
  }
  return state;
}

std::string Serialize(const pb::SessionState& state) {
  std::string out;
  if (!state.SerializeToString(&out)) {
    throw std::runtime_error("session state: serialization failed");
  }
  return out;
}

identity::HashKey KeyOrNull(const std::string& bytes) {
  if (bytes.empty()) return identity::HashKey{};
  return identity::FromBytes(bytes);
}

Session ToSession(const identity::HashKey& session_hk, const pb::SessionState& s) {
  Session out;
  out.session_hk    = session_hk;
  out.actor_hk      = identity::FromBytes(s.actor_hk());
  out.tenant_hk     = identity::FromBytes(s.tenant_hk());
  out.issued_at     = util::FromProto(s.issued_at());
  out.expires_at    = util::FromProto(s.expires_at());
  out.status        = FromProto(s.status());
  out.status_reason = s.status_reason();
  out.binding       = SessionBinding{s.client_fingerprint(), s.ip_address()};
  out.requests_made = s.requests_made();
  out.max_requests  = s.max_requests();
  out.bytes_moved   = s.bytes_moved();
  out.max_bytes     = s.max_bytes();
  out.risk_score    = s.risk_score();
  out.tier           = FromProto(s.tier());
  out.predecessor_hk = KeyOrNull(s.predecessor_hk());
  out.successor_hk   = KeyOrNull(s.successor_hk());
  return out;
}

std::optional<access::DenyReason> DenyFor(SessionStatus status) {
  switch (status) {
    case SessionStatus::kExpired:
      return access::DenyReason::kExpired;
    case SessionStatus::kRevoked:
      return access::DenyReason::kRevoked;
    case SessionStatus::kExhausted:
      return access::DenyReason::kExhausted;
    default:
      return std::nullopt;
  }
}

bool SetStatus(pb::SessionState& state, SessionStatus to, const std::string& reason) {
  auto from = FromProto(state.status());
  if (from == to || !CanTransition(from, to)) return false;
  state.set_status(ToProto(to));
  state.set_status_reason(reason);
  return true;
}

} // namespace

const char* ToString(RefreshReason reason) {
  switch (reason) {
    case RefreshReason::kNoRefreshNeeded:
      return "NO_REFRESH_NEEDED";
    case RefreshReason::kThresholdReached:
      return "THRESHOLD_REACHED";
    case RefreshReason::kForceRefresh:
      return "FORCE_REFRESH";
    case RefreshReason::kExpired:
      return "EXPIRED";
  }
  return "UNKNOWN";
}

SessionManager::SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> identity,
                               std::shared_ptr<risk::RiskEngine> risk, std::shared_ptr<util::Clock> clock,
                               std::shared_ptr<audit::AuditSink> audit, SessionLimits limits)
    : identity_(std::move(identity)),
      risk_(std::move(risk)),
      clock_(clock),
      audit_(audit),
      limits_(limits),
      states_(std::move(repository), kSessionSatellite, version::ParentKind::kHub, clock, audit),
      failures_(limits.failure_window) {
  if (limits_.default_ttl <= util::Micros::zero() || limits_.default_ttl > limits_.max_ttl) {
    throw util::ValidationError("session limits: default ttl must be positive and not above max ttl");
  }
  if (limits_.token_bytes < 16) {
    throw util::ValidationError("session limits: token must carry at least 16 random bytes");
  }
}

identity::HashKey SessionManager::SessionScope() {
  static const identity::HashKey kScope = identity::IdentityResolver::ResolveTenant(kSessionSource);
  return kScope;
}

identity::HashKey SessionManager::SessionKey(const std::string& token) {
  return identity::IdentityResolver::Resolve(SessionScope(), "session:" + identity::ToHex(identity::Sha256({token})));
}

Session SessionManager::Issue(const identity::HashKey& actor_hk, util::Micros ttl, const SessionBinding& binding) {
  if (ttl < util::Micros::zero()) {
    throw util::ValidationError("issue session: ttl is negative");
  }
  if (ttl == util::Micros::zero()) {
    ttl = limits_.default_ttl;
  }
  if (ttl > limits_.max_ttl) {
    throw util::ValidationError("issue session: ttl exceeds maximum");
  }

  auto actor = identity_->FindHub(actor_hk);
  if (!actor) {
    throw util::NotFound("issue session: unknown actor " + identity::ToHex(actor_hk));
  }
  if (IsLockedOut(actor_hk)) {
    throw util::LockedOut("issue session: actor " + identity::ToHex(actor_hk) + " is locked out");
  }

  return Open(actor_hk, actor->tenant_hk, ttl, binding, util::RandomToken(limits_.token_bytes), nullptr, std::nullopt);
}

Session SessionManager::Open(const identity::HashKey& actor_hk, const identity::HashKey& tenant_hk, util::Micros ttl,
                             const SessionBinding& binding, std::string token, const identity::HashKey* predecessor_hk,
                             std::optional<RefreshReason> reason) {
  auto session_hk = SessionKey(token);
  identity_->EnsureHub(SessionScope(), "session:" + identity::ToHex(identity::Sha256({token})), kSessionSource);

  auto now = clock_->Now();

  pb::SessionState state;
  state.set_actor_hk(identity::ToBytes(actor_hk));
  state.set_tenant_hk(identity::ToBytes(tenant_hk));
  *state.mutable_issued_at()  = util::ToProto(now);
  *state.mutable_expires_at() = util::ToProto(now + ttl);
  state.set_status(pb::SESSION_STATUS_ACTIVE);
  state.set_client_fingerprint(binding.client_fingerprint);
  state.set_ip_address(binding.ip_address);
  state.set_max_requests(limits_.max_requests);
  state.set_max_bytes(limits_.max_bytes);
  if (predecessor_hk) state.set_predecessor_hk(identity::ToBytes(*predecessor_hk));
  if (reason) state.set_refresh_reason(ToString(*reason));

  auto version = states_.Put(session_hk, Serialize(state), kSessionSource);

  auto session  = ToSession(session_hk, Parse(version.payload));
  session.token = std::move(token);

  VAULT_LOG_INFO("session issued", {KeyField("session", session_hk), KeyField("actor", actor_hk),
                                    StringField("expires_at", util::FormatIso(session.expires_at))});
  return session;
}

std::optional<Session> SessionManager::Mutate(const identity::HashKey& session_hk, const StateMutator& mutate) {
  bool exists = false;
  auto result = states_.Update(
      session_hk,
      [&](const std::optional<version::Version>& current) -> std::optional<std::string> {
        if (!current) return std::nullopt;
        exists     = true;
        auto state = Parse(current->payload);
        if (!mutate(state)) return std::nullopt;
        return Serialize(state);
      },
      kSessionSource);

  if (!exists || !result) return std::nullopt;
  return ToSession(session_hk, Parse(result->payload));
}

std::optional<Session> SessionManager::Expire(const identity::HashKey& session_hk) {
  auto now = clock_->Now();
  auto session = Mutate(session_hk, [&](pb::SessionState& state) {
    if (FromProto(state.status()) != SessionStatus::kActive) return false;
    if (now < util::FromProto(state.expires_at())) return false;
    return SetStatus(state, SessionStatus::kExpired, "ttl elapsed");
  });

  if (session && session->status == SessionStatus::kExpired) {
    VAULT_LOG_INFO("session expired", {KeyField("session", session_hk)});
  }
  return session;
}

SessionCheck SessionManager::Authenticate(const std::string& token) {
  if (token.empty()) {
    return {std::nullopt, access::DenyReason::kNotFound};
  }

  auto session_hk = SessionKey(token);
  auto current    = states_.Current(session_hk);
  if (!current) {
    return {std::nullopt, access::DenyReason::kNotFound};
  }

  auto session = ToSession(session_hk, Parse(current->payload));
  if (session.status == SessionStatus::kActive && clock_->Now() >= session.expires_at) {
    // parent hub exists since a version was found
    if (auto expired = Expire(session_hk)) session = std::move(*expired);
  }

  if (auto reason = DenyFor(session.status)) {
    return {std::move(session), reason};
  }
  return {std::move(session), std::nullopt};
}

Validation SessionManager::Validate(const std::string& token, const risk::RequestContext& context) {
  auto check = Authenticate(token);
  if (!check) {
    return {std::move(check.session), std::nullopt, check.denied};
  }

  auto& session = *check.session;
  auto  now     = clock_->Now();

  if (IsLockedOut(session.actor_hk)) {
    VAULT_LOG_WARN("actor locked out", {KeyField("session", session.session_hk), KeyField("actor", session.actor_hk)});
    audit::SafeRecord(audit_.get(), audit::DecisionEvent{
                                        .timestamp       = now,
                                        .actor_hk        = session.actor_hk,
                                        .allowed         = false,
                                        .reason          = access::DenyReason::kLockedOut,
                                        .resource_domain = "",
                                        .action          = "validate",
                                        .urgent          = true,
                                    });
    return {std::move(session), std::nullopt, access::DenyReason::kLockedOut};
  }

  risk::SignalInput input{
      .request           = context,
      .bound_fingerprint = session.binding.client_fingerprint,
      .bound_ip          = session.binding.ip_address,
      .recorded_failures = failures_.Count(session.actor_hk, now),
  };
  auto assessment    = risk_->Assess(input);
  auto previous_tier = session.tier;

  auto updated = Mutate(session.session_hk, [&](pb::SessionState& state) {
    if (FromProto(state.status()) != SessionStatus::kActive) return false;
    state.set_risk_score(assessment.score);
    state.set_tier(ToProto(assessment.tier));
    return true;
  });
  if (updated) session = std::move(*updated);

  // a concurrent transition may have landed since Authenticate
  if (auto reason = DenyFor(session.status)) {
    return {std::move(session), assessment, reason};
  }

  if (previous_tier != assessment.tier) {
    VAULT_LOG_INFO("risk tier changed", {KeyField("session", session.session_hk),
                                         StringField("from", previous_tier ? risk::ToString(*previous_tier) : "-"),
                                         StringField("to", risk::ToString(assessment.tier)), DoubleField("score", assessment.score)});
  }

  if (assessment.tier == risk::AccessTier::kDenied) {
    if (previous_tier != risk::AccessTier::kDenied) {
      VAULT_LOG_WARN("session risk escalated to denied", {KeyField("session", session.session_hk),
                                                          DoubleField("score", assessment.score)});
      audit::SafeRecord(audit_.get(), audit::DecisionEvent{
                                          .timestamp       = now,
                                          .actor_hk        = session.actor_hk,
                                          .allowed         = false,
                                          .reason          = access::DenyReason::kRiskTooHigh,
                                          .resource_domain = "",
                                          .action          = "validate",
                                          .risk_score      = assessment.score,
                                          .tier            = assessment.tier,
                                          .urgent          = true,
                                      });
    }
    return {std::move(session), assessment, access::DenyReason::kRiskTooHigh};
  }

  return {std::move(session), assessment, std::nullopt};
}

RefreshOutcome SessionManager::Refresh(const std::string& token, util::Micros threshold, bool force) {
  if (threshold < util::Micros::zero()) {
    throw util::ValidationError("refresh session: threshold is negative");
  }

  auto session_hk = SessionKey(token);
  auto current    = states_.Current(session_hk);
  if (!current) {
    throw util::NotFound("refresh session: unknown token");
  }

  auto session = ToSession(session_hk, Parse(current->payload));
  if (IsLockedOut(session.actor_hk)) {
    return {std::move(session), std::nullopt, access::DenyReason::kLockedOut};
  }

  const auto now             = clock_->Now();
  auto       successor_token = util::RandomToken(limits_.token_bytes);
  const auto successor_hk    = SessionKey(successor_token);

  std::optional<RefreshReason>      reason;
  std::optional<access::DenyReason> denied;
  auto updated = Mutate(session_hk, [&](pb::SessionState& state) {
    reason.reset();
    denied.reset();

    // already replaced by an earlier refresh
    if (!state.successor_hk().empty()) {
      denied = access::DenyReason::kRevoked;
      return false;
    }

    const auto status     = FromProto(state.status());
    const auto expires_at = util::FromProto(state.expires_at());
    if (status == SessionStatus::kRevoked || status == SessionStatus::kExhausted) {
      denied = DenyFor(status);
      return false;
    }

    if (force) {
      reason = RefreshReason::kForceRefresh;
    } else if (status == SessionStatus::kExpired || now >= expires_at) {
      reason = RefreshReason::kExpired;
    } else if (expires_at - now <= threshold) {
      reason = RefreshReason::kThresholdReached;
    } else {
      reason = RefreshReason::kNoRefreshNeeded;
      return false;
    }

    if (status == SessionStatus::kActive) {
      if (now >= expires_at) {
        SetStatus(state, SessionStatus::kExpired, "ttl elapsed");
      } else {
        SetStatus(state, SessionStatus::kRevoked, "refreshed");
      }
    }
    state.set_successor_hk(identity::ToBytes(successor_hk));
    return true;
  });
  if (updated) session = std::move(*updated);

  if (denied) {
    return {std::move(session), std::nullopt, denied};
  }
  if (reason == RefreshReason::kNoRefreshNeeded) {
    session.token = token;
    return {std::move(session), reason, std::nullopt};
  }

  auto ttl = session.expires_at - session.issued_at;
  if (ttl <= util::Micros::zero() || ttl > limits_.max_ttl) ttl = limits_.default_ttl;

  auto successor = Open(session.actor_hk, session.tenant_hk, ttl, session.binding, std::move(successor_token), &session_hk, reason);

  VAULT_LOG_INFO("session refreshed", {KeyField("session", session_hk), KeyField("successor", successor.session_hk),
                                       StringField("reason", ToString(*reason))});
  return {std::move(successor), reason, std::nullopt};
}

bool SessionManager::Revoke(const std::string& token, const std::string& reason) {
  auto session_hk = SessionKey(token);
  if (!states_.Current(session_hk)) {
    throw util::NotFound("revoke session: unknown token");
  }

  bool changed = false;
  Mutate(session_hk, [&](pb::SessionState& state) {
    changed = SetStatus(state, SessionStatus::kRevoked, reason.empty() ? "revoked" : reason);
    return changed;
  });

  if (changed) {
    VAULT_LOG_INFO("session revoked", {KeyField("session", session_hk), StringField("reason", reason)});
  }
  return changed;
}

SessionCheck SessionManager::Consume(const std::string& token, std::uint64_t requests, std::uint64_t bytes) {
  auto check = Authenticate(token);
  if (!check) return check;

  bool over_limit = false;
  bool applied    = false;
  auto updated    = Mutate(check.session->session_hk, [&](pb::SessionState& state) {
    if (FromProto(state.status()) != SessionStatus::kActive) return false;

    const auto next_requests = state.requests_made() + requests;
    const auto next_bytes    = state.bytes_moved() + bytes;
    if ((state.max_requests() > 0 && next_requests > state.max_requests()) || (state.max_bytes() > 0 && next_bytes > state.max_bytes())) {
      over_limit = true;
      return false;
    }

    state.set_requests_made(next_requests);
    state.set_bytes_moved(next_bytes);
    if ((state.max_requests() > 0 && next_requests == state.max_requests()) || (state.max_bytes() > 0 && next_bytes == state.max_bytes())) {
      SetStatus(state, SessionStatus::kExhausted, "usage limit reached");
    }
    applied = true;
    return true;
  });

  if (updated) check.session = std::move(*updated);

  if (over_limit) {
    return {std::move(check.session), access::DenyReason::kExhausted};
  }
  if (!applied) {
    // a concurrent transition landed since Authenticate
    auto reason = DenyFor(check.session->status).value_or(access::DenyReason::kNotFound);
    return {std::move(check.session), reason};
  }
  if (check.session->status == SessionStatus::kExhausted) {
    VAULT_LOG_INFO("session exhausted", {KeyField("session", check.session->session_hk)});
  }
  return {std::move(check.session), std::nullopt};
}

void SessionManager::RecordFailure(const identity::HashKey& actor_hk) {
  auto now = clock_->Now();
  failures_.Record(actor_hk, now);
  if (limits_.lockout_threshold > 0 && failures_.Count(actor_hk, now) == limits_.lockout_threshold) {
    VAULT_LOG_WARN("actor reached lockout threshold", {KeyField("actor", actor_hk), IntField("failures", limits_.lockout_threshold)});
  }
}

bool SessionManager::IsLockedOut(const identity::HashKey& actor_hk) {
  if (limits_.lockout_threshold == 0) return false;
  return failures_.Count(actor_hk, clock_->Now()) >= limits_.lockout_threshold;
}

std::optional<Session> SessionManager::Find(const std::string& token) {
  auto session_hk = SessionKey(token);
  auto current    = states_.Current(session_hk);
  if (!current) return std::nullopt;
  return ToSession(session_hk, Parse(current->payload));
}

std::vector<Session> SessionManager::Lifecycle(const std::string& token) {
  auto session_hk = SessionKey(token);

  std::vector<Session> out;
  for (const auto& v : states_.History(session_hk)) {
    out.push_back(ToSession(session_hk, Parse(v.payload)));
  }
  return out;
}

} // namespace vault::session
