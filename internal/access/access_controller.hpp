#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/access/decision.hpp"
#include "internal/audit/audit_sink.hpp"
#include "internal/domain/domain_gate.hpp"
#include "internal/risk/signal_sources.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/version/version_store.hpp"

namespace vault::access {

struct AccessRequest {
  std::string          token;
  identity::HashKey    actor_hk{};
  std::string          resource_domain;
  std::string          resource_category;
  Action               action = Action::kRead;
  risk::RequestContext context;
  // caller completed step-up verification (MFA) for this request
  bool step_up_verified = false;
};

struct AccessResult {
  Decision                        decision;
  std::optional<risk::Assessment> assessment;
  std::optional<version::Version> version;

  explicit operator bool() const {
    return decision.allowed;
  }
};

/*
  AccessController

  Single entry point for data access: session, then domain isolation,
  then risk. Every decision, allow or deny, reaches the audit sink.
*/
class AccessController {
 public:
  AccessController(std::shared_ptr<session::SessionManager> sessions, std::shared_ptr<domain::DomainGate> domains,
                   std::shared_ptr<version::VersionStore> records, std::shared_ptr<util::Clock> clock, std::shared_ptr<audit::AuditSink> audit);

  AccessResult Check(const AccessRequest& request);

  // Check + usage accounting + Put into the record store. Throws
  // util::NotFound for an unknown record before any usage is charged;
  // a failed Put is audited as failed and rethrown.
  AccessResult Write(AccessRequest request, const identity::HashKey& hash_key, const std::string& payload);

  // Check + Current from the record store + usage accounting.
  AccessResult Read(AccessRequest request, const identity::HashKey& hash_key);

 private:
  AccessResult Evaluate(const AccessRequest& request);
  void         Audit(const AccessRequest& request, const AccessResult& result, const std::string& error = {});

  std::shared_ptr<session::SessionManager> sessions_;
  std::shared_ptr<domain::DomainGate>      domains_;
  std::shared_ptr<version::VersionStore>   records_;
  std::shared_ptr<util::Clock>             clock_;
  std::shared_ptr<audit::AuditSink>        audit_;
};

} // namespace vault::access
