#pragma once

#include <memory>
#include <string>

#include "vault/config/v1/config.pb.h"

#include "internal/access/access_controller.hpp"
#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/domain/domain_gate.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/relationship/relationship_store.hpp"
#include "internal/risk/risk_engine.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/util/time.hpp"
#include "internal/version/version_store.hpp"

namespace vault::factory {

inline constexpr const char* kProfileSatellite = "entity_profile_s";

/*
  Runtime

  Owns every long-lived component. Components share the repository,
  clock and audit sink; nothing here knows concrete backend types
  except Build().
*/
struct Runtime {
  std::shared_ptr<db::Repository>  repository;
  std::shared_ptr<util::Clock>     clock;
  std::shared_ptr<audit::AuditSink> audit;

  std::shared_ptr<identity::IdentityResolver>      identity;
  std::shared_ptr<relationship::RelationshipStore> relationships;
  std::shared_ptr<version::VersionStore>           profiles;
  std::shared_ptr<risk::RiskEngine>                risk;
  std::shared_ptr<session::SessionManager>         sessions;
  std::shared_ptr<domain::DomainGate>              domains;
  std::shared_ptr<access::AccessController>        access;

  // provenance used when a caller does not supply one
  std::string default_record_source;
};

std::shared_ptr<db::Repository> BuildRepository(const vault::runtime::config::RuntimeConfig& config);

/*
  Build full application dependency graph.

  The config is expected to be validated (ConfigLoader). A null clock
  selects the system clock.
*/
Runtime Build(const vault::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock = nullptr);

} // namespace vault::factory
