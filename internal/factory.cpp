#include "factory.hpp"

#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "internal/audit/queued_audit_sink.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if VAULT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VAULT_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vault::factory {

using observability::IntField;
using observability::StringField;
using vault::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<audit::AuditSink> BuildAudit(const RuntimeConfig& config) {
  const auto& audit_config = config.audit();

  std::shared_ptr<audit::AuditSink> sink;
  if (audit_config.sink() == "none") {
    sink = std::make_shared<audit::NullAuditSink>();
  } else {
    sink = std::make_shared<audit::LoggingAuditSink>();
  }

  if (!audit_config.async()) return sink;

  auto queued = std::make_shared<audit::QueuedAuditSink>(std::move(sink), audit_config.queue_capacity(), audit_config.max_retries());
  queued->Start();
  return queued;
}

std::shared_ptr<risk::RiskEngine> BuildRisk(const RuntimeConfig& config) {
  const auto& risk_config = config.risk();

  risk::RiskWeights weights{
      .device   = risk_config.weights().device(),
      .network  = risk_config.weights().network(),
      .behavior = risk_config.weights().behavior(),
      .content  = risk_config.weights().content(),
  };
  risk::TierBounds bounds{
      .full_max     = risk_config.tiers().full_max(),
      .standard_max = risk_config.tiers().standard_max(),
      .elevated_max = risk_config.tiers().elevated_max(),
  };

  std::vector<std::string> blocked(risk_config.blocked_networks().begin(), risk_config.blocked_networks().end());

  std::unordered_map<std::string, double> sensitivity;
  for (const auto& category : risk_config.restricted_categories()) {
    sensitivity[category.category()] = category.sensitivity();
  }

  return std::make_shared<risk::RiskEngine>(risk::RiskScorer(weights, bounds), risk::DefaultSources(std::move(blocked), std::move(sensitivity)));
}

session::SessionLimits BuildLimits(const RuntimeConfig& config) {
  const auto& sessions = config.sessions();
  return session::SessionLimits{
      .default_ttl       = util::FromProto(sessions.default_ttl()),
      .max_ttl           = util::FromProto(sessions.max_ttl()),
      .max_requests      = sessions.max_requests(),
      .max_bytes         = sessions.max_bytes(),
      .failure_window    = util::FromProto(sessions.failure_window()),
      .token_bytes       = sessions.token_bytes(),
      .lockout_threshold = sessions.lockout_threshold(),
  };
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VAULT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), util::FromProto(database.sqlite().busy_timeout()));
    int  applied   = db::sqlite::MigrateSchema(sqlite_db);
    VAULT_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path()),
                                        IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VAULT_DB_POSTGRES
    const auto& pg      = database.postgres();
    auto        pool    = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections(), util::FromProto(pg.acquire_timeout()));
    int         applied = db::postgres::MigrateSchema(pool);
    VAULT_LOG_INFO("repository ready", {StringField("backend", "postgres"), IntField("migrations_applied", applied)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  VAULT_LOG_INFO("repository ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime Build(const RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  observability::InitializeLogging(config);

  Runtime rt;
  rt.clock                 = clock ? std::move(clock) : std::make_shared<util::SystemClock>();
  rt.repository            = BuildRepository(config);
  rt.audit                 = BuildAudit(config);
  rt.default_record_source = config.identity().default_record_source();

  // ------------------------------------------------------------------
  // Identity + relationships + versioned records
  // ------------------------------------------------------------------
  rt.identity      = std::make_shared<identity::IdentityResolver>(rt.repository, rt.clock, rt.audit);
  rt.relationships = std::make_shared<relationship::RelationshipStore>(rt.repository, rt.clock, rt.audit);
  rt.profiles = std::make_shared<version::VersionStore>(rt.repository, kProfileSatellite, version::ParentKind::kHub, rt.clock, rt.audit);

  // ------------------------------------------------------------------
  // Risk, sessions, domains, access
  // ------------------------------------------------------------------
  rt.risk     = BuildRisk(config);
  rt.sessions = std::make_shared<session::SessionManager>(rt.repository, rt.identity, rt.risk, rt.clock, rt.audit, BuildLimits(config));
  rt.domains  = std::make_shared<domain::DomainGate>(rt.repository, rt.identity, rt.relationships, rt.clock, rt.audit);
  rt.access   = std::make_shared<access::AccessController>(rt.sessions, rt.domains, rt.profiles, rt.clock, rt.audit);

  return rt;
}

} // namespace vault::factory
