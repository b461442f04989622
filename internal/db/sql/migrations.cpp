#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vault::db::sql {

std::string SqliteMigrationTableSql() {
  return "CREATE TABLE IF NOT EXISTS vault_schema_migrations (version INTEGER PRIMARY KEY, name TEXT NOT NULL, applied_at_us INTEGER NOT NULL);";
}

std::string PostgresMigrationTableSql() {
  return "CREATE TABLE IF NOT EXISTS vault_schema_migrations (version INTEGER PRIMARY KEY, name TEXT NOT NULL, applied_at TIMESTAMPTZ NOT NULL DEFAULT now());";
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "initial_vault",
       {
           "CREATE TABLE IF NOT EXISTS hub (hash_key BLOB PRIMARY KEY, business_key TEXT NOT NULL, tenant_hk BLOB NOT NULL, load_date INTEGER NOT NULL, record_source TEXT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS hub_tenant_idx ON hub(tenant_hk);",
           "CREATE TABLE IF NOT EXISTS satellite (satellite TEXT NOT NULL, hash_key BLOB NOT NULL, load_date INTEGER NOT NULL, load_end_date INTEGER, hash_diff BLOB NOT NULL, payload BLOB NOT NULL, record_source TEXT NOT NULL, PRIMARY KEY (satellite, hash_key, load_date), CHECK (load_end_date IS NULL OR load_end_date > load_date));",
           "CREATE UNIQUE INDEX IF NOT EXISTS satellite_open_uq ON satellite(satellite, hash_key) WHERE load_end_date IS NULL;",
           "CREATE TABLE IF NOT EXISTS link (link_hk BLOB PRIMARY KEY, tenant_hk BLOB NOT NULL, load_date INTEGER NOT NULL, record_source TEXT NOT NULL);",
           "CREATE TABLE IF NOT EXISTS link_member (link_hk BLOB NOT NULL REFERENCES link(link_hk), position INTEGER NOT NULL, hash_key BLOB NOT NULL, PRIMARY KEY (link_hk, position));",
           "CREATE INDEX IF NOT EXISTS link_member_hk_idx ON link_member(hash_key);",
       }},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "initial_vault",
       {
           "CREATE TABLE IF NOT EXISTS hub (hash_key BYTEA PRIMARY KEY, business_key TEXT NOT NULL, tenant_hk BYTEA NOT NULL, load_date BIGINT NOT NULL, record_source TEXT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS hub_tenant_idx ON hub(tenant_hk);",
           "CREATE TABLE IF NOT EXISTS satellite (satellite TEXT NOT NULL, hash_key BYTEA NOT NULL, load_date BIGINT NOT NULL, load_end_date BIGINT, hash_diff BYTEA NOT NULL, payload BYTEA NOT NULL, record_source TEXT NOT NULL, PRIMARY KEY (satellite, hash_key, load_date), CHECK (load_end_date IS NULL OR load_end_date > load_date));",
           "CREATE UNIQUE INDEX IF NOT EXISTS satellite_open_uq ON satellite(satellite, hash_key) WHERE load_end_date IS NULL;",
           "CREATE TABLE IF NOT EXISTS link (link_hk BYTEA PRIMARY KEY, tenant_hk BYTEA NOT NULL, load_date BIGINT NOT NULL, record_source TEXT NOT NULL);",
           "CREATE TABLE IF NOT EXISTS link_member (link_hk BYTEA NOT NULL REFERENCES link(link_hk), position INTEGER NOT NULL, hash_key BYTEA NOT NULL, PRIMARY KEY (link_hk, position));",
           "CREATE INDEX IF NOT EXISTS link_member_hk_idx ON link_member(hash_key);",
       }},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  int current = executor.CurrentVersion();
  int applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;
    if (migration.version != current + 1) {
      throw std::runtime_error("migration gap: expected version " + std::to_string(current + 1) + ", found " + std::to_string(migration.version));
    }

    executor.Apply(migration);
    current = migration.version;
    ++applied;

    VAULT_LOG_INFO("schema migration applied", {observability::IntField("version", migration.version), observability::StringField("name", migration.name)});
  }
  return applied;
}

} // namespace vault::db::sql
