#include "pg_migrations.hpp"

namespace vault::db::postgres {

PgMigrationExecutor::PgMigrationExecutor(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

int PgMigrationExecutor::CurrentVersion() {
  auto                   conn = pool_->Acquire();
  pqxx::read_transaction tx(*conn);
  auto                   row = tx.exec1("SELECT COALESCE(MAX(version), 0) FROM vault_schema_migrations");
  return row[0].as<int>();
}

void PgMigrationExecutor::Apply(const sql::Migration& migration) {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  for (const auto& statement : migration.statements) {
    tx.exec(statement);
  }
  tx.exec_params("INSERT INTO vault_schema_migrations(version, name) VALUES($1, $2)", migration.version, migration.name);
  tx.commit();
}

int MigrateSchema(const std::shared_ptr<PgPool>& pool) {
  {
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec(sql::PostgresMigrationTableSql());
    tx.commit();
  }
  PgMigrationExecutor executor(pool);
  return sql::RunMigrations(executor, sql::PostgresMigrations());
}

} // namespace vault::db::postgres
