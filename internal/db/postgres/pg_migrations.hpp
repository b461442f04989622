#pragma once

#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/sql/migrations.hpp"

namespace vault::db::postgres {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<PgPool> pool);

  int  CurrentVersion() override;
  void Apply(const sql::Migration& migration) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

// Creates the bookkeeping table and applies pending migrations.
int MigrateSchema(const std::shared_ptr<PgPool>& pool);

} // namespace vault::db::postgres
