#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace vault::db::sqlite {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  int  CurrentVersion() override;
  void Apply(const sql::Migration& migration) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

// Creates the bookkeeping table and applies pending migrations.
int MigrateSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace vault::db::sqlite
