#include "sqlite_migrations.hpp"

#include <chrono>
#include <stdexcept>

namespace vault::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

int SqliteMigrationExecutor::CurrentVersion() {
  auto lock = db_->TransactionLock();

  Statement st(db_->Handle(), "SELECT COALESCE(MAX(version), 0) FROM vault_schema_migrations;");
  if (!st.ok()) throw std::runtime_error(sqlite3_errmsg(db_->Handle()));
  if (sqlite3_step(st.get()) != SQLITE_ROW) throw std::runtime_error(sqlite3_errmsg(db_->Handle()));
  return sqlite3_column_int(st.get(), 0);
}

void SqliteMigrationExecutor::Apply(const sql::Migration& migration) {
  auto lock = db_->TransactionLock();

  db_->Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : migration.statements) {
      db_->Exec(statement);
    }

    Statement st(db_->Handle(), "INSERT INTO vault_schema_migrations(version, name, applied_at_us) VALUES(?, ?, ?);");
    if (!st.ok()) throw std::runtime_error(sqlite3_errmsg(db_->Handle()));

    const auto now = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    sqlite3_bind_int(st.get(), 1, migration.version);
    sqlite3_bind_text(st.get(), 2, migration.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.get(), 3, now);
    if (sqlite3_step(st.get()) != SQLITE_DONE) throw std::runtime_error(sqlite3_errmsg(db_->Handle()));

    db_->Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

int MigrateSchema(const std::shared_ptr<SqliteDB>& db) {
  db->Exec(sql::SqliteMigrationTableSql());
  SqliteMigrationExecutor executor(db);
  return sql::RunMigrations(executor, sql::SqliteMigrations());
}

} // namespace vault::db::sqlite
