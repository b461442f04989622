#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/util/time.hpp"

namespace vault::db::sqlite {

/*
  Owns the single sqlite3* connection of a vault database file.

  Every SqliteTransaction shares it. SQLite scopes BEGIN/COMMIT to the
  connection, so a transaction holds TransactionLock() from BEGIN until
  COMMIT or ROLLBACK and transactions must never nest on one thread.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, util::Micros busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Pragmas, migration DDL and transaction control.
  // Throws util::Unavailable on BUSY/LOCKED, std::runtime_error otherwise.
  void Exec(const std::string& sql);

  // "wal" unless the file lives on storage that cannot hold a WAL
  const std::string& JournalMode() const {
    return journal_mode_;
  }

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure(util::Micros busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::string journal_mode_;
  std::mutex  tx_mutex_;
};

// Finalizes on scope exit. ok() is false when preparation failed.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  bool ok() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

} // namespace vault::db::sqlite
