#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::db::sqlite {

namespace {

bool IsBusy(int rc) {
  int primary = rc & 0xFF;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

[[noreturn]] void Fail(int rc, const std::string& msg) {
  if (IsBusy(rc)) throw util::Unavailable(msg);
  throw std::runtime_error(msg);
}

} // namespace

SqliteDB::SqliteDB(std::string path, util::Micros busy_timeout) : path_(std::move(path)) {
  constexpr int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

  int rc = sqlite3_open_v2(path_.c_str(), &db_, kFlags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    Fail(rc, msg);
  }

  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  VAULT_LOG_INFO("sqlite database opened",
                 {observability::StringField("path", path_), observability::StringField("journal_mode", journal_mode_)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  Fail(rc, msg);
}

void SqliteDB::Configure(util::Micros busy_timeout) {
  auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(busy_timeout).count();
  if (sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms)) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // journal_mode answers with the mode actually in effect
  {
    Statement st(db_, "PRAGMA journal_mode=WAL;");
    if (!st.ok() || sqlite3_step(st.get()) != SQLITE_ROW) {
      throw std::runtime_error(std::string("sqlite journal_mode: ") + sqlite3_errmsg(db_));
    }
    const auto* mode = sqlite3_column_text(st.get(), 0);
    journal_mode_    = mode ? reinterpret_cast<const char*>(mode) : "";
  }
  if (journal_mode_ != "wal") {
    VAULT_LOG_WARN("sqlite WAL unavailable", {observability::StringField("path", path_), observability::StringField("journal_mode", journal_mode_)});
  }

  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
}

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st_);
    st_ = nullptr;
  }
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

} // namespace vault::db::sqlite
