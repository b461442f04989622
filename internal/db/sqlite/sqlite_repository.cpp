#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace vault::db::sqlite {

using vault::db::ErrorCode;
using vault::db::Result;

static void BindKey(sqlite3_stmt* st, int idx, const identity::HashKey& key) {
  sqlite3_bind_blob(st, idx, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(util::ToUnixMicros(tp)));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

static identity::HashKey ColKey(sqlite3_stmt* st, int col) {
  return identity::FromBytes(ColBlob(st, col));
}

static util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMicros(sqlite3_column_int64(st, col));
}

static model::SatelliteRecord ReadSatellite(sqlite3_stmt* st) {
  model::SatelliteRecord r;
  r.satellite = ColText(st, 0);
  r.hash_key  = ColKey(st, 1);
  r.load_date = ColTime(st, 2);
  if (sqlite3_column_type(st, 3) != SQLITE_NULL) r.load_end_date = ColTime(st, 3);
  r.hash_diff     = ColKey(st, 4);
  r.payload       = ColBlob(st, 5);
  r.record_source = ColText(st, 6);
  return r;
}

static void ThrowPrepare(sqlite3* db) {
  throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::CheckWritable(SqliteTransaction& tx) {
  if (tx.IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  if (!tx.IsOpen()) return Result::Err(ErrorCode::InternalError, "transaction already finished");
  return Result::Ok();
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_CHECK:
    case SQLITE_CONSTRAINT_FOREIGNKEY:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Hubs
// ------------------------------------------------------------------

Result SqliteRepository::InsertHub(Transaction& t, const model::HubRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  auto* db = tx.Handle();

  Statement st(db, "INSERT INTO hub(hash_key,business_key,tenant_hk,load_date,record_source) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindKey(st.get(), 1, r.hash_key);
  BindText(st.get(), 2, r.business_key);
  BindKey(st.get(), 3, r.tenant_hk);
  BindTime(st.get(), 4, r.load_date);
  BindText(st.get(), 5, r.record_source);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HubRecord> SqliteRepository::GetHub(Transaction& t, const identity::HashKey& hash_key) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT hash_key,business_key,tenant_hk,load_date,record_source FROM hub WHERE hash_key=?;");
  if (!st.ok()) ThrowPrepare(db);
  BindKey(st.get(), 1, hash_key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::HubRecord r;
  r.hash_key      = ColKey(st.get(), 0);
  r.business_key  = ColText(st.get(), 1);
  r.tenant_hk     = ColKey(st.get(), 2);
  r.load_date     = ColTime(st.get(), 3);
  r.record_source = ColText(st.get(), 4);
  return r;
}

// ------------------------------------------------------------------
// Satellites
// ------------------------------------------------------------------

Result SqliteRepository::InsertSatellite(Transaction& t, const model::SatelliteRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  auto* db = tx.Handle();

  Statement st(db,
               "INSERT INTO satellite(satellite,hash_key,load_date,load_end_date,hash_diff,payload,record_source) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.satellite);
  BindKey(st.get(), 2, r.hash_key);
  BindTime(st.get(), 3, r.load_date);
  if (r.load_end_date) {
    BindTime(st.get(), 4, *r.load_end_date);
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  BindKey(st.get(), 5, r.hash_diff);
  BindBlob(st.get(), 6, r.payload);
  BindText(st.get(), 7, r.record_source);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::CloseSatellite(Transaction& t, const std::string& satellite, const identity::HashKey& hash_key,
                                        util::TimePoint load_date, util::TimePoint load_end_date) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  auto* db = tx.Handle();

  Statement st(db, "UPDATE satellite SET load_end_date=? WHERE satellite=? AND hash_key=? AND load_date=? AND load_end_date IS NULL;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindTime(st.get(), 1, load_end_date);
  BindText(st.get(), 2, satellite);
  BindKey(st.get(), 3, hash_key);
  BindTime(st.get(), 4, load_date);

  auto rc = Translate(db, sqlite3_step(st.get()));
  if (!rc) return rc;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  Statement closed(db, "SELECT 1 FROM satellite WHERE satellite=? AND hash_key=? AND load_date=?;");
  if (!closed.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(closed.get(), 1, satellite);
  BindKey(closed.get(), 2, hash_key);
  BindTime(closed.get(), 3, load_date);

  int step = sqlite3_step(closed.get());
  if (step == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "satellite row already closed");
  if (step != SQLITE_DONE) return Translate(db, step);
  return Result::Err(ErrorCode::NotFound, "satellite row not found");
}

std::optional<model::SatelliteRecord> SqliteRepository::GetCurrentSatellite(Transaction& t, const std::string& satellite,
                                                                            const identity::HashKey& hash_key) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT satellite,hash_key,load_date,load_end_date,hash_diff,payload,record_source FROM satellite "
               "WHERE satellite=? AND hash_key=? AND load_end_date IS NULL;");
  if (!st.ok()) ThrowPrepare(db);
  BindText(st.get(), 1, satellite);
  BindKey(st.get(), 2, hash_key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSatellite(st.get());
}

std::vector<model::SatelliteRecord> SqliteRepository::ListSatellites(Transaction& t, const std::string& satellite,
                                                                     const identity::HashKey& hash_key) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT satellite,hash_key,load_date,load_end_date,hash_diff,payload,record_source FROM satellite "
               "WHERE satellite=? AND hash_key=? ORDER BY load_date ASC;");
  if (!st.ok()) ThrowPrepare(db);
  BindText(st.get(), 1, satellite);
  BindKey(st.get(), 2, hash_key);

  std::vector<model::SatelliteRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadSatellite(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  auto* db = tx.Handle();

  {
    Statement st(db, "INSERT INTO link(link_hk,tenant_hk,load_date,record_source) VALUES(?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindKey(st.get(), 1, r.link_hk);
    BindKey(st.get(), 2, r.tenant_hk);
    BindTime(st.get(), 3, r.load_date);
    BindText(st.get(), 4, r.record_source);

    auto rc = Translate(db, sqlite3_step(st.get()));
    if (!rc) return rc;
  }

  Statement st(db, "INSERT INTO link_member(link_hk,position,hash_key) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (std::size_t i = 0; i < r.members.size(); ++i) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindKey(st.get(), 1, r.link_hk);
    sqlite3_bind_int(st.get(), 2, static_cast<int>(i));
    BindKey(st.get(), 3, r.members[i]);

    auto rc = Translate(db, sqlite3_step(st.get()));
    if (!rc) return rc;
  }
  return Result::Ok();
}

std::vector<identity::HashKey> SqliteRepository::LoadMembers(sqlite3* db, const identity::HashKey& link_hk) {
  Statement st(db, "SELECT hash_key FROM link_member WHERE link_hk=? ORDER BY position ASC;");
  if (!st.ok()) ThrowPrepare(db);
  BindKey(st.get(), 1, link_hk);

  std::vector<identity::HashKey> members;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    members.push_back(ColKey(st.get(), 0));
  }
  return members;
}

std::optional<model::LinkRecord> SqliteRepository::GetLink(Transaction& t, const identity::HashKey& link_hk) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT link_hk,tenant_hk,load_date,record_source FROM link WHERE link_hk=?;");
  if (!st.ok()) ThrowPrepare(db);
  BindKey(st.get(), 1, link_hk);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::LinkRecord r;
  r.link_hk       = ColKey(st.get(), 0);
  r.tenant_hk     = ColKey(st.get(), 1);
  r.load_date     = ColTime(st.get(), 2);
  r.record_source = ColText(st.get(), 3);
  r.members       = LoadMembers(db, r.link_hk);
  return r;
}

std::vector<model::LinkRecord> SqliteRepository::ListLinksFor(Transaction& t, const identity::HashKey& member) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT DISTINCT l.link_hk,l.tenant_hk,l.load_date,l.record_source FROM link l "
               "JOIN link_member m ON m.link_hk = l.link_hk WHERE m.hash_key=? ORDER BY l.load_date ASC, l.link_hk ASC;");
  if (!st.ok()) ThrowPrepare(db);
  BindKey(st.get(), 1, member);

  std::vector<model::LinkRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::LinkRecord r;
    r.link_hk       = ColKey(st.get(), 0);
    r.tenant_hk     = ColKey(st.get(), 1);
    r.load_date     = ColTime(st.get(), 2);
    r.record_source = ColText(st.get(), 3);
    out.push_back(std::move(r));
  }
  for (auto& r : out) {
    r.members = LoadMembers(db, r.link_hk);
  }
  return out;
}

} // namespace vault::db::sqlite
