#include "pg_repository.hpp"

#include <string_view>

namespace vault::db::postgres {

namespace {

constexpr const char* kSatelliteColumns =
    "satellite, encode(hash_key,'hex'), load_date, load_end_date, encode(hash_diff,'hex'), encode(payload,'hex'), record_source";

std::string HexOf(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string BytesOfHex(std::string_view hex) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return 0;
  };
  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
  }
  return out;
}

model::SatelliteRecord ReadSatellite(const pqxx::row& row) {
  model::SatelliteRecord r;
  r.satellite = row[0].c_str();
  r.hash_key  = identity::FromHex(row[1].c_str());
  r.load_date = util::FromUnixMicros(row[2].as<int64_t>());
  if (!row[3].is_null()) r.load_end_date = util::FromUnixMicros(row[3].as<int64_t>());
  r.hash_diff     = identity::FromHex(row[4].c_str());
  r.payload       = BytesOfHex(row[5].c_str());
  r.record_source = row[6].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::CheckWritable(PgTransaction& tx) {
  if (tx.IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  if (!tx.IsOpen()) return Result::Err(ErrorCode::InternalError, "transaction already finished");
  return Result::Ok();
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* uv = dynamic_cast<const pqxx::unique_violation*>(&e)) {
    std::string_view what = uv->what();
    if (what.find("_pkey") != std::string_view::npos) {
      return Result::Err(ErrorCode::AlreadyExists, uv->what());
    }
    return Result::Err(ErrorCode::ConstraintViolation, uv->what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Hubs
// ------------------------------------------------------------------

Result PgRepository::InsertHub(Transaction& t, const model::HubRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  try {
    tx.Work().exec_params("INSERT INTO hub(hash_key,business_key,tenant_hk,load_date,record_source) "
                          "VALUES(decode($1,'hex'),$2,decode($3,'hex'),$4,$5)",
                          identity::ToHex(r.hash_key), r.business_key, identity::ToHex(r.tenant_hk), util::ToUnixMicros(r.load_date),
                          r.record_source);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HubRecord> PgRepository::GetHub(Transaction& t, const identity::HashKey& hash_key) {
  auto res = TX(t).Work().exec_params("SELECT encode(hash_key,'hex'), business_key, encode(tenant_hk,'hex'), load_date, record_source "
                                      "FROM hub WHERE hash_key=decode($1,'hex')",
                                      identity::ToHex(hash_key));
  if (res.empty()) return std::nullopt;

  model::HubRecord r;
  r.hash_key      = identity::FromHex(res[0][0].c_str());
  r.business_key  = res[0][1].c_str();
  r.tenant_hk     = identity::FromHex(res[0][2].c_str());
  r.load_date     = util::FromUnixMicros(res[0][3].as<int64_t>());
  r.record_source = res[0][4].c_str();
  return r;
}

// ------------------------------------------------------------------
// Satellites
// ------------------------------------------------------------------

Result PgRepository::InsertSatellite(Transaction& t, const model::SatelliteRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  try {
    std::optional<int64_t> end;
    if (r.load_end_date) end = util::ToUnixMicros(*r.load_end_date);

    tx.Work().exec_params("INSERT INTO satellite(satellite,hash_key,load_date,load_end_date,hash_diff,payload,record_source) "
                          "VALUES($1,decode($2,'hex'),$3,$4,decode($5,'hex'),decode($6,'hex'),$7)",
                          r.satellite, identity::ToHex(r.hash_key), util::ToUnixMicros(r.load_date), end, identity::ToHex(r.hash_diff),
                          HexOf(r.payload), r.record_source);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CloseSatellite(Transaction& t, const std::string& satellite, const identity::HashKey& hash_key,
                                    util::TimePoint load_date, util::TimePoint load_end_date) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  try {
    auto res = tx.Work().exec_params("UPDATE satellite SET load_end_date=$1 "
                                     "WHERE satellite=$2 AND hash_key=decode($3,'hex') AND load_date=$4 AND load_end_date IS NULL",
                                     util::ToUnixMicros(load_end_date), satellite, identity::ToHex(hash_key), util::ToUnixMicros(load_date));
    if (res.affected_rows() > 0) return Result::Ok();

    // under READ COMMITTED a writer that lost the race re-evaluates the
    // UPDATE against the committed close and matches nothing
    auto row = tx.Work().exec_params("SELECT 1 FROM satellite WHERE satellite=$1 AND hash_key=decode($2,'hex') AND load_date=$3", satellite,
                                     identity::ToHex(hash_key), util::ToUnixMicros(load_date));
    if (!row.empty()) return Result::Err(ErrorCode::Conflict, "satellite row already closed");
    return Result::Err(ErrorCode::NotFound, "satellite row not found");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SatelliteRecord> PgRepository::GetCurrentSatellite(Transaction& t, const std::string& satellite,
                                                                        const identity::HashKey& hash_key) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSatelliteColumns +
                                          " FROM satellite WHERE satellite=$1 AND hash_key=decode($2,'hex') AND load_end_date IS NULL",
                                      satellite, identity::ToHex(hash_key));
  if (res.empty()) return std::nullopt;
  return ReadSatellite(res[0]);
}

std::vector<model::SatelliteRecord> PgRepository::ListSatellites(Transaction& t, const std::string& satellite,
                                                                 const identity::HashKey& hash_key) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSatelliteColumns +
                                          " FROM satellite WHERE satellite=$1 AND hash_key=decode($2,'hex') ORDER BY load_date ASC",
                                      satellite, identity::ToHex(hash_key));

  std::vector<model::SatelliteRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSatellite(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result PgRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;
  try {
    auto link_hex = identity::ToHex(r.link_hk);
    tx.Work().exec_params("INSERT INTO link(link_hk,tenant_hk,load_date,record_source) VALUES(decode($1,'hex'),decode($2,'hex'),$3,$4)",
                          link_hex, identity::ToHex(r.tenant_hk), util::ToUnixMicros(r.load_date), r.record_source);
    for (std::size_t i = 0; i < r.members.size(); ++i) {
      tx.Work().exec_params("INSERT INTO link_member(link_hk,position,hash_key) VALUES(decode($1,'hex'),$2,decode($3,'hex'))", link_hex,
                            static_cast<int>(i), identity::ToHex(r.members[i]));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<identity::HashKey> PgRepository::LoadMembers(pqxx::transaction_base& work, const identity::HashKey& link_hk) {
  auto res = work.exec_params("SELECT encode(hash_key,'hex') FROM link_member WHERE link_hk=decode($1,'hex') ORDER BY position ASC",
                              identity::ToHex(link_hk));
  std::vector<identity::HashKey> members;
  members.reserve(res.size());
  for (const auto& row : res) {
    members.push_back(identity::FromHex(row[0].c_str()));
  }
  return members;
}

std::optional<model::LinkRecord> PgRepository::GetLink(Transaction& t, const identity::HashKey& link_hk) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_params("SELECT encode(link_hk,'hex'), encode(tenant_hk,'hex'), load_date, record_source FROM link "
                                "WHERE link_hk=decode($1,'hex')",
                                identity::ToHex(link_hk));
  if (res.empty()) return std::nullopt;

  model::LinkRecord r;
  r.link_hk       = identity::FromHex(res[0][0].c_str());
  r.tenant_hk     = identity::FromHex(res[0][1].c_str());
  r.load_date     = util::FromUnixMicros(res[0][2].as<int64_t>());
  r.record_source = res[0][3].c_str();
  r.members       = LoadMembers(work, r.link_hk);
  return r;
}

std::vector<model::LinkRecord> PgRepository::ListLinksFor(Transaction& t, const identity::HashKey& member) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_params("SELECT DISTINCT encode(l.link_hk,'hex'), encode(l.tenant_hk,'hex'), l.load_date, l.record_source, l.link_hk "
                                "FROM link l JOIN link_member m ON m.link_hk = l.link_hk "
                                "WHERE m.hash_key=decode($1,'hex') ORDER BY l.load_date ASC, l.link_hk ASC",
                                identity::ToHex(member));

  std::vector<model::LinkRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LinkRecord r;
    r.link_hk       = identity::FromHex(row[0].c_str());
    r.tenant_hk     = identity::FromHex(row[1].c_str());
    r.load_date     = util::FromUnixMicros(row[2].as<int64_t>());
    r.record_source = row[3].c_str();
    r.members       = LoadMembers(work, r.link_hk);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace vault::db::postgres
