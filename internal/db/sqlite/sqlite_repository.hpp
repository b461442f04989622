#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vault::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertHub(Transaction&, const model::HubRecord&) override;
  std::optional<model::HubRecord> GetHub(Transaction&, const identity::HashKey&) override;

  Result InsertSatellite(Transaction&, const model::SatelliteRecord&) override;
  Result CloseSatellite(Transaction&, const std::string& satellite, const identity::HashKey& hash_key,
                        util::TimePoint load_date, util::TimePoint load_end_date) override;
  std::optional<model::SatelliteRecord> GetCurrentSatellite(Transaction&, const std::string& satellite,
                                                            const identity::HashKey& hash_key) override;
  std::vector<model::SatelliteRecord> ListSatellites(Transaction&, const std::string& satellite,
                                                     const identity::HashKey& hash_key) override;

  Result InsertLink(Transaction&, const model::LinkRecord&) override;
  std::optional<model::LinkRecord> GetLink(Transaction&, const identity::HashKey&) override;
  std::vector<model::LinkRecord> ListLinksFor(Transaction&, const identity::HashKey& member) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result CheckWritable(SqliteTransaction& tx);

  std::vector<identity::HashKey> LoadMembers(sqlite3* db, const identity::HashKey& link_hk);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace vault::db::sqlite
