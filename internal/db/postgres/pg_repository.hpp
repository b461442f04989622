#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace vault::db::postgres {

/*
  Keys and payloads cross the wire hex-encoded and are decoded to BYTEA
  server-side. Instants are BIGINT microseconds since the Unix epoch.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
  static Result CheckWritable(PgTransaction& tx);

  std::vector<identity::HashKey> LoadMembers(pqxx::transaction_base& work, const identity::HashKey& link_hk);

  std::shared_ptr<PgPool> pool_;
};

} // namespace vault::db::postgres
