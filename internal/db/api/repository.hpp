#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/hub_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/satellite_record.hpp"

namespace vault::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Hubs and links are insert-only
  - Satellite rows are insert-only except for setting load_end_date once
  - Two transactions that both close the open row of the same
    (satellite, hash_key) cannot both commit

  The DB is the source of truth for:
    hubs
    links
    satellite history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Hubs
  // ---------------------------------------------------------------------

  // AlreadyExists if the hash key is taken
  virtual Result InsertHub(Transaction&, const model::HubRecord&) = 0;

  virtual std::optional<model::HubRecord> GetHub(Transaction&, const identity::HashKey& hash_key) = 0;

  // ---------------------------------------------------------------------
  // Satellites
  // ---------------------------------------------------------------------

  // AlreadyExists on primary key collision, ConstraintViolation if an
  // open row already exists for (satellite, hash_key)
  virtual Result InsertSatellite(Transaction&, const model::SatelliteRecord&) = 0;

  // Sets load_end_date on the row identified by its primary key.
  // NotFound if that row is missing, Conflict if it was already closed
  // (a concurrent writer superseded it first).
  virtual Result CloseSatellite(Transaction&, const std::string& satellite, const identity::HashKey& hash_key, util::TimePoint load_date,
                                util::TimePoint load_end_date) = 0;

  virtual std::optional<model::SatelliteRecord> GetCurrentSatellite(Transaction&, const std::string& satellite,
                                                                    const identity::HashKey& hash_key) = 0;

  // oldest first
  virtual std::vector<model::SatelliteRecord> ListSatellites(Transaction&, const std::string& satellite, const identity::HashKey& hash_key) = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  virtual Result InsertLink(Transaction&, const model::LinkRecord&) = 0;

  virtual std::optional<model::LinkRecord> GetLink(Transaction&, const identity::HashKey& link_hk) = 0;

  virtual std::vector<model::LinkRecord> ListLinksFor(Transaction&, const identity::HashKey& member) = 0;
};

} // namespace vault::db
