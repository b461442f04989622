#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vault::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Committed state is immutable per satellite chain: a commit swaps in
  new chain objects, so readers holding the old one never observe a
  half-applied close-then-insert. Writers validate at commit that every
  chain they touched is still the one they started from.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // rows sorted by load_date
  struct Chain {
    std::vector<model::SatelliteRecord> rows;
  };
  using ChainPtr = std::shared_ptr<const Chain>;

  struct State {
    std::unordered_map<identity::HashKey, model::HubRecord, identity::HashKeyHasher>               hubs;
    std::unordered_map<std::string, ChainPtr>                                                      chains;
    std::unordered_map<identity::HashKey, model::LinkRecord, identity::HashKeyHasher>              links;
    std::unordered_multimap<identity::HashKey, identity::HashKey, identity::HashKeyHasher>         links_by_member;
  };

  static std::string ChainKey(const std::string& satellite, const identity::HashKey& hash_key);

  ChainPtr CommittedChain(const std::string& key) const;

  mutable std::shared_mutex mutex_;
  State                     committed_;
};

} // namespace vault::db::memory
