#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace vault::db::memory {

/*
  Transaction = staged write set + the chain versions it was based on
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  bool IsOpen() const {
    return !committed_ && !rolled_back_;
  }

  // Chain as this transaction sees it. Records the committed base on first use.
  const MemoryRepository::Chain* ViewChain(const std::string& key);

  // Writable copy of the chain, created on first write.
  MemoryRepository::Chain& MutableChain(const std::string& key);

  std::unordered_map<identity::HashKey, model::HubRecord, identity::HashKeyHasher>  staged_hubs;
  std::unordered_map<identity::HashKey, model::LinkRecord, identity::HashKeyHasher> staged_links;

 private:
  MemoryRepository&                                          repo_;
  bool                                                       read_only_;
  std::unordered_map<std::string, MemoryRepository::ChainPtr> base_chains_;
  std::unordered_map<std::string, MemoryRepository::Chain>    staged_chains_;
  bool                                                       committed_   = false;
  bool                                                       rolled_back_ = false;
};

} // namespace vault::db::memory
