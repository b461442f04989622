#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace vault::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

const MemoryRepository::Chain* MemoryTransaction::ViewChain(const std::string& key) {
  if (auto it = staged_chains_.find(key); it != staged_chains_.end()) {
    return &it->second;
  }

  auto base = base_chains_.find(key);
  if (base == base_chains_.end()) {
    base = base_chains_.emplace(key, repo_.CommittedChain(key)).first;
  }
  return base->second.get();
}

MemoryRepository::Chain& MemoryTransaction::MutableChain(const std::string& key) {
  if (auto it = staged_chains_.find(key); it != staged_chains_.end()) {
    return it->second;
  }

  const auto*             view = ViewChain(key);
  MemoryRepository::Chain copy;
  if (view) copy = *view;
  return staged_chains_.emplace(key, std::move(copy)).first->second;
}

void MemoryTransaction::Commit() {
  if (read_only_ || (staged_hubs.empty() && staged_links.empty() && staged_chains_.empty())) {
    committed_ = true;
    return;
  }

  std::unique_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  for (const auto& [key, _] : staged_hubs) {
    if (state.hubs.contains(key)) {
      throw util::Conflict("transaction conflict: hub " + identity::ToHex(key) + " inserted concurrently");
    }
  }
  for (const auto& [key, _] : staged_links) {
    if (state.links.contains(key)) {
      throw util::Conflict("transaction conflict: link " + identity::ToHex(key) + " inserted concurrently");
    }
  }
  for (const auto& [key, _] : staged_chains_) {
    auto it      = state.chains.find(key);
    auto current = it == state.chains.end() ? nullptr : it->second;
    if (current != base_chains_.at(key)) {
      throw util::Conflict("transaction conflict: satellite chain modified concurrently");
    }
  }

  for (auto& [key, hub] : staged_hubs) {
    state.hubs.emplace(key, std::move(hub));
  }
  for (auto& [key, link] : staged_links) {
    for (const auto& member : link.members) {
      state.links_by_member.emplace(member, key);
    }
    state.links.emplace(key, std::move(link));
  }
  for (auto& [key, chain] : staged_chains_) {
    state.chains[key] = std::make_shared<const MemoryRepository::Chain>(std::move(chain));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  staged_hubs.clear();
  staged_links.clear();
  staged_chains_.clear();
  rolled_back_ = true;
}

} // namespace vault::db::memory
