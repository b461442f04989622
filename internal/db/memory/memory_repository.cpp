#include "memory_repository.hpp"

#include <algorithm>
#include <mutex>

#include "memory_tx.hpp"

namespace vault::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result CheckWritable(MemoryTransaction& tx) {
  if (tx.IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  if (!tx.IsOpen()) return Result::Err(ErrorCode::InternalError, "transaction already finished");
  return Result::Ok();
}

std::string MemoryRepository::ChainKey(const std::string& satellite, const identity::HashKey& hash_key) {
  std::string key = satellite;
  key.push_back('|');
  key.append(identity::AsView(hash_key));
  return key;
}

MemoryRepository::ChainPtr MemoryRepository::CommittedChain(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = committed_.chains.find(key);
  if (it == committed_.chains.end()) return nullptr;
  return it->second;
}

// ------------------------------------------------------------------
// Hubs
// ------------------------------------------------------------------

Result MemoryRepository::InsertHub(Transaction& t, const model::HubRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;

  if (tx.staged_hubs.contains(r.hash_key)) return Result::Err(ErrorCode::AlreadyExists);
  {
    std::shared_lock lock(mutex_);
    if (committed_.hubs.contains(r.hash_key)) return Result::Err(ErrorCode::AlreadyExists);
  }
  tx.staged_hubs.emplace(r.hash_key, r);
  return Result::Ok();
}

std::optional<model::HubRecord> MemoryRepository::GetHub(Transaction& t, const identity::HashKey& hash_key) {
  auto& tx = TX(t);
  if (auto it = tx.staged_hubs.find(hash_key); it != tx.staged_hubs.end()) return it->second;

  std::shared_lock lock(mutex_);
  auto             it = committed_.hubs.find(hash_key);
  if (it == committed_.hubs.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Satellites
// ------------------------------------------------------------------

Result MemoryRepository::InsertSatellite(Transaction& t, const model::SatelliteRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;

  auto& chain = tx.MutableChain(ChainKey(r.satellite, r.hash_key));
  for (const auto& row : chain.rows) {
    if (row.load_date == r.load_date) return Result::Err(ErrorCode::AlreadyExists, "satellite row already exists at load_date");
  }
  if (!r.load_end_date) {
    for (const auto& row : chain.rows) {
      if (!row.load_end_date) return Result::Err(ErrorCode::ConstraintViolation, "open satellite row already exists");
    }
  } else if (*r.load_end_date <= r.load_date) {
    return Result::Err(ErrorCode::ConstraintViolation, "load_end_date must be after load_date");
  }

  auto pos = std::upper_bound(chain.rows.begin(), chain.rows.end(), r.load_date,
                              [](util::TimePoint tp, const model::SatelliteRecord& row) { return tp < row.load_date; });
  chain.rows.insert(pos, r);
  return Result::Ok();
}

Result MemoryRepository::CloseSatellite(Transaction& t, const std::string& satellite, const identity::HashKey& hash_key,
                                        util::TimePoint load_date, util::TimePoint load_end_date) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;

  const auto key  = ChainKey(satellite, hash_key);
  const auto* view = tx.ViewChain(key);
  if (!view) return Result::Err(ErrorCode::NotFound, "no satellite rows");

  auto& chain = tx.MutableChain(key);
  for (auto& row : chain.rows) {
    if (row.load_date != load_date) continue;
    if (row.load_end_date) return Result::Err(ErrorCode::Conflict, "satellite row already closed");
    if (load_end_date <= row.load_date) return Result::Err(ErrorCode::ConstraintViolation, "load_end_date must be after load_date");
    row.load_end_date = load_end_date;
    return Result::Ok();
  }
  return Result::Err(ErrorCode::NotFound, "satellite row not found");
}

std::optional<model::SatelliteRecord> MemoryRepository::GetCurrentSatellite(Transaction& t, const std::string& satellite,
                                                                            const identity::HashKey& hash_key) {
  const auto* chain = TX(t).ViewChain(ChainKey(satellite, hash_key));
  if (!chain) return std::nullopt;

  for (auto it = chain->rows.rbegin(); it != chain->rows.rend(); ++it) {
    if (!it->load_end_date) return *it;
  }
  return std::nullopt;
}

std::vector<model::SatelliteRecord> MemoryRepository::ListSatellites(Transaction& t, const std::string& satellite,
                                                                     const identity::HashKey& hash_key) {
  const auto* chain = TX(t).ViewChain(ChainKey(satellite, hash_key));
  if (!chain) return {};
  return chain->rows;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result MemoryRepository::InsertLink(Transaction& t, const model::LinkRecord& r) {
  auto& tx = TX(t);
  if (auto rc = CheckWritable(tx); !rc) return rc;

  if (tx.staged_links.contains(r.link_hk)) return Result::Err(ErrorCode::AlreadyExists);
  {
    std::shared_lock lock(mutex_);
    if (committed_.links.contains(r.link_hk)) return Result::Err(ErrorCode::AlreadyExists);
  }
  tx.staged_links.emplace(r.link_hk, r);
  return Result::Ok();
}

std::optional<model::LinkRecord> MemoryRepository::GetLink(Transaction& t, const identity::HashKey& link_hk) {
  auto& tx = TX(t);
  if (auto it = tx.staged_links.find(link_hk); it != tx.staged_links.end()) return it->second;

  std::shared_lock lock(mutex_);
  auto             it = committed_.links.find(link_hk);
  if (it == committed_.links.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LinkRecord> MemoryRepository::ListLinksFor(Transaction& t, const identity::HashKey& member) {
  auto&                          tx = TX(t);
  std::vector<model::LinkRecord> out;
  {
    std::shared_lock lock(mutex_);
    auto [begin, end] = committed_.links_by_member.equal_range(member);
    for (auto it = begin; it != end; ++it) {
      out.push_back(committed_.links.at(it->second));
    }
  }
  for (const auto& [_, link] : tx.staged_links) {
    if (std::find(link.members.begin(), link.members.end(), member) != link.members.end()) {
      out.push_back(link);
    }
  }

  std::sort(out.begin(), out.end(), [](const model::LinkRecord& a, const model::LinkRecord& b) {
    if (a.load_date != b.load_date) return a.load_date < b.load_date;
    return a.link_hk < b.link_hk;
  });
  // a link naming the same member twice is indexed twice
  out.erase(std::unique(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.link_hk == b.link_hk; }), out.end());
  return out;
}

} // namespace vault::db::memory
