#include "internal/version/version_store.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::version {

using observability::StringField;

namespace {

Version ToVersion(const db::model::SatelliteRecord& r) {
  return Version{
      .hash_key       = r.hash_key,
      .satellite      = r.satellite,
      .effective_from = r.load_date,
      .effective_to   = r.load_end_date,
      .fingerprint    = r.hash_diff,
      .payload        = r.payload,
      .record_source  = r.record_source,
  };
}

} // namespace

std::string Version::Id() const {
  return audit::VersionId(hash_key, effective_from);
}

VersionStore::VersionStore(std::shared_ptr<db::Repository> repository, std::string satellite, ParentKind parent_kind,
                           std::shared_ptr<util::Clock> clock, std::shared_ptr<audit::AuditSink> audit)
    : repository_(std::move(repository)),
      satellite_(std::move(satellite)),
      parent_kind_(parent_kind),
      clock_(std::move(clock)),
      audit_(std::move(audit)) {
  if (satellite_.empty()) {
    throw util::ValidationError("version store: satellite name is empty");
  }
}

identity::HashKey VersionStore::Fingerprint(std::string_view payload) {
  return identity::Sha256({payload});
}

bool VersionStore::ParentExists(db::Transaction& tx, const identity::HashKey& hash_key) {
  if (parent_kind_ == ParentKind::kLink) {
    return repository_->GetLink(tx, hash_key).has_value();
  }
  return repository_->GetHub(tx, hash_key).has_value();
}

bool VersionStore::HasParent(const identity::HashKey& hash_key) {
  auto tx     = repository_->BeginRead();
  bool exists = ParentExists(*tx, hash_key);
  tx->Commit();
  return exists;
}

std::optional<Version> VersionStore::Current(const identity::HashKey& hash_key) {
  auto tx  = repository_->BeginRead();
  auto cur = repository_->GetCurrentSatellite(*tx, satellite_, hash_key);
  tx->Commit();
  if (!cur) return std::nullopt;
  return ToVersion(*cur);
}

Version VersionStore::Put(const identity::HashKey& hash_key, const std::string& payload, const std::string& record_source) {
  auto result = Update(hash_key, [&](const std::optional<Version>&) { return std::optional<std::string>(payload); }, record_source);
  // a mutator that always returns a payload always leaves a current version
  return *result;
}

std::optional<Version> VersionStore::Update(const identity::HashKey& hash_key, const Mutator& mutate, const std::string& record_source) {
  if (identity::IsNull(hash_key)) {
    throw util::ValidationError(satellite_ + ": hash key is null");
  }
  if (record_source.empty()) {
    throw util::ValidationError(satellite_ + ": record source is empty");
  }

  auto guard = locks_.Lock(hash_key);
  auto tx    = repository_->Begin();

  if (!ParentExists(*tx, hash_key)) {
    throw util::NotFound(satellite_ + ": unknown parent " + identity::ToHex(hash_key));
  }

  std::optional<Version> current;
  if (auto rec = repository_->GetCurrentSatellite(*tx, satellite_, hash_key)) {
    current = ToVersion(*rec);
  }

  auto payload = mutate(current);
  if (!payload) {
    tx->Rollback();
    return current;
  }

  auto fingerprint = Fingerprint(*payload);
  if (current && current->fingerprint == fingerprint) {
    tx->Rollback();
    return current;
  }

  auto now = clock_->Now();

  Version next{
      .hash_key       = hash_key,
      .satellite      = satellite_,
      .effective_from = now,
      .effective_to   = std::nullopt,
      .fingerprint    = fingerprint,
      .payload        = std::move(*payload),
      .record_source  = record_source,
  };

  if (current) {
    // close strictly after the superseded start; successor opens one step later
    auto t1 = std::max(now, current->effective_from + util::kEpsilon);
    db::ThrowIfDbError(repository_->CloseSatellite(*tx, satellite_, hash_key, current->effective_from, t1), satellite_ + ": close version");
    next.effective_from = t1 + util::kEpsilon;
  }

  db::model::SatelliteRecord row{
      .satellite     = satellite_,
      .hash_key      = hash_key,
      .load_date     = next.effective_from,
      .load_end_date = std::nullopt,
      .hash_diff     = next.fingerprint,
      .payload       = next.payload,
      .record_source = record_source,
  };
  db::ThrowIfDbError(repository_->InsertSatellite(*tx, row), satellite_ + ": insert version");
  tx->Commit();

  VAULT_LOG_DEBUG("version stored", {StringField("satellite", satellite_), StringField("version", next.Id()),
                                     observability::BoolField("superseded", current.has_value())});
  audit::SafeRecord(audit_.get(), audit::MutationEvent{
                                      .timestamp     = next.effective_from,
                                      .hash_key      = hash_key,
                                      .record_family = satellite_,
                                      .version_id    = next.Id(),
                                      .record_source = record_source,
                                  });
  return next;
}

std::vector<Version> VersionStore::History(const identity::HashKey& hash_key) {
  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListSatellites(*tx, satellite_, hash_key);
  tx->Commit();

  std::vector<Version> out;
  out.reserve(rows.size());
  for (const auto& r : rows) {
    out.push_back(ToVersion(r));
  }
  return out;
}

std::optional<Version> VersionStore::AsOf(const identity::HashKey& hash_key, util::TimePoint t) {
  auto history = History(hash_key);

  // versions are contiguous up to kEpsilon, so the latest start <= t wins
  std::optional<Version> found;
  for (auto& v : history) {
    if (v.effective_from > t) break;
    found = std::move(v);
  }
  return found;
}

} // namespace vault::version
