#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"
#include "internal/version/entity_locks.hpp"

namespace vault::version {

enum class ParentKind {
  kHub,
  kLink,
};

struct Version {
  identity::HashKey              hash_key{};
  std::string                    satellite;
  util::TimePoint                effective_from{};
  std::optional<util::TimePoint> effective_to;
  identity::HashKey              fingerprint{};
  std::string                    payload;
  std::string                    record_source;

  bool IsCurrent() const {
    return !effective_to.has_value();
  }

  std::string Id() const;
};

/*
  VersionStore

  Append-only history of one satellite family. Superseding a version
  closes it at t1 and opens the successor at t1 + kEpsilon in the same
  transaction, so effective-from values of one entity are strictly
  increasing and exactly one version is open.
*/
class VersionStore {
 public:
  // Returns the new payload, or nullopt to leave the entity unchanged.
  using Mutator = std::function<std::optional<std::string>(const std::optional<Version>& current)>;

  VersionStore(std::shared_ptr<db::Repository> repository, std::string satellite, ParentKind parent_kind, std::shared_ptr<util::Clock> clock,
               std::shared_ptr<audit::AuditSink> audit);

  const std::string& Satellite() const {
    return satellite_;
  }

  std::optional<Version> Current(const identity::HashKey& hash_key);

  // No-op (returns the current version) when the fingerprint is unchanged.
  Version Put(const identity::HashKey& hash_key, const std::string& payload, const std::string& record_source);

  // Read-modify-write under the entity lock. Returns the version that is
  // current afterwards.
  std::optional<Version> Update(const identity::HashKey& hash_key, const Mutator& mutate, const std::string& record_source);

  // true if the hub or link the versions hang off exists
  bool HasParent(const identity::HashKey& hash_key);

  // oldest first
  std::vector<Version> History(const identity::HashKey& hash_key);

  // version in effect at t
  std::optional<Version> AsOf(const identity::HashKey& hash_key, util::TimePoint t);

  static identity::HashKey Fingerprint(std::string_view payload);

 private:
  bool ParentExists(db::Transaction& tx, const identity::HashKey& hash_key);

  std::shared_ptr<db::Repository>   repository_;
  std::string                       satellite_;
  ParentKind                        parent_kind_;
  std::shared_ptr<util::Clock>      clock_;
  std::shared_ptr<audit::AuditSink> audit_;
  EntityLocks                       locks_;
};

} // namespace vault::version
