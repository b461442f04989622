#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::relationship {

/*
  RelationshipStore

  Insert-only associations between two or more hubs. The link key is
  derived from the ordered member keys, so linking the same members
  twice yields the same key and no second row.
*/
class RelationshipStore {
 public:
  RelationshipStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<audit::AuditSink> audit);

  static identity::HashKey LinkKey(const std::vector<identity::HashKey>& members);

  identity::HashKey Link(const identity::HashKey& a, const identity::HashKey& b, const std::string& record_source);
  identity::HashKey Link(const std::vector<identity::HashKey>& members, const std::string& record_source);

  std::optional<db::model::LinkRecord> Find(const identity::HashKey& link_hk);

  std::vector<db::model::LinkRecord> LinksFor(const identity::HashKey& member);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::Clock>      clock_;
  std::shared_ptr<audit::AuditSink> audit_;
};

} // namespace vault::relationship
