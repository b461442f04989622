#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::identity {

struct EnsureResult {
  HashKey hash_key{};
  bool    created = false;
};

/*
  IdentityResolver

  Maps (tenant scope, business key) to a stable hash key and owns hub
  creation. Resolve() is pure; EnsureHub() is the only writer of hubs.
*/
class IdentityResolver {
 public:
  IdentityResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<audit::AuditSink> audit);

  // SHA-256(tenant_hk || business_key). Throws util::ValidationError on
  // a null tenant key or an empty business key.
  static HashKey Resolve(const HashKey& tenant_hk, std::string_view business_key);

  // Tenant scope key. Separate hash domain from Resolve().
  static HashKey ResolveTenant(std::string_view tenant_business_key);

  // Idempotent under concurrency: exactly one caller observes created=true.
  EnsureResult EnsureHub(const HashKey& tenant_hk, const std::string& business_key, const std::string& record_source);

  // Tenant hubs are scoped to themselves.
  EnsureResult EnsureTenant(const std::string& tenant_business_key, const std::string& record_source);

  std::optional<db::model::HubRecord> FindHub(const HashKey& hash_key);

 private:
  EnsureResult Ensure(const HashKey& hash_key, const HashKey& tenant_hk, const std::string& business_key, const std::string& record_source);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::Clock>      clock_;
  std::shared_ptr<audit::AuditSink> audit_;
};

} // namespace vault::identity
