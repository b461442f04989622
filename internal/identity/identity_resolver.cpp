#include "internal/identity/identity_resolver.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::identity {

namespace {

constexpr std::string_view kTenantDomain = "vault.tenant:";

// a concurrent creator can only win once; one retry settles it
constexpr int kMaxAttempts = 3;

} // namespace

IdentityResolver::IdentityResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                   std::shared_ptr<audit::AuditSink> audit)
    : repository_(std::move(repository)), clock_(std::move(clock)), audit_(std::move(audit)) {
}

HashKey IdentityResolver::Resolve(const HashKey& tenant_hk, std::string_view business_key) {
  if (IsNull(tenant_hk)) {
    throw util::ValidationError("resolve: tenant scope key is null");
  }
  if (business_key.empty()) {
    throw util::ValidationError("resolve: business key is empty");
  }
  return Sha256({AsView(tenant_hk), business_key});
}

HashKey IdentityResolver::ResolveTenant(std::string_view tenant_business_key) {
  if (tenant_business_key.empty()) {
    throw util::ValidationError("resolve tenant: business key is empty");
  }
  return Sha256({kTenantDomain, tenant_business_key});
}

EnsureResult IdentityResolver::EnsureHub(const HashKey& tenant_hk, const std::string& business_key, const std::string& record_source) {
  return Ensure(Resolve(tenant_hk, business_key), tenant_hk, business_key, record_source);
}

EnsureResult IdentityResolver::EnsureTenant(const std::string& tenant_business_key, const std::string& record_source) {
  auto tenant_hk = ResolveTenant(tenant_business_key);
  return Ensure(tenant_hk, tenant_hk, tenant_business_key, record_source);
}

std::optional<db::model::HubRecord> IdentityResolver::FindHub(const HashKey& hash_key) {
  auto tx  = repository_->BeginRead();
  auto hub = repository_->GetHub(*tx, hash_key);
  tx->Commit();
  return hub;
}

EnsureResult IdentityResolver::Ensure(const HashKey& hash_key, const HashKey& tenant_hk, const std::string& business_key,
                                      const std::string& record_source) {
  if (record_source.empty()) {
    throw util::ValidationError("ensure hub: record source is empty");
  }

  for (int attempt = 1;; ++attempt) {
    auto tx = repository_->Begin();
    if (repository_->GetHub(*tx, hash_key)) {
      tx->Commit();
      return {hash_key, false};
    }

    db::model::HubRecord hub{
        .hash_key      = hash_key,
        .business_key  = business_key,
        .tenant_hk     = tenant_hk,
        .load_date     = clock_->Now(),
        .record_source = record_source,
    };

    try {
      db::ThrowIfDbError(repository_->InsertHub(*tx, hub), "ensure hub");
      tx->Commit();
    } catch (const util::Conflict&) {
      // another writer created it between our read and commit
      if (attempt >= kMaxAttempts) throw;
      continue;
    }

    VAULT_LOG_INFO("hub created", {observability::KeyField("hash_key", hash_key), observability::StringField("source", record_source)});
    audit::SafeRecord(audit_.get(), audit::MutationEvent{
                                        .timestamp     = hub.load_date,
                                        .hash_key      = hash_key,
                                        .record_family = "hub",
                                        .version_id    = audit::VersionId(hash_key, hub.load_date),
                                        .record_source = record_source,
                                    });
    return {hash_key, true};
  }
}

} // namespace vault::identity
