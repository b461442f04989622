#include "internal/relationship/relationship_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::relationship {

namespace {

constexpr std::string_view kLinkDomain = "vault.link:";

} // namespace

RelationshipStore::RelationshipStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                     std::shared_ptr<audit::AuditSink> audit)
    : repository_(std::move(repository)), clock_(std::move(clock)), audit_(std::move(audit)) {
}

identity::HashKey RelationshipStore::LinkKey(const std::vector<identity::HashKey>& members) {
  std::string material;
  material.reserve(kLinkDomain.size() + members.size() * identity::kHashKeySize);
  material.append(kLinkDomain);
  for (const auto& m : members) {
    material.append(identity::AsView(m));
  }
  return identity::Sha256({material});
}

identity::HashKey RelationshipStore::Link(const identity::HashKey& a, const identity::HashKey& b, const std::string& record_source) {
  return Link(std::vector<identity::HashKey>{a, b}, record_source);
}

identity::HashKey RelationshipStore::Link(const std::vector<identity::HashKey>& members, const std::string& record_source) {
  if (members.size() < 2) {
    throw util::ValidationError("link: at least two members required");
  }
  for (const auto& m : members) {
    if (identity::IsNull(m)) throw util::ValidationError("link: member hash key is null");
  }
  if (record_source.empty()) {
    throw util::ValidationError("link: record source is empty");
  }

  const auto link_hk = LinkKey(members);

  for (int attempt = 1;; ++attempt) {
    auto tx = repository_->Begin();
    if (repository_->GetLink(*tx, link_hk)) {
      tx->Commit();
      return link_hk;
    }

    identity::HashKey tenant_hk{};
    for (std::size_t i = 0; i < members.size(); ++i) {
      auto hub = repository_->GetHub(*tx, members[i]);
      if (!hub) {
        throw util::NotFound("link: unknown member " + identity::ToHex(members[i]));
      }
      if (i == 0) {
        tenant_hk = hub->tenant_hk;
      } else if (hub->tenant_hk != tenant_hk) {
        throw util::ValidationError("link: members belong to different tenants");
      }
    }

    db::model::LinkRecord link{
        .link_hk       = link_hk,
        .members       = members,
        .tenant_hk     = tenant_hk,
        .load_date     = clock_->Now(),
        .record_source = record_source,
    };

    try {
      db::ThrowIfDbError(repository_->InsertLink(*tx, link), "link");
      tx->Commit();
    } catch (const util::Conflict&) {
      if (attempt >= 3) throw;
      continue;
    }

    VAULT_LOG_INFO("link created", {observability::KeyField("link_hk", link_hk),
                                    observability::IntField("members", static_cast<int64_t>(members.size()))});
    audit::SafeRecord(audit_.get(), audit::MutationEvent{
                                        .timestamp     = link.load_date,
                                        .hash_key      = link_hk,
                                        .record_family = "link",
                                        .version_id    = audit::VersionId(link_hk, link.load_date),
                                        .record_source = record_source,
                                    });
    return link_hk;
  }
}

std::optional<db::model::LinkRecord> RelationshipStore::Find(const identity::HashKey& link_hk) {
  auto tx   = repository_->BeginRead();
  auto link = repository_->GetLink(*tx, link_hk);
  tx->Commit();
  return link;
}

std::vector<db::model::LinkRecord> RelationshipStore::LinksFor(const identity::HashKey& member) {
  auto tx    = repository_->BeginRead();
  auto links = repository_->ListLinksFor(*tx, member);
  tx->Commit();
  return links;
}

} // namespace vault::relationship
