#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/access/decision.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/relationship/relationship_store.hpp"
#include "internal/version/version_store.hpp"

namespace vault::domain {

inline constexpr const char* kAssignmentSatellite = "actor_domain_s";

struct Permissions {
  bool read      = true;
  bool write     = false;
  bool learn     = false;
  bool inference = false;
};

struct Assignment {
  std::string              domain;
  std::vector<std::string> allowed_categories;
  std::vector<std::string> denied_categories;
  std::vector<std::string> forbidden_domains;
  Permissions              permissions;
  std::string              granted_by;

  // filled in by Assign()
  util::TimePoint   granted_at{};
  identity::HashKey domain_hk{};
  identity::HashKey link_hk{};
  bool              active = true;
};

/*
  DomainGate

  Every actor is bound to exactly one knowledge domain. The binding is
  immutable while active: changing it means Revoke() then Assign().
  Authorize() has no default-allow path and does not consult risk.
*/
class DomainGate {
 public:
  DomainGate(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> identity,
             std::shared_ptr<relationship::RelationshipStore> relationships, std::shared_ptr<util::Clock> clock,
             std::shared_ptr<audit::AuditSink> audit);

  // Throws util::NotFound for an unknown actor, util::AlreadyExists if an
  // active assignment is present, util::ValidationError for an empty domain.
  Assignment Assign(const identity::HashKey& actor_hk, Assignment assignment, const std::string& record_source);

  // false if there was no active assignment
  bool Revoke(const identity::HashKey& actor_hk, const std::string& record_source);

  std::optional<Assignment> Current(const identity::HashKey& actor_hk);

  // every assignment version, oldest first
  std::vector<Assignment> History(const identity::HashKey& actor_hk);

  access::Decision Authorize(const identity::HashKey& actor_hk, std::string_view resource_domain, access::Action action,
                             std::string_view category = {});

 private:
  std::shared_ptr<identity::IdentityResolver>      identity_;
  std::shared_ptr<relationship::RelationshipStore> relationships_;
  std::shared_ptr<util::Clock>                     clock_;
  version::VersionStore                            assignments_;
};

} // namespace vault::domain
