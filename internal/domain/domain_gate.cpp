#include "internal/domain/domain_gate.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "vault/core/v1/domain.pb.h"

namespace vault::domain {

using observability::KeyField;
using observability::StringField;

namespace pb = vault::core::v1;

namespace {

bool Contains(const std::vector<std::string>& list, std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

std::string Serialize(const Assignment& a) {
  pb::DomainAssignment m;
  m.set_domain(a.domain);
  m.set_domain_hk(identity::ToBytes(a.domain_hk));
  m.set_link_hk(identity::ToBytes(a.link_hk));
  for (const auto& c : a.allowed_categories) m.add_allowed_categories(c);
  for (const auto& c : a.denied_categories) m.add_denied_categories(c);
  for (const auto& d : a.forbidden_domains) m.add_forbidden_domains(d);
  m.mutable_permissions()->set_read(a.permissions.read);
  m.mutable_permissions()->set_write(a.permissions.write);
  m.mutable_permissions()->set_learn(a.permissions.learn);
  m.mutable_permissions()->set_inference(a.permissions.inference);
  m.set_granted_by(a.granted_by);
  *m.mutable_granted_at() = util::ToProto(a.granted_at);
  m.set_status(a.active ? pb::ASSIGNMENT_STATUS_ACTIVE : pb::ASSIGNMENT_STATUS_REVOKED);

  std::string out;
  if (!m.SerializeToString(&out)) {
    throw std::runtime_error("domain assignment: serialization failed");
  }
  return out;
}

Assignment Parse(const std::string& payload) {
  pb::DomainAssignment m;
  if (!m.ParseFromString(payload)) {
    throw std::runtime_error("domain assignment: corrupt payload");
  }

  Assignment a;
  a.domain             = m.domain();
  a.domain_hk          = identity::FromBytes(m.domain_hk());
  a.link_hk            = identity::FromBytes(m.link_hk());
  a.allowed_categories = {m.allowed_categories().begin(), m.allowed_categories().end()};
  a.denied_categories  = {m.denied_categories().begin(), m.denied_categories().end()};
  a.forbidden_domains  = {m.forbidden_domains().begin(), m.forbidden_domains().end()};
  a.permissions        = Permissions{m.permissions().read(), m.permissions().write(), m.permissions().learn(), m.permissions().inference()};
  a.granted_by         = m.granted_by();
  a.granted_at         = util::FromProto(m.granted_at());
  a.active             = m.status() == pb::ASSIGNMENT_STATUS_ACTIVE;
  return a;
}

bool Permits(const Permissions& p, access::Action action) {
  switch (action) {
    case access::Action::kRead:
      return p.read;
    case access::Action::kWrite:
      return p.write;
    case access::Action::kLearn:
      return p.learn;
    case access::Action::kInference:
      return p.inference;
  }
  return false;
}

} // namespace

DomainGate::DomainGate(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> identity,
                       std::shared_ptr<relationship::RelationshipStore> relationships, std::shared_ptr<util::Clock> clock,
                       std::shared_ptr<audit::AuditSink> audit)
    : identity_(std::move(identity)),
      relationships_(std::move(relationships)),
      clock_(clock),
      assignments_(std::move(repository), kAssignmentSatellite, version::ParentKind::kHub, clock, std::move(audit)) {
}

Assignment DomainGate::Assign(const identity::HashKey& actor_hk, Assignment assignment, const std::string& record_source) {
  if (assignment.domain.empty()) {
    throw util::ValidationError("assign domain: domain is empty");
  }

  auto actor = identity_->FindHub(actor_hk);
  if (!actor) {
    throw util::NotFound("assign domain: unknown actor " + identity::ToHex(actor_hk));
  }
  if (auto current = Current(actor_hk)) {
    throw util::AlreadyExists("assign domain: actor already bound to domain '" + current->domain + "'");
  }

  auto domain_hub      = identity_->EnsureHub(actor->tenant_hk, "domain:" + assignment.domain, record_source);
  assignment.domain_hk = domain_hub.hash_key;
  assignment.link_hk   = relationships_->Link(actor_hk, domain_hub.hash_key, record_source);
  assignment.granted_at = clock_->Now();
  assignment.active     = true;

  auto payload = Serialize(assignment);
  assignments_.Update(
      actor_hk,
      [&](const std::optional<version::Version>& current) -> std::optional<std::string> {
        // re-checked under the entity lock
        if (current && Parse(current->payload).active) {
          throw util::AlreadyExists("assign domain: actor already bound to a domain");
        }
        return payload;
      },
      record_source);

  VAULT_LOG_INFO("domain assigned", {KeyField("actor", actor_hk), StringField("domain", assignment.domain)});
  return assignment;
}

bool DomainGate::Revoke(const identity::HashKey& actor_hk, const std::string& record_source) {
  bool revoked = false;
  if (!identity_->FindHub(actor_hk)) {
    return false;
  }

  assignments_.Update(
      actor_hk,
      [&](const std::optional<version::Version>& current) -> std::optional<std::string> {
        if (!current) return std::nullopt;
        auto a = Parse(current->payload);
        if (!a.active) return std::nullopt;
        a.active = false;
        revoked  = true;
        return Serialize(a);
      },
      record_source);

  if (revoked) {
    VAULT_LOG_INFO("domain revoked", {KeyField("actor", actor_hk)});
  }
  return revoked;
}

std::optional<Assignment> DomainGate::Current(const identity::HashKey& actor_hk) {
  auto current = assignments_.Current(actor_hk);
  if (!current) return std::nullopt;

  auto a = Parse(current->payload);
  if (!a.active) return std::nullopt;
  return a;
}

std::vector<Assignment> DomainGate::History(const identity::HashKey& actor_hk) {
  std::vector<Assignment> out;
  for (const auto& v : assignments_.History(actor_hk)) {
    out.push_back(Parse(v.payload));
  }
  return out;
}

access::Decision DomainGate::Authorize(const identity::HashKey& actor_hk, std::string_view resource_domain, access::Action action,
                                       std::string_view category) {
  auto assignment = Current(actor_hk);
  if (!assignment) {
    return access::Decision::Deny(access::DenyReason::kNoDomainAssigned);
  }

  if (resource_domain != assignment->domain || Contains(assignment->forbidden_domains, resource_domain)) {
    VAULT_LOG_WARN("cross-domain access blocked", {KeyField("actor", actor_hk), StringField("assigned", assignment->domain),
                                                   StringField("requested", resource_domain)});
    return access::Decision::Deny(access::DenyReason::kCrossDomainViolation);
  }

  if (!Permits(assignment->permissions, action)) {
    return access::Decision::Deny(access::DenyReason::kActionNotPermitted);
  }

  if (!category.empty()) {
    if (Contains(assignment->denied_categories, category)) {
      return access::Decision::Deny(access::DenyReason::kCategoryForbidden);
    }
    if (!Contains(assignment->allowed_categories, category)) {
      return access::Decision::Deny(access::DenyReason::kCategoryNotAllowed);
    }
  }

  return access::Decision::Allow();
}

} // namespace vault::domain
