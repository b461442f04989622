#include "internal/access/access_controller.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace vault;
using namespace std::chrono_literals;
using access::AccessRequest;
using access::Action;
using access::DenyReason;

const util::TimePoint kT0 = util::FromUnixMicros(1'700'000'000'000'000);

class RecordingAuditSink final : public audit::AuditSink {
 public:
  void RecordDecision(const audit::DecisionEvent& event) override {
    std::lock_guard lock(mutex);
    decisions.push_back(event);
  }
  void RecordMutation(const audit::MutationEvent& event) override {
    std::lock_guard lock(mutex);
    mutations.push_back(event);
  }

  std::mutex                        mutex;
  std::vector<audit::DecisionEvent> decisions;
  std::vector<audit::MutationEvent> mutations;
};

struct Fixture {
  Fixture() {
    session::SessionLimits limits;
    limits.max_requests = 3;

    risk      = std::make_shared<risk::RiskEngine>(risk::RiskScorer(risk::RiskWeights{}, risk::TierBounds{}),
                                              risk::DefaultSources({"203.0.113."}, {{"medical_summary", 90.0}}));
    sessions  = std::make_shared<session::SessionManager>(repo, identity, risk, clock, audit, limits);
    domains   = std::make_shared<domain::DomainGate>(repo, identity, links, clock, audit);
    records   = std::make_shared<version::VersionStore>(repo, "entity_profile_s", version::ParentKind::kHub, clock, audit);
    access    = std::make_shared<access::AccessController>(sessions, domains, records, clock, audit);

    auto tenant = identity->EnsureTenant("acme", "iam");
    agent       = identity->EnsureHub(tenant.hash_key, "hr-agent", "iam").hash_key;
    employee    = identity->EnsureHub(tenant.hash_key, "employee-42", "hris").hash_key;

    domain::Assignment hr;
    hr.domain             = "hr";
    hr.allowed_categories = {"employee_records", "medical_summary"};
    hr.permissions        = {.read = true, .write = true};
    domains->Assign(agent, hr, "iam");

    token = sessions->Issue(agent, 0us, {.client_fingerprint = "laptop-fp", .ip_address = "10.0.0.5"}).token;
  }

  AccessRequest Request(const std::string& domain_name, const std::string& category, Action action = Action::kRead) {
    return AccessRequest{
        .token             = token,
        .actor_hk          = agent,
        .resource_domain   = domain_name,
        .resource_category = category,
        .action            = action,
        .context           = {.client_fingerprint = "laptop-fp", .ip_address = "10.0.0.5"},
    };
  }

  std::shared_ptr<db::memory::MemoryRepository>    repo     = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<util::ManualClock>               clock    = std::make_shared<util::ManualClock>(kT0);
  std::shared_ptr<RecordingAuditSink>              audit    = std::make_shared<RecordingAuditSink>();
  std::shared_ptr<identity::IdentityResolver>      identity = std::make_shared<identity::IdentityResolver>(repo, clock, audit);
  std::shared_ptr<relationship::RelationshipStore> links    = std::make_shared<relationship::RelationshipStore>(repo, clock, audit);
  std::shared_ptr<risk::RiskEngine>                risk;
  std::shared_ptr<session::SessionManager>         sessions;
  std::shared_ptr<domain::DomainGate>              domains;
  std::shared_ptr<version::VersionStore>           records;
  std::shared_ptr<access::AccessController>        access;

  identity::HashKey agent{};
  identity::HashKey employee{};
  std::string       token;
};

void TestAllowedRequestIsAudited() {
  Fixture f;

  auto result = f.access->Check(f.Request("hr", "employee_records"));
  assert(result);
  assert(result.assessment->tier == risk::AccessTier::kFull);

  assert(f.audit->decisions.size() == 1);
  const auto& event = f.audit->decisions.back();
  assert(event.allowed);
  assert(!event.reason.has_value());
  assert(event.actor_hk == f.agent);
  assert(event.resource_domain == "hr");
  assert(event.action == "read");
  assert(event.tier == risk::AccessTier::kFull);
}

void TestDeniedRequestsCarryReason() {
  Fixture f;

  auto cross = f.access->Check(f.Request("finance", "ledger"));
  assert(!cross && *cross.decision.reason == DenyReason::kCrossDomainViolation);
  assert(!cross.assessment.has_value() && "domain gate runs before risk");

  auto request     = f.Request("hr", "employee_records");
  request.actor_hk = f.employee;
  auto mismatch    = f.access->Check(request);
  assert(!mismatch && *mismatch.decision.reason == DenyReason::kActorMismatch);

  request       = f.Request("hr", "employee_records");
  request.token = "forged";
  auto unknown  = f.access->Check(request);
  assert(!unknown && *unknown.decision.reason == DenyReason::kNotFound);

  assert(f.audit->decisions.size() == 3);
  for (const auto& e : f.audit->decisions) {
    assert(!e.allowed && e.reason.has_value());
  }
  assert(*f.audit->decisions[0].reason == DenyReason::kCrossDomainViolation);
}

void TestElevatedTierRequiresStepUp() {
  Fixture f;

  auto request               = f.Request("hr", "medical_summary");
  request.context.ip_address = "172.16.4.4";

  auto first = f.access->Check(request);
  assert(!first && *first.decision.reason == DenyReason::kStepUpRequired);
  assert(first.assessment->tier == risk::AccessTier::kElevated);

  request.step_up_verified = true;
  assert(f.access->Check(request));
}

void TestDeniedTierBlocksAccess() {
  Fixture f;
  for (int i = 0; i < 5; ++i) f.sessions->RecordFailure(f.agent);

  auto request                       = f.Request("hr", "medical_summary");
  request.context.client_fingerprint = "phone-fp";
  request.context.ip_address         = "203.0.113.50";
  request.step_up_verified           = true;

  auto result = f.access->Check(request);
  assert(!result && *result.decision.reason == DenyReason::kRiskTooHigh);

  // urgent alert from the session plus the decision itself
  assert(f.audit->decisions.size() == 2);
  assert(f.audit->decisions[0].urgent);
  assert(!f.audit->decisions[1].urgent);
}

void TestWriteAndReadChargeUsage() {
  Fixture f;

  auto written = f.access->Write(f.Request("hr", "employee_records"), f.employee, R"({"title":"engineer"})");
  assert(written);
  assert(written.version.has_value());
  assert(written.version->record_source == "access:" + identity::ToHex(f.agent));

  auto read = f.access->Read(f.Request("hr", "employee_records"), f.employee);
  assert(read);
  assert(read.version->payload == R"({"title":"engineer"})");

  auto session = f.sessions->Find(f.token);
  assert(session->requests_made == 2);
  assert(session->bytes_moved == 2 * written.version->payload.size());

  // third request reaches the limit and is still served
  assert(f.access->Read(f.Request("hr", "employee_records"), f.employee));

  auto blocked = f.access->Write(f.Request("hr", "employee_records"), f.employee, R"({"title":"manager"})");
  assert(!blocked && *blocked.decision.reason == DenyReason::kExhausted);
  assert(!blocked.version.has_value());
  assert(f.records->History(f.employee).size() == 1 && "denied write leaves no version");
}

void TestWriteToUnknownRecordChargesNothing() {
  Fixture f;
  auto    ghost = identity::IdentityResolver::Resolve(identity::IdentityResolver::ResolveTenant("acme"), "ghost");

  bool threw = false;
  try {
    f.access->Write(f.Request("hr", "employee_records"), ghost, "x");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto session = f.sessions->Find(f.token);
  assert(session->requests_made == 0);
  assert(session->bytes_moved == 0);

  assert(f.audit->decisions.size() == 1);
  const auto& event = f.audit->decisions.back();
  assert(!event.allowed && "failed write is not recorded as allowed");
  assert(!event.reason.has_value());
  assert(event.error.find("unknown record") != std::string::npos);
  assert(f.records->History(ghost).empty());
}

void TestWriteNeedsWritePermission() {
  Fixture f;
  auto    auditor = f.identity->EnsureHub(identity::IdentityResolver::ResolveTenant("acme"), "auditor", "iam").hash_key;

  domain::Assignment read_only;
  read_only.domain             = "hr";
  read_only.allowed_categories = {"employee_records"};
  f.domains->Assign(auditor, read_only, "iam");

  auto request     = f.Request("hr", "employee_records");
  request.token    = f.sessions->Issue(auditor, 0us, {.client_fingerprint = "laptop-fp", .ip_address = "10.0.0.5"}).token;
  request.actor_hk = auditor;

  assert(f.access->Read(request, f.employee));
  auto write = f.access->Write(request, f.employee, "{}");
  assert(!write && *write.decision.reason == DenyReason::kActionNotPermitted);
  assert(f.records->History(f.employee).empty());
}

void TestRevokedSessionIsDenied() {
  Fixture f;
  assert(f.sessions->Revoke(f.token, "offboarded"));

  auto result = f.access->Check(f.Request("hr", "employee_records"));
  assert(!result && *result.decision.reason == DenyReason::kRevoked);
}

void TestFactoryWiresDefaultRuntime() {
  auto config = config::ConfigLoader::Defaults();
  config.mutable_audit()->set_sink("none");

  auto clock = std::make_shared<util::ManualClock>(kT0);
  auto rt    = factory::Build(config, clock);

  auto tenant = rt.identity->EnsureTenant("acme", rt.default_record_source);
  auto agent  = rt.identity->EnsureHub(tenant.hash_key, "agent", rt.default_record_source).hash_key;

  domain::Assignment ops;
  ops.domain = "ops";
  rt.domains->Assign(agent, ops, rt.default_record_source);

  auto session = rt.sessions->Issue(agent, 0us, {.client_fingerprint = "fp", .ip_address = "10.1.1.1"});
  assert(session.expires_at == kT0 + 10min);

  AccessRequest request{
      .token           = session.token,
      .actor_hk        = agent,
      .resource_domain = "ops",
      .action          = Action::kRead,
      .context         = {.client_fingerprint = "fp", .ip_address = "10.1.1.1"},
  };
  assert(rt.access->Check(request));
  assert(rt.profiles->Satellite() == factory::kProfileSatellite);
}

} // namespace

int main() {
  TestAllowedRequestIsAudited();
  TestDeniedRequestsCarryReason();
  TestElevatedTierRequiresStepUp();
  TestDeniedTierBlocksAccess();
  TestWriteAndReadChargeUsage();
  TestWriteToUnknownRecordChargesNothing();
  TestWriteNeedsWritePermission();
  TestRevokedSessionIsDenied();
  TestFactoryWiresDefaultRuntime();

  std::cout << "vault_unit_access_controller: pass\n";
  return 0;
}
