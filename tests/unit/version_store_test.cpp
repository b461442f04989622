#include "internal/version/version_store.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/relationship/relationship_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace vault;
using namespace std::chrono_literals;
using version::ParentKind;
using version::VersionStore;

const util::TimePoint kT0 = util::FromUnixMicros(1'700'000'000'000'000);

class CountingAuditSink final : public audit::AuditSink {
 public:
  void RecordDecision(const audit::DecisionEvent&) override {
  }
  void RecordMutation(const audit::MutationEvent& event) override {
    std::lock_guard lock(mutex);
    mutations.push_back(event);
  }

  std::mutex                        mutex;
  std::vector<audit::MutationEvent> mutations;
};

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<util::ManualClock>            clock = std::make_shared<util::ManualClock>(kT0);
  std::shared_ptr<CountingAuditSink>            audit = std::make_shared<CountingAuditSink>();
  identity::IdentityResolver                    identity{repo, clock, audit};
  VersionStore                                  store{repo, "customer_profile_s", ParentKind::kHub, clock, audit};

  identity::HashKey Customer(const std::string& name) {
    auto tenant = identity.EnsureTenant("acme", "crm");
    return identity.EnsureHub(tenant.hash_key, name, "crm").hash_key;
  }
};

void TestSupersedeKeepsHistory() {
  Fixture f;
  auto    alice = f.Customer("alice");

  auto v1 = f.store.Put(alice, R"({"email":"alice@old.example"})", "crm");
  assert(v1.effective_from == kT0);
  assert(v1.IsCurrent());

  f.clock->Advance(10s);
  auto v2 = f.store.Put(alice, R"({"email":"alice@new.example"})", "crm");
  assert(v2.effective_from == kT0 + 10s + util::kEpsilon);

  auto history = f.store.History(alice);
  assert(history.size() == 2);
  assert(history[0].payload == v1.payload);
  assert(history[0].effective_to == kT0 + 10s && "superseded version closes at the supersede instant");
  assert(history[1].payload == v2.payload);
  assert(history[1].IsCurrent());

  auto current = f.store.Current(alice);
  assert(current && current->payload == v2.payload);

  // point-in-time reads
  assert(!f.store.AsOf(alice, kT0 - 1us).has_value());
  assert(f.store.AsOf(alice, kT0)->payload == v1.payload);
  assert(f.store.AsOf(alice, kT0 + 5s)->payload == v1.payload);
  assert(f.store.AsOf(alice, kT0 + 10s)->payload == v1.payload);
  assert(f.store.AsOf(alice, kT0 + 10s + util::kEpsilon)->payload == v2.payload);
  assert(f.store.AsOf(alice, kT0 + 1h)->payload == v2.payload);
}

void TestUnchangedPayloadIsNoOp() {
  Fixture f;
  auto    alice = f.Customer("alice");

  auto v1 = f.store.Put(alice, "same", "crm");
  f.clock->Advance(1s);
  auto again = f.store.Put(alice, "same", "billing");

  assert(again.effective_from == v1.effective_from);
  assert(again.record_source == "crm");
  assert(f.store.History(alice).size() == 1);
  assert(again.fingerprint == VersionStore::Fingerprint("same"));
}

void TestSameInstantSupersedeStaysOrdered() {
  Fixture f;
  auto    alice = f.Customer("alice");

  // clock never moves; every version still gets a distinct start
  auto v1 = f.store.Put(alice, "a", "crm");
  auto v2 = f.store.Put(alice, "b", "crm");
  auto v3 = f.store.Put(alice, "c", "crm");

  assert(v1.effective_from < v2.effective_from);
  assert(v2.effective_from < v3.effective_from);

  auto history = f.store.History(alice);
  assert(history.size() == 3);
  for (size_t i = 0; i + 1 < history.size(); ++i) {
    assert(history[i].effective_to.has_value());
    assert(*history[i].effective_to > history[i].effective_from);
    assert(*history[i].effective_to + util::kEpsilon == history[i + 1].effective_from);
  }
  assert(history.back().IsCurrent());
}

void TestUpdateMutatorCanDecline() {
  Fixture f;
  auto    alice = f.Customer("alice");

  auto none = f.store.Update(alice, [](const std::optional<version::Version>&) { return std::optional<std::string>(); }, "crm");
  assert(!none.has_value());
  assert(f.store.History(alice).empty());

  f.store.Put(alice, "1", "crm");
  auto bumped = f.store.Update(
      alice,
      [](const std::optional<version::Version>& cur) -> std::optional<std::string> {
        return std::to_string(std::stoi(cur->payload) + 1);
      },
      "crm");
  assert(bumped && bumped->payload == "2");
}

void TestRejectsUnknownParentAndBadInput() {
  Fixture f;

  bool threw = false;
  try {
    f.store.Put(identity::Sha256({"nobody"}), "x", "crm");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw && "versions require an existing hub");

  threw = false;
  try {
    f.store.Put(identity::HashKey{}, "x", "crm");
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store.Put(f.Customer("alice"), "x", "");
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestLinkParentedStore() {
  Fixture                         f;
  relationship::RelationshipStore links(f.repo, f.clock, f.audit);
  VersionStore                    effectivity(f.repo, "ownership_s", ParentKind::kLink, f.clock, f.audit);

  auto alice = f.Customer("alice");
  auto acct  = f.Customer("account-17");

  bool threw = false;
  try {
    effectivity.Put(alice, "owner", "crm");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw && "a hub key is not a link");

  auto link = links.Link(alice, acct, "crm");
  auto v    = effectivity.Put(link, "owner", "crm");
  assert(v.hash_key == link);
}

void TestMutationsAreAudited() {
  Fixture f;
  auto    alice  = f.Customer("alice");
  auto    before = f.audit->mutations.size();

  auto v1 = f.store.Put(alice, "a", "crm");
  f.store.Put(alice, "a", "crm");
  f.store.Put(alice, "b", "crm");

  assert(f.audit->mutations.size() == before + 2);
  assert(f.audit->mutations[before].record_family == "customer_profile_s");
  assert(f.audit->mutations[before].version_id == v1.Id());
}

void TestConcurrentPutsKeepOneOpenVersion() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto clock = std::make_shared<util::SystemClock>();
  auto audit = std::make_shared<audit::NullAuditSink>();

  identity::IdentityResolver resolver(repo, clock, audit);
  VersionStore               store(repo, "customer_profile_s", ParentKind::kHub, clock, audit);

  auto tenant = resolver.EnsureTenant("acme", "crm");
  auto alice  = resolver.EnsureHub(tenant.hash_key, "alice", "crm").hash_key;

  constexpr int            kThreads = 8;
  constexpr int            kPuts    = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPuts; ++i) {
        store.Put(alice, "writer-" + std::to_string(t) + "-" + std::to_string(i), "crm");
      }
    });
  }
  for (auto& th : threads) th.join();

  auto history = store.History(alice);
  assert(history.size() == kThreads * kPuts);

  int open = 0;
  for (size_t i = 0; i < history.size(); ++i) {
    if (history[i].IsCurrent()) ++open;
    if (i + 1 < history.size()) {
      assert(history[i].effective_from < history[i + 1].effective_from);
      assert(*history[i].effective_to + util::kEpsilon == history[i + 1].effective_from);
    }
  }
  assert(open == 1);
}

} // namespace

int main() {
  TestSupersedeKeepsHistory();
  TestUnchangedPayloadIsNoOp();
  TestSameInstantSupersedeStaysOrdered();
  TestUpdateMutatorCanDecline();
  TestRejectsUnknownParentAndBadInput();
  TestLinkParentedStore();
  TestMutationsAreAudited();
  TestConcurrentPutsKeepOneOpenVersion();

  std::cout << "vault_unit_version_store: pass\n";
  return 0;
}
