#include "internal/relationship/relationship_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace vault;
using namespace std::chrono_literals;
using relationship::RelationshipStore;

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<util::ManualClock>            clock = std::make_shared<util::ManualClock>(util::FromUnixMicros(1'700'000'000'000'000));
  std::shared_ptr<audit::NullAuditSink>         audit = std::make_shared<audit::NullAuditSink>();
  identity::IdentityResolver                    identity{repo, clock, audit};
  RelationshipStore                             links{repo, clock, audit};

  identity::HashKey Hub(const std::string& tenant, const std::string& name) {
    auto t = identity.EnsureTenant(tenant, "crm");
    return identity.EnsureHub(t.hash_key, name, "crm").hash_key;
  }
};

void TestLinkIsIdempotent() {
  Fixture f;
  auto    alice = f.Hub("acme", "alice");
  auto    acct  = f.Hub("acme", "account-17");

  auto first = f.links.Link(alice, acct, "crm");
  f.clock->Advance(1s);
  auto second = f.links.Link(alice, acct, "billing");
  assert(first == second);
  assert(first == RelationshipStore::LinkKey({alice, acct}));

  auto stored = f.links.Find(first);
  assert(stored.has_value());
  assert(stored->record_source == "crm");
  assert(stored->members.size() == 2 && stored->members[0] == alice && stored->members[1] == acct);

  // member order is part of the relationship
  assert(RelationshipStore::LinkKey({acct, alice}) != first);
}

void TestLinksForListsEveryRelationship() {
  Fixture f;
  auto    alice = f.Hub("acme", "alice");
  auto    acct  = f.Hub("acme", "account-17");
  auto    card  = f.Hub("acme", "card-9");

  auto l1 = f.links.Link(alice, acct, "crm");
  f.clock->Advance(1s);
  auto l2 = f.links.Link({alice, acct, card}, "crm");

  auto for_alice = f.links.LinksFor(alice);
  assert(for_alice.size() == 2);
  assert(for_alice[0].link_hk == l1);
  assert(for_alice[1].link_hk == l2);

  auto for_card = f.links.LinksFor(card);
  assert(for_card.size() == 1 && for_card[0].link_hk == l2);
}

void TestLinkValidation() {
  Fixture f;
  auto    alice = f.Hub("acme", "alice");
  auto    other = f.Hub("globex", "bob");

  auto expect_validation = [&](auto&& fn) {
    bool threw = false;
    try {
      fn();
    } catch (const util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  };

  expect_validation([&] { f.links.Link(std::vector<identity::HashKey>{alice}, "crm"); });
  expect_validation([&] { f.links.Link(alice, identity::HashKey{}, "crm"); });
  expect_validation([&] { f.links.Link(alice, alice, ""); });
  expect_validation([&] { f.links.Link(alice, other, "crm"); });

  bool threw = false;
  try {
    f.links.Link(alice, identity::Sha256({"missing"}), "crm");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw && "members must be existing hubs");
  assert(f.links.LinksFor(alice).empty());
}

void TestConcurrentLinkCreatesOneRow() {
  Fixture f;
  auto    alice = f.Hub("acme", "alice");
  auto    acct  = f.Hub("acme", "account-17");

  std::vector<std::thread>       threads;
  std::vector<identity::HashKey> keys(8);
  for (size_t i = 0; i < keys.size(); ++i) {
    threads.emplace_back([&, i] { keys[i] = f.links.Link(alice, acct, "crm"); });
  }
  for (auto& t : threads) t.join();

  for (const auto& k : keys) assert(k == keys.front());
  assert(f.links.LinksFor(alice).size() == 1);
}

} // namespace

int main() {
  TestLinkIsIdempotent();
  TestLinksForListsEveryRelationship();
  TestLinkValidation();
  TestConcurrentLinkCreatesOneRow();

  std::cout << "vault_unit_relationship_store: pass\n";
  return 0;
}
