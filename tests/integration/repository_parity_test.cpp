#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/audit/audit_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/relationship/relationship_store.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/version/version_store.hpp"

#if VAULT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if VAULT_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using namespace vault;
using namespace std::chrono_literals;
using db::ErrorCode;
using db::Repository;
using db::memory::MemoryRepository;

const util::TimePoint kT0 = util::FromUnixMicros(1'700'000'000'000'000);

int64_t NowUs() {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Keys are salted per run so a shared Postgres database does not collide.
struct Keys {
  std::string salt;

  identity::HashKey operator()(const std::string& name) const {
    return identity::Sha256({salt, name});
  }
};

db::model::HubRecord Hub(const Keys& key, const std::string& name) {
  return {.hash_key = key(name), .business_key = name, .tenant_hk = key("tenant"), .load_date = kT0, .record_source = "parity"};
}

db::model::SatelliteRecord Row(const identity::HashKey& hk, util::TimePoint from, const std::string& payload) {
  return {.satellite     = "parity_s",
          .hash_key      = hk,
          .load_date     = from,
          .load_end_date = std::nullopt,
          .hash_diff     = identity::Sha256({payload}),
          .payload       = payload,
          .record_source = "parity"};
}

void VerifyHubReadWrite(Repository& repo, const Keys& key) {
  auto tx = repo.Begin();
  assert(repo.InsertHub(*tx, Hub(key, "alice")));

  auto dup = repo.InsertHub(*tx, Hub(key, "alice"));
  assert(!dup && dup.code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read = repo.BeginRead();
  auto hub  = repo.GetHub(*read, key("alice"));
  assert(hub.has_value());
  assert(hub->business_key == "alice");
  assert(hub->tenant_hk == key("tenant"));
  assert(hub->load_date == kT0);
  assert(hub->record_source == "parity");
  assert(!repo.GetHub(*read, key("nobody")).has_value());

  auto write = repo.InsertHub(*read, Hub(key, "bob"));
  assert(!write && write.code == ErrorCode::Unsupported);
  read->Commit();
}

void VerifySatelliteChain(Repository& repo, const Keys& key) {
  auto hk = key("chain");
  {
    auto tx = repo.Begin();
    assert(repo.InsertHub(*tx, Hub(key, "chain")));
    assert(repo.InsertSatellite(*tx, Row(hk, kT0, "v1")));

    auto second_open = repo.InsertSatellite(*tx, Row(hk, kT0 + 1s, "v2"));
    assert(!second_open);
    assert(second_open.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertHub(*tx, Hub(key, "chain")));
    assert(repo.InsertSatellite(*tx, Row(hk, kT0, "v1")));
    assert(repo.CloseSatellite(*tx, "parity_s", hk, kT0, kT0 + 1s));
    assert(repo.InsertSatellite(*tx, Row(hk, kT0 + 1s + util::kEpsilon, "v2")));

    auto missing = repo.CloseSatellite(*tx, "parity_s", hk, kT0 + 3s, kT0 + 4s);
    assert(!missing && missing.code == ErrorCode::NotFound);
    tx->Commit();
  }
  {
    // a writer that read v1 as current before the supersede committed
    auto tx   = repo.Begin();
    auto late = repo.CloseSatellite(*tx, "parity_s", hk, kT0, kT0 + 2s);
    assert(!late && late.code == ErrorCode::Conflict);

    bool conflict = false;
    try {
      db::ThrowIfDbError(late, "close");
    } catch (const util::Conflict&) {
      conflict = true;
    }
    assert(conflict && "a lost race is retryable");
    tx->Rollback();
  }

  auto read = repo.BeginRead();
  auto rows = repo.ListSatellites(*read, "parity_s", hk);
  assert(rows.size() == 2);
  assert(rows[0].payload == "v1");
  assert(rows[0].load_end_date == kT0 + 1s);
  assert(rows[0].hash_diff == identity::Sha256({"v1"}));
  assert(rows[1].payload == "v2");
  assert(!rows[1].load_end_date.has_value());

  auto current = repo.GetCurrentSatellite(*read, "parity_s", hk);
  assert(current && current->load_date == kT0 + 1s + util::kEpsilon);
  assert(!repo.GetCurrentSatellite(*read, "other_s", hk).has_value());
  read->Commit();
}

void VerifyLinks(Repository& repo, const Keys& key) {
  auto a = key("link-a"), b = key("link-b"), c = key("link-c");
  {
    auto tx = repo.Begin();
    for (const auto* name : {"link-a", "link-b", "link-c"}) assert(repo.InsertHub(*tx, Hub(key, name)));

    assert(repo.InsertLink(*tx, {.link_hk = key("abc"), .members = {a, b, c}, .tenant_hk = key("tenant"), .load_date = kT0 + 2s, .record_source = "parity"}));
    assert(repo.InsertLink(*tx, {.link_hk = key("ca"), .members = {c, a}, .tenant_hk = key("tenant"), .load_date = kT0 + 1s, .record_source = "parity"}));

    auto dup = repo.InsertLink(*tx, {.link_hk = key("ca"), .members = {c, a}, .tenant_hk = key("tenant"), .load_date = kT0, .record_source = "parity"});
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  auto read = repo.BeginRead();
  auto abc  = repo.GetLink(*read, key("abc"));
  assert(abc.has_value());
  assert(abc->members.size() == 3);
  assert(abc->members[0] == a && abc->members[1] == b && abc->members[2] == c && "member order is preserved");

  auto for_a = repo.ListLinksFor(*read, a);
  assert(for_a.size() == 2);
  assert(for_a[0].link_hk == key("ca"));
  assert(for_a[1].link_hk == key("abc"));
  assert(repo.ListLinksFor(*read, b).size() == 1);
  read->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Keys& key) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertHub(*tx, Hub(key, "rolled-back")));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertHub(*tx, Hub(key, "dropped")));
    // destructor rolls back
  }

  auto read = repo.BeginRead();
  assert(!repo.GetHub(*read, key("rolled-back")).has_value());
  assert(!repo.GetHub(*read, key("dropped")).has_value());
  read->Commit();
}

// Full stack on top of the backend: identity, versions and a session lifecycle.
void VerifyDomainStack(const std::shared_ptr<Repository>& repo, const Keys& key) {
  auto clock = std::make_shared<util::ManualClock>(kT0);
  auto audit = std::make_shared<audit::NullAuditSink>();

  auto identity = std::make_shared<identity::IdentityResolver>(repo, clock, audit);
  version::VersionStore profiles(repo, "customer_profile_s", version::ParentKind::kHub, clock, audit);

  auto tenant = identity->EnsureTenant(key.salt + "-acme", "crm");
  auto alice  = identity->EnsureHub(tenant.hash_key, "alice", "crm");
  assert(alice.created);
  assert(!identity->EnsureHub(tenant.hash_key, "alice", "crm").created);

  profiles.Put(alice.hash_key, R"({"email":"alice@old.example"})", "crm");
  clock->Advance(10s);
  profiles.Put(alice.hash_key, R"({"email":"alice@new.example"})", "crm");
  profiles.Put(alice.hash_key, R"({"email":"alice@new.example"})", "crm");

  auto history = profiles.History(alice.hash_key);
  assert(history.size() == 2);
  assert(history[0].effective_to == kT0 + 10s);
  assert(history[1].effective_from == kT0 + 10s + util::kEpsilon);
  assert(profiles.AsOf(alice.hash_key, kT0 + 5s)->payload == R"({"email":"alice@old.example"})");

  auto risk = std::make_shared<risk::RiskEngine>(risk::RiskScorer(risk::RiskWeights{}, risk::TierBounds{}), risk::DefaultSources({}, {}));
  session::SessionManager sessions(repo, identity, risk, clock, audit, session::SessionLimits{});

  auto s = sessions.Issue(alice.hash_key, 0us, {.client_fingerprint = "fp", .ip_address = "10.0.0.1"});
  assert(sessions.Validate(s.token, {.client_fingerprint = "fp", .ip_address = "10.0.0.1"}));
  clock->Advance(11min);
  auto expired = sessions.Authenticate(s.token);
  assert(!expired && *expired.denied == access::DenyReason::kExpired);
  assert(sessions.Lifecycle(s.token).back().status == session::SessionStatus::kExpired);
}

void VerifyConcurrentEnsure(const std::shared_ptr<Repository>& repo, const Keys& key) {
  auto clock = std::make_shared<util::SystemClock>();
  auto audit = std::make_shared<audit::NullAuditSink>();

  identity::IdentityResolver resolver(repo, clock, audit);
  auto                       tenant = identity::IdentityResolver::ResolveTenant(key.salt + "-concurrent");

  std::atomic<int>         created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      if (resolver.EnsureHub(tenant, "shared", "parity").created) created.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  assert(created.load() == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const Keys& key) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertHub(*tx, Hub(key, "durable")));
    assert(repo->InsertSatellite(*tx, Row(key("durable"), kT0, "persisted")));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->BeginRead();
  auto hub = repo->GetHub(*tx, key("durable"));
  assert(hub.has_value());
  auto current = repo->GetCurrentSatellite(*tx, "parity_s", key("durable"));
  assert(current.has_value());
  assert(current->payload == "persisted");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if VAULT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vault_integration_sqlite_" + std::to_string(NowUs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<db::sqlite::SqliteDB>(db_path);
    db::sqlite::MigrateSchema(db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if VAULT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("VAULT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VAULT_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<db::postgres::PgPool>(conninfo);
    db::postgres::MigrateSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  Keys key{backend.name + "-" + std::to_string(NowUs())};

  {
    auto repo = backend.make_repository();
    VerifyHubReadWrite(*repo, key);
    VerifySatelliteChain(*repo, key);
    VerifyLinks(*repo, key);
    VerifyRollbackBehavior(*repo, key);
    VerifyDomainStack(repo, key);
    VerifyConcurrentEnsure(repo, key);
  }

  VerifyRestartDurability(backend, key);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if VAULT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if VAULT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vault_integration_repository_parity: pass\n";
  return 0;
}
