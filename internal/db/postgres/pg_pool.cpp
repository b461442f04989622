#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, util::Micros acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  bool             free_slot = returned_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || open_ < max_connections_; });
  if (!free_slot) {
    VAULT_LOG_WARN("postgres pool exhausted", {observability::IntField("max_connections", static_cast<std::int64_t>(max_connections_))});
    throw util::Unavailable("postgres connection pool exhausted");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(std::move(conn));
  }

  // reserve the slot before connecting outside the lock
  auto open = ++open_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
  } catch (const std::exception& e) {
    {
      std::lock_guard relock(mutex_);
      --open_;
    }
    returned_.notify_one();
    throw util::Unavailable(std::string("postgres connect: ") + e.what());
  }

  VAULT_LOG_DEBUG("postgres connection opened", {observability::IntField("open", static_cast<std::int64_t>(open))});
  return Lease(std::move(conn));
}

std::shared_ptr<pqxx::connection> PgPool::Lease(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* c) {
    if (auto self = pool.lock()) {
      self->Return(c);
    } else {
      delete c;
    }
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

} // namespace vault::db::postgres
