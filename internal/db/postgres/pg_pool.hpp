#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace vault::db::postgres {

/*
  PgPool

  Bounded set of libpqxx connections for PgRepository. A connection is
  handed to exactly one PgTransaction at a time and comes back to the
  pool when the last shared_ptr to it is dropped; connections that were
  closed underneath us are discarded instead.

  Acquire() waits up to acquire_timeout for a free slot and then throws
  util::Unavailable.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4,
                  util::Micros acquire_timeout = std::chrono::seconds(30));

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t MaxConnections() const {
    return max_connections_;
  }

 private:
  std::shared_ptr<pqxx::connection> Lease(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  std::string  conninfo_;
  std::size_t  max_connections_;
  util::Micros acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace vault::db::postgres
