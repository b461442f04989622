#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "internal/identity/hash_key.hpp"

namespace vault::version {

/*
  Per-entity mutex registry.

  Writers to the same hash key are linearized in process; writers to
  different keys never contend. Entries are dropped once no holder is left.
*/
class EntityLocks {
 public:
  class Guard {
   public:
    explicit Guard(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {
    }

   private:
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  Guard Lock(const identity::HashKey& key);

  std::size_t Size() const;

 private:
  mutable std::mutex                                                                       mutex_;
  std::unordered_map<identity::HashKey, std::weak_ptr<std::mutex>, identity::HashKeyHasher> locks_;
};

} // namespace vault::version
