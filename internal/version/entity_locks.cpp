#include "internal/version/entity_locks.hpp"

namespace vault::version {

EntityLocks::Guard EntityLocks::Lock(const identity::HashKey& key) {
  std::shared_ptr<std::mutex> entity_mutex;
  {
    std::lock_guard lock(mutex_);
    auto&           slot = locks_[key];
    entity_mutex         = slot.lock();
    if (!entity_mutex) {
      entity_mutex = std::make_shared<std::mutex>();
      slot         = entity_mutex;
    }

    // sweep expired entries so the map tracks live writers only
    for (auto it = locks_.begin(); it != locks_.end();) {
      if (it->second.expired()) {
        it = locks_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return Guard(std::move(entity_mutex));
}

std::size_t EntityLocks::Size() const {
  std::lock_guard lock(mutex_);
  std::size_t     live = 0;
  for (const auto& [_, weak] : locks_) {
    if (!weak.expired()) ++live;
  }
  return live;
}

} // namespace vault::version
