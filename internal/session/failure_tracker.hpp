#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::session {

// Failed authentication attempts per actor over a sliding window.
class FailureTracker {
 public:
  explicit FailureTracker(util::Micros window);

  void          Record(const identity::HashKey& actor_hk, util::TimePoint now);
  std::uint32_t Count(const identity::HashKey& actor_hk, util::TimePoint now);

  // actors with at least one retained failure
  std::size_t TrackedActors();

 private:
  void Prune(std::deque<util::TimePoint>& events, util::TimePoint now) const;
  // drops actors whose failures all aged out; runs at most once per window
  void Sweep(util::TimePoint now);

  util::Micros                                                                            window_;
  std::mutex                                                                              mutex_;
  util::TimePoint                                                                         next_sweep_{};
  std::unordered_map<identity::HashKey, std::deque<util::TimePoint>, identity::HashKeyHasher> events_;
};

} // namespace vault::session
