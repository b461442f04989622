#include "internal/session/failure_tracker.hpp"

namespace vault::session {

FailureTracker::FailureTracker(util::Micros window) : window_(window) {
}

void FailureTracker::Prune(std::deque<util::TimePoint>& events, util::TimePoint now) const {
  while (!events.empty() && events.front() + window_ <= now) {
    events.pop_front();
  }
}

void FailureTracker::Sweep(util::TimePoint now) {
  if (now < next_sweep_) return;
  next_sweep_ = now + window_;

  for (auto it = events_.begin(); it != events_.end();) {
    Prune(it->second, now);
    if (it->second.empty()) {
      it = events_.erase(it);
    } else {
      ++it;
    }
  }
}

void FailureTracker::Record(const identity::HashKey& actor_hk, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  Sweep(now);
  auto& events = events_[actor_hk];
  Prune(events, now);
  events.push_back(now);
}

std::uint32_t FailureTracker::Count(const identity::HashKey& actor_hk, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            it = events_.find(actor_hk);
  if (it == events_.end()) return 0;

  Prune(it->second, now);
  if (it->second.empty()) {
    events_.erase(it);
    return 0;
  }
  return static_cast<std::uint32_t>(it->second.size());
}

std::size_t FailureTracker::TrackedActors() {
  std::lock_guard lock(mutex_);
  return events_.size();
}

} // namespace vault::session
