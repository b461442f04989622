#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>

#include "internal/audit/audit_sink.hpp"
#include "internal/util/time.hpp"

namespace vault::audit {

/*
  Fire-and-forget decorator.

  Events are queued and delivered to the inner sink by one background
  worker, in acceptance order. Urgent decisions and events arriving at a
  full queue are delivered on the caller's thread instead. Failed
  deliveries are retried up to max_retries times with a doubling backoff
  starting at retry_backoff, then logged and dropped.
*/
class QueuedAuditSink final : public AuditSink {
 public:
  QueuedAuditSink(std::shared_ptr<AuditSink> inner, std::size_t capacity, unsigned max_retries,
                  util::Micros retry_backoff = std::chrono::milliseconds(20));
  ~QueuedAuditSink();

  QueuedAuditSink(const QueuedAuditSink&)            = delete;
  QueuedAuditSink& operator=(const QueuedAuditSink&) = delete;

  void Start();
  void Stop();

  void RecordDecision(const DecisionEvent& event) override;
  void RecordMutation(const MutationEvent& event) override;
  void Flush() override;

 private:
  using Event = std::variant<DecisionEvent, MutationEvent>;

  void Enqueue(Event event);
  void Deliver(const Event& event);
  void Run();

  std::shared_ptr<AuditSink> inner_;
  std::size_t                capacity_;
  unsigned                   max_retries_;
  util::Micros               retry_backoff_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<Event>       queue_;
  bool                    busy_     = false;
  bool                    shutdown_ = false;
  // worker accepts events; only read or written under mutex_
  bool                    running_ = false;

  std::thread thread_;
};

} // namespace vault::audit
