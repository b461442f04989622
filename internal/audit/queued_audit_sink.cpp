#include "internal/audit/queued_audit_sink.hpp"

#include <algorithm>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace vault::audit {

namespace {

constexpr util::Micros kMaxBackoff = std::chrono::seconds(1);

} // namespace

QueuedAuditSink::QueuedAuditSink(std::shared_ptr<AuditSink> inner, std::size_t capacity, unsigned max_retries,
                                 util::Micros retry_backoff)
    : inner_(std::move(inner)),
      capacity_(capacity == 0 ? 1 : capacity),
      max_retries_(max_retries),
      retry_backoff_(std::max(retry_backoff, util::Micros::zero())) {
}

QueuedAuditSink::~QueuedAuditSink() {
  Stop();
}

void QueuedAuditSink::Start() {
  std::lock_guard lock(mutex_);
  if (running_ || thread_.joinable()) return;
  shutdown_ = false;
  running_  = true;
  thread_   = std::thread(&QueuedAuditSink::Run, this);
}

void QueuedAuditSink::Stop() {
  std::thread worker;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    worker    = std::move(thread_);
  }
  cv_.notify_all();
  if (worker.joinable()) worker.join();

  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  idle_cv_.notify_all();
}

void QueuedAuditSink::RecordDecision(const DecisionEvent& event) {
  if (event.urgent) {
    Deliver(event);
    return;
  }
  Enqueue(event);
}

void QueuedAuditSink::RecordMutation(const MutationEvent& event) {
  Enqueue(event);
}

void QueuedAuditSink::Enqueue(Event event) {
  {
    std::unique_lock lock(mutex_);
    if (!shutdown_ && running_ && queue_.size() < capacity_) {
      queue_.push_back(std::move(event));
      lock.unlock();
      cv_.notify_one();
      return;
    }
  }

  // full or not running
  Deliver(event);
}

void QueuedAuditSink::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return (queue_.empty() && !busy_) || !running_; });
}

void QueuedAuditSink::Deliver(const Event& event) {
  auto backoff = retry_backoff_;
  for (unsigned attempt = 0;; ++attempt) {
    try {
      std::visit(
          [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, DecisionEvent>) {
              inner_->RecordDecision(e);
            } else {
              inner_->RecordMutation(e);
            }
          },
          event);
      return;
    } catch (const std::exception& e) {
      if (attempt >= max_retries_) {
        VAULT_LOG_ERROR("audit delivery dropped", {observability::IntField("attempts", attempt + 1), observability::StringField("error", e.what())});
        return;
      }
      VAULT_LOG_WARN("audit delivery retry", {observability::IntField("attempt", attempt + 1), observability::StringField("error", e.what())});
    }

    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, kMaxBackoff);
  }
}

void QueuedAuditSink::Run() {
  for (;;) {
    Event event;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) {
        // shutdown with nothing left
        running_ = false;
        idle_cv_.notify_all();
        return;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    Deliver(event);

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

} // namespace vault::audit
