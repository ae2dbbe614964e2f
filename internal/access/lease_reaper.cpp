#include "internal/access/lease_reaper.hpp"

#include "internal/observability/logging.hpp"

namespace eryzaa::access {

LeaseReaper::LeaseReaper(std::shared_ptr<AccessBroker> broker, std::chrono::milliseconds interval)
    : broker_(std::move(broker)), interval_(interval) {
}

LeaseReaper::~LeaseReaper() {
  Stop();
}

void LeaseReaper::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(stop_mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&LeaseReaper::Loop, this);
}

void LeaseReaper::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (thread_.joinable()) thread_.join();
}

void LeaseReaper::Loop() {
  for (;;) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) return;
    }

    try {
      broker_->CleanupExpiredUsers();
    } catch (const std::exception& e) {
      ERYZAA_LOG_ERROR("lease reaper pass failed", {eryzaa::observability::StringField("error", e.what())});
    }
  }
}

} // namespace eryzaa::access
