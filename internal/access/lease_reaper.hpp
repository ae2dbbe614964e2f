#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/access/access_broker.hpp"

namespace eryzaa::access {

/*
  Background worker that expires job leases.

  Calls AccessBroker::CleanupExpiredUsers() every `interval` until stopped.
*/
class LeaseReaper {
 public:
  LeaseReaper(std::shared_ptr<AccessBroker> broker, std::chrono::milliseconds interval);
  ~LeaseReaper();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<AccessBroker> broker_;
  std::chrono::milliseconds     interval_;

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace eryzaa::access
