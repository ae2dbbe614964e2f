#include "internal/access/lease_reaper.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace {

using namespace std::chrono_literals;

using eryzaa::access::AccessBroker;
using eryzaa::access::LeaseReaper;

class CountingGateway final : public eryzaa::access::AccountGateway {
 public:
  void CreateAccount(const std::string& username, const std::string&) override {
    std::lock_guard lock(mutex_);
    accounts_.insert(username);
  }

  void DeleteAccount(const std::string& username) override {
    std::lock_guard lock(mutex_);
    accounts_.erase(username);
  }

  std::size_t Count() {
    std::lock_guard lock(mutex_);
    return accounts_.size();
  }

 private:
  std::mutex            mutex_;
  std::set<std::string> accounts_;
};

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

void TestReaperExpiresLeases() {
  auto gateway = std::make_shared<CountingGateway>();
  auto broker  = std::make_shared<AccessBroker>(gateway);

  LeaseReaper reaper(broker, 50ms);
  reaper.Start();

  broker->CreateJobUser("short", "c1", 0s);
  assert(WaitUntil([&] { return !broker->CurrentUser().has_value(); }, 2s));
  assert(gateway->Count() == 0);

  broker->CreateJobUser("long", "c2", 1h);
  std::this_thread::sleep_for(200ms);
  assert(broker->CurrentUser().has_value());
  assert(gateway->Count() == 1);

  reaper.Stop();
}

void TestStopDoesNotWaitForInterval() {
  auto broker = std::make_shared<AccessBroker>(std::make_shared<CountingGateway>());

  LeaseReaper reaper(broker, 1h);
  reaper.Start();
  reaper.Start();

  const auto start = std::chrono::steady_clock::now();
  reaper.Stop();
  reaper.Stop();
  assert(std::chrono::steady_clock::now() - start < 1s);
}

} // namespace

int main() {
  TestReaperExpiresLeases();
  TestStopDoesNotWaitForInterval();

  std::cout << "eryzaa_unit_lease_reaper: pass\n";
  return 0;
}
