#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/access/account_gateway.hpp"
#include "internal/access/lease.hpp"

namespace eryzaa::access {

/*
  Grants one job at a time exclusive access to this node through an
  ephemeral host account.

  The exclusivity slot moves Free -> Reserved -> Occupied while an account
  is being created. Gateway calls run without the lock held; the reserved
  state keeps a concurrent CreateJobUser out in the meantime. A failed
  create deletes the generated account again before the slot is released.

  Errors:
      ExclusivityViolation  slot taken, retry later
      UserNotFound          unknown job
      anything the gateway throws, unchanged
*/
class AccessBroker {
 public:
  explicit AccessBroker(std::shared_ptr<AccountGateway> gateway, std::chrono::seconds default_lease = std::chrono::hours(1));

  JobLease CreateJobUser(const std::string& job_id, const std::string& client_id, std::chrono::seconds duration);
  // Lease of default_lease length.
  JobLease CreateJobUser(const std::string& job_id, const std::string& client_id);
  void     RemoveJobUser(const std::string& job_id);

  bool ValidateUserAccess(const std::string& username) const;

  // Tears down every expired lease; returns the job ids that were removed.
  std::vector<std::string> CleanupExpiredUsers();

  // Tears down every lease; returns how many were removed.
  std::size_t RevokeAll();

  std::optional<std::string> CurrentUser() const;
  std::vector<JobLease>      ActiveJobs() const;

 private:
  enum class SlotState {
    kFree,
    kReserved,
    kOccupied,
  };

  void DiscardAccount(const std::string& username);

  std::shared_ptr<AccountGateway> gateway_;
  const std::chrono::seconds      default_lease_;

  mutable std::mutex                        mutex_;
  SlotState                                 slot_ = SlotState::kFree;
  std::string                               slot_user_;
  std::unordered_map<std::string, JobLease> leases_;
};

} // namespace eryzaa::access
