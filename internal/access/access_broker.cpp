#include "internal/access/access_broker.hpp"

#include "internal/access/secret.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace eryzaa::access {

using eryzaa::observability::IntField;
using eryzaa::observability::Metrics;
using eryzaa::observability::StringField;

AccessBroker::AccessBroker(std::shared_ptr<AccountGateway> gateway, std::chrono::seconds default_lease)
    : gateway_(std::move(gateway)), default_lease_(default_lease) {
  if (!gateway_) {
    throw eryzaa::util::InvalidArgument("access broker requires an account gateway");
  }
  if (default_lease_.count() <= 0) {
    throw eryzaa::util::InvalidArgument("default lease must be positive");
  }
}

// ------------------------------------------------------------
// Grant / revoke
// ------------------------------------------------------------

JobLease AccessBroker::CreateJobUser(const std::string& job_id, const std::string& client_id, std::chrono::seconds duration) {
  if (job_id.empty()) {
    throw eryzaa::util::InvalidArgument("job id must not be empty");
  }
  if (duration.count() < 0) {
    throw eryzaa::util::InvalidArgument("lease duration must not be negative");
  }

  AccountDescriptor account;
  account.username = GenerateUsername();
  account.secret   = GenerateSecret();

  {
    std::lock_guard lock(mutex_);
    if (slot_ != SlotState::kFree) {
      Metrics::Instance().RecordLease("grant", "occupied");
      const auto holder = slot_ == SlotState::kOccupied ? slot_user_ : std::string("pending grant");
      throw eryzaa::util::ExclusivityViolation("node is already leased (" + holder + "), retry later");
    }
    slot_ = SlotState::kReserved;
  }

  try {
    gateway_->CreateAccount(account.username, account.secret);
  } catch (const std::exception& e) {
    ERYZAA_LOG_ERROR("job account creation failed", {StringField("job_id", job_id), StringField("error", e.what())});
    DiscardAccount(account.username);
    {
      std::lock_guard lock(mutex_);
      slot_ = SlotState::kFree;
    }
    Metrics::Instance().RecordLease("grant", "failed");
    throw;
  }

  account.created_at = eryzaa::util::Now();
  account.active     = true;

  JobLease lease;
  lease.job_id     = job_id;
  lease.client_id  = client_id;
  lease.expires_at = account.created_at + duration;
  lease.account    = std::move(account);

  {
    std::lock_guard lock(mutex_);
    leases_[job_id] = lease;
    slot_           = SlotState::kOccupied;
    slot_user_      = lease.account.username;
  }

  Metrics::Instance().RecordLease("grant", "ok");
  ERYZAA_LOG_INFO("job access granted", {StringField("job_id", job_id), StringField("client_id", client_id),
                                         StringField("username", lease.account.username),
                                         IntField("duration_s", static_cast<std::int64_t>(duration.count()))});
  return lease;
}

// A failed create can leave the account on the host, e.g. a helper past its deadline.
void AccessBroker::DiscardAccount(const std::string& username) {
  try {
    gateway_->DeleteAccount(username);
    ERYZAA_LOG_WARN("removed account left by failed creation", {StringField("username", username)});
  } catch (const eryzaa::util::UserNotFound&) {
    // nothing was created
  } catch (const std::exception& e) {
    ERYZAA_LOG_ERROR("could not remove account left by failed creation",
                     {StringField("username", username), StringField("error", e.what())});
  }
}

JobLease AccessBroker::CreateJobUser(const std::string& job_id, const std::string& client_id) {
  return CreateJobUser(job_id, client_id, default_lease_);
}

void AccessBroker::RemoveJobUser(const std::string& job_id) {
  std::string username;
  {
    std::lock_guard lock(mutex_);
    auto            it = leases_.find(job_id);
    if (it == leases_.end() || !it->second.account.active) {
      Metrics::Instance().RecordLease("revoke", "not_found");
      throw eryzaa::util::UserNotFound("no active lease for job " + job_id);
    }
    it->second.account.active = false;
    username                  = it->second.account.username;
  }

  try {
    gateway_->DeleteAccount(username);
  } catch (const eryzaa::util::UserNotFound& e) {
    ERYZAA_LOG_WARN("job account already gone from host",
                    {StringField("job_id", job_id), StringField("username", username), StringField("error", e.what())});
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      if (auto it = leases_.find(job_id); it != leases_.end()) it->second.account.active = true;
    }
    Metrics::Instance().RecordLease("revoke", "failed");
    ERYZAA_LOG_ERROR("job account removal failed", {StringField("job_id", job_id), StringField("username", username),
                                                    StringField("error", e.what())});
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    leases_.erase(job_id);
    if (slot_ == SlotState::kOccupied && slot_user_ == username) {
      slot_ = SlotState::kFree;
      slot_user_.clear();
    }
  }

  Metrics::Instance().RecordLease("revoke", "ok");
  ERYZAA_LOG_INFO("job access revoked", {StringField("job_id", job_id), StringField("username", username)});
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool AccessBroker::ValidateUserAccess(const std::string& username) const {
  const auto      now = eryzaa::util::Now();
  std::lock_guard lock(mutex_);

  for (const auto& [job_id, lease] : leases_) {
    if (lease.account.username == username && lease.account.active && lease.expires_at > now) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> AccessBroker::CurrentUser() const {
  std::lock_guard lock(mutex_);
  if (slot_ != SlotState::kOccupied) return std::nullopt;
  return slot_user_;
}

std::vector<JobLease> AccessBroker::ActiveJobs() const {
  std::lock_guard lock(mutex_);

  std::vector<JobLease> out;
  out.reserve(leases_.size());
  for (const auto& [job_id, lease] : leases_) out.push_back(lease);
  return out;
}

// ------------------------------------------------------------
// Bulk teardown
// ------------------------------------------------------------

std::vector<std::string> AccessBroker::CleanupExpiredUsers() {
  std::vector<std::string> expired;
  {
    const auto      now = eryzaa::util::Now();
    std::lock_guard lock(mutex_);
    for (const auto& [job_id, lease] : leases_) {
      if (lease.account.active && lease.expires_at <= now) expired.push_back(job_id);
    }
  }

  std::vector<std::string> cleaned;
  for (const auto& job_id : expired) {
    try {
      RemoveJobUser(job_id);
      cleaned.push_back(job_id);
    } catch (const eryzaa::util::UserNotFound&) {
      // removed concurrently
    } catch (const std::exception& e) {
      ERYZAA_LOG_ERROR("expired lease cleanup failed", {StringField("job_id", job_id), StringField("error", e.what())});
    }
  }

  if (!cleaned.empty()) {
    ERYZAA_LOG_INFO("expired leases cleaned up", {IntField("count", static_cast<std::int64_t>(cleaned.size()))});
  }
  return cleaned;
}

std::size_t AccessBroker::RevokeAll() {
  std::vector<std::string> jobs;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [job_id, lease] : leases_) jobs.push_back(job_id);
  }

  std::size_t revoked = 0;
  for (const auto& job_id : jobs) {
    try {
      RemoveJobUser(job_id);
      ++revoked;
    } catch (const eryzaa::util::UserNotFound&) {
      // removed concurrently
    } catch (const std::exception& e) {
      ERYZAA_LOG_ERROR("lease revocation failed", {StringField("job_id", job_id), StringField("error", e.what())});
    }
  }
  return revoked;
}

} // namespace eryzaa::access
