#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace eryzaa::access {

struct AccountDescriptor {
  std::string             username;
  std::string             secret;
  eryzaa::util::TimePoint created_at;
  bool                    active = false;
};

struct JobLease {
  std::string             job_id;
  std::string             client_id;
  AccountDescriptor       account;
  eryzaa::util::TimePoint expires_at;
};

} // namespace eryzaa::access
