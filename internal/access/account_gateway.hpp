#pragma once

#include <string>

namespace eryzaa::access {

/*
  Creates and deletes host accounts for job leases.

  Failures are reported as exceptions:
      ServiceUnavailable  the backing channel is not there
      UserNotFound        delete of an account the host does not know
      CommandFailure      anything else, with diagnostics
*/
class AccountGateway {
 public:
  virtual ~AccountGateway() = default;

  virtual void CreateAccount(const std::string& username, const std::string& secret) = 0;
  virtual void DeleteAccount(const std::string& username)                            = 0;

  // Cheap check whether calls can currently reach the backend.
  virtual bool Available() const {
    return true;
  }
};

} // namespace eryzaa::access
