#pragma once

#include <memory>

#include "internal/access/account_gateway.hpp"

namespace eryzaa::access {

/*
  Picks a backend per call: the helper when it is reachable, otherwise the
  direct gateway. A helper that turns out to be unavailable mid-call falls
  back to direct; every other helper error is passed through.
*/
class ProbingAccountGateway final : public AccountGateway {
 public:
  ProbingAccountGateway(std::shared_ptr<AccountGateway> helper, std::shared_ptr<AccountGateway> direct);

  void CreateAccount(const std::string& username, const std::string& secret) override;
  void DeleteAccount(const std::string& username) override;

 private:
  template <typename Call>
  void Dispatch(const char* operation, const std::string& username, Call&& call);

  std::shared_ptr<AccountGateway> helper_;
  std::shared_ptr<AccountGateway> direct_;
};

} // namespace eryzaa::access
