#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "eryzaa/access/v1/account_helper.grpc.pb.h"
#include "internal/access/account_gateway.hpp"

namespace eryzaa::access {

/*
  Delegates account operations to the privileged helper daemon over its
  unix domain socket. Every call carries a deadline of `timeout`. An
  unreachable helper surfaces as ServiceUnavailable; a helper that misses the
  deadline surfaces as CommandFailure, since the operation may have run.
*/
class HelperAccountGateway final : public AccountGateway {
 public:
  HelperAccountGateway(std::string socket_path, std::chrono::milliseconds timeout);

  void CreateAccount(const std::string& username, const std::string& secret) override;
  void DeleteAccount(const std::string& username) override;

  // True when the helper socket exists.
  bool Available() const override;

 private:
  std::string                                              socket_path_;
  std::chrono::milliseconds                                timeout_;
  std::shared_ptr<::grpc::Channel>                         channel_;
  std::unique_ptr<eryzaa::access::v1::AccountHelper::Stub> stub_;
};

} // namespace eryzaa::access
