#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "eryzaa/access/v1/account_helper.grpc.pb.h"
#include "internal/access/account_gateway.hpp"

namespace eryzaa::grpc {

/*
  Privileged side of the helper channel. Validates requests and forwards them
  to the local gateway; only job account names are accepted.
*/
class AccountHelperServer final : public eryzaa::access::v1::AccountHelper::Service {
 public:
  explicit AccountHelperServer(std::shared_ptr<eryzaa::access::AccountGateway> gateway);

  ::grpc::Status CreateAccount(::grpc::ServerContext*, const eryzaa::access::v1::CreateAccountRequest*,
                               eryzaa::access::v1::CreateAccountResponse*) override;

  ::grpc::Status RemoveAccount(::grpc::ServerContext*, const eryzaa::access::v1::RemoveAccountRequest*,
                               eryzaa::access::v1::RemoveAccountResponse*) override;

 private:
  std::shared_ptr<eryzaa::access::AccountGateway> gateway_;
};

} // namespace eryzaa::grpc
