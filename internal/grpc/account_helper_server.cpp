#include "internal/grpc/account_helper_server.hpp"

#include "internal/access/secret.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace eryzaa::grpc {

using eryzaa::observability::StringField;
using eryzaa::util::InvalidArgument;

namespace {

void ValidateUsername(const std::string& username) {
  if (!eryzaa::access::IsJobUsername(username)) {
    throw InvalidArgument("refusing to manage non-job account: " + username);
  }
}

// chpasswd reads "user:secret" lines
void ValidateSecret(const std::string& secret) {
  if (secret.empty()) {
    throw InvalidArgument("secret must not be empty");
  }
  if (secret.find_first_of(":\n\r") != std::string::npos) {
    throw InvalidArgument("secret contains a forbidden character");
  }
}

} // namespace

AccountHelperServer::AccountHelperServer(std::shared_ptr<eryzaa::access::AccountGateway> gateway) : gateway_(std::move(gateway)) {
}

::grpc::Status AccountHelperServer::CreateAccount(::grpc::ServerContext*, const eryzaa::access::v1::CreateAccountRequest* req,
                                                  eryzaa::access::v1::CreateAccountResponse*) {
  try {
    ValidateUsername(req->username());
    ValidateSecret(req->secret());
    gateway_->CreateAccount(req->username(), req->secret());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    ERYZAA_LOG_WARN("create account request rejected", {StringField("username", req->username()), StringField("error", e.what())});
    return ToStatus(e);
  }
}

::grpc::Status AccountHelperServer::RemoveAccount(::grpc::ServerContext*, const eryzaa::access::v1::RemoveAccountRequest* req,
                                                  eryzaa::access::v1::RemoveAccountResponse*) {
  try {
    ValidateUsername(req->username());
    gateway_->DeleteAccount(req->username());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    ERYZAA_LOG_WARN("remove account request rejected", {StringField("username", req->username()), StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace eryzaa::grpc
