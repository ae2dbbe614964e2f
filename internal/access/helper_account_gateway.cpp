#include "internal/access/helper_account_gateway.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <sys/stat.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace eryzaa::access {

using eryzaa::observability::StringField;

HelperAccountGateway::HelperAccountGateway(std::string socket_path, std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)),
      timeout_(timeout),
      channel_(::grpc::CreateChannel("unix:" + socket_path_, ::grpc::InsecureChannelCredentials())),
      stub_(eryzaa::access::v1::AccountHelper::NewStub(channel_)) {
}

bool HelperAccountGateway::Available() const {
  struct stat st {};
  return ::stat(socket_path_.c_str(), &st) == 0;
}

void HelperAccountGateway::CreateAccount(const std::string& username, const std::string& secret) {
  eryzaa::access::v1::CreateAccountRequest request;
  request.set_username(username);
  request.set_secret(secret);

  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  eryzaa::access::v1::CreateAccountResponse response;
  eryzaa::grpc::ThrowIfError(stub_->CreateAccount(&context, request, &response), "helper CreateAccount");

  ERYZAA_LOG_DEBUG("helper created account", {StringField("username", username)});
}

void HelperAccountGateway::DeleteAccount(const std::string& username) {
  eryzaa::access::v1::RemoveAccountRequest request;
  request.set_username(username);

  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  eryzaa::access::v1::RemoveAccountResponse response;
  eryzaa::grpc::ThrowIfError(stub_->RemoveAccount(&context, request, &response), "helper RemoveAccount");

  ERYZAA_LOG_DEBUG("helper deleted account", {StringField("username", username)});
}

} // namespace eryzaa::access
