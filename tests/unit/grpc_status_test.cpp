#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"

namespace {

using eryzaa::grpc::ThrowIfError;
using eryzaa::grpc::ToStatus;

template <typename Expected>
bool Throws(const ::grpc::Status& status) {
  try {
    ThrowIfError(status, "helper call");
  } catch (const Expected&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void TestExceptionsMapToStatusCodes() {
  assert(ToStatus(eryzaa::util::UserNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(eryzaa::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(eryzaa::util::ServiceUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(eryzaa::util::CommandFailure("useradd failed")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(eryzaa::util::CommandFailure("userdel exited with 8"));
  assert(status.error_message() == "userdel exited with 8");
}

void TestStatusCodesMapBackToExceptions() {
  ThrowIfError(::grpc::Status::OK, "helper call");

  assert(Throws<eryzaa::util::UserNotFound>({::grpc::StatusCode::NOT_FOUND, "gone"}));
  assert(Throws<eryzaa::util::InvalidArgument>({::grpc::StatusCode::INVALID_ARGUMENT, "bad name"}));
  assert(Throws<eryzaa::util::ServiceUnavailable>({::grpc::StatusCode::UNAVAILABLE, "no socket"}));
  // the helper may have acted before the deadline, so no direct fallback
  assert(Throws<eryzaa::util::CommandFailure>({::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"}));
  assert(!Throws<eryzaa::util::ServiceUnavailable>({::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"}));
  assert(Throws<eryzaa::util::CommandFailure>({::grpc::StatusCode::INTERNAL, "useradd exited with 9"}));
  assert(Throws<eryzaa::util::CommandFailure>({::grpc::StatusCode::PERMISSION_DENIED, "not root"}));
}

void TestCommandFailureCarriesHelperMessage() {
  try {
    ThrowIfError({::grpc::StatusCode::INTERNAL, "userdel: user is logged in"}, "helper RemoveAccount");
    assert(false);
  } catch (const eryzaa::util::CommandFailure& e) {
    assert(e.diagnostics() == "userdel: user is logged in");
    assert(std::string(e.what()).find("helper RemoveAccount") != std::string::npos);
  }
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestStatusCodesMapBackToExceptions();
  TestCommandFailureCarriesHelperMessage();

  std::cout << "eryzaa_unit_grpc_status: pass\n";
  return 0;
}
