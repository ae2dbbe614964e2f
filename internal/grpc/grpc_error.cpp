#include "internal/grpc/grpc_error.hpp"

#include <string>

namespace eryzaa::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace eryzaa::util;

  if (dynamic_cast<const UserNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ServiceUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, std::string_view action) {
  using namespace eryzaa::util;

  if (status.ok()) return;

  const auto message = std::string(action) + " failed: " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw UserNotFound(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw InvalidArgument(message);
    // a deadline means the helper was reached and may have acted
    case ::grpc::StatusCode::UNAVAILABLE:
      throw ServiceUnavailable(message);
    default:
      throw CommandFailure(message, -1, status.error_message());
  }
}

} // namespace eryzaa::grpc
