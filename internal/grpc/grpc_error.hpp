#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace eryzaa::grpc {

/*
  Converts internal exceptions into gRPC status codes and back.

      UserNotFound        <-> NOT_FOUND
      InvalidArgument     <-> INVALID_ARGUMENT
      ServiceUnavailable  <-> UNAVAILABLE
      CommandFailure      <-> everything else, DEADLINE_EXCEEDED included
*/

::grpc::Status ToStatus(const std::exception& e);

// No-op for OK; otherwise throws the matching exception.
void ThrowIfError(const ::grpc::Status& status, std::string_view action);

} // namespace eryzaa::grpc
