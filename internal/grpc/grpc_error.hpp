#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace renter::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  InputValidationError            -> INVALID_ARGUMENT
  EngineError, server fault       -> INTERNAL
  EngineError, client fault       -> by engine code
  anything else                   -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace renter::grpc
