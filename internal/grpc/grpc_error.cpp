#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace renter::grpc {

namespace {

::grpc::StatusCode ClientCode(renter::util::EngineCode code) {
  using renter::util::EngineCode;

  switch (code) {
    case EngineCode::kRejected:
    case EngineCode::kBundleCorrupt:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case EngineCode::kPathNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case EngineCode::kPathExists:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case EngineCode::kIoFailure:
    case EngineCode::kUnavailable:
    case EngineCode::kInternal:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  return ::grpc::StatusCode::FAILED_PRECONDITION;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace renter::util;

  if (dynamic_cast<const InputValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (const auto* engine = dynamic_cast<const EngineError*>(&e)) {
    if (engine->fault() == Fault::kServer) {
      return {::grpc::StatusCode::INTERNAL, e.what()};
    }
    return {ClientCode(engine->code()), e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace renter::grpc
