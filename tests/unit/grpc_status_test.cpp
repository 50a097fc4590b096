#include <cassert>
#include <iostream>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

using renter::grpc::ToStatus;
using renter::util::EngineCode;
using renter::util::EngineError;
using renter::util::Fault;
using renter::util::InputValidationError;
using renter::util::ValidationCode;

::grpc::StatusCode ClientCode(EngineCode code) {
  return ToStatus(EngineError(code, "engine said no")).error_code();
}

void TestValidationErrorsAreInvalidArgument() {
  for (auto code : {ValidationCode::kInvalidAmount, ValidationCode::kInvalidCount, ValidationCode::kInvalidPeriod,
                    ValidationCode::kInvalidRenewWindow, ValidationCode::kBelowMinimum,
                    ValidationCode::kRelativePathRejected}) {
    const auto status = ToStatus(InputValidationError(code, "bad input"));
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    assert(status.error_message() == "bad input");
  }
}

void TestClientFaultsMapByEngineCode() {
  assert(ClientCode(EngineCode::kRejected) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ClientCode(EngineCode::kBundleCorrupt) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ClientCode(EngineCode::kPathNotFound) == ::grpc::StatusCode::NOT_FOUND);
  assert(ClientCode(EngineCode::kPathExists) == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ClientCode(EngineCode::kIoFailure) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ClientCode(EngineCode::kUnavailable) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ClientCode(EngineCode::kInternal) == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestServerFaultsAreInternal() {
  const auto status = ToStatus(EngineError(EngineCode::kPathNotFound, "download failed: missing", Fault::kServer));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "download failed: missing");
}

void TestUnknownExceptionsAreInternal() {
  assert(ToStatus(std::runtime_error("surprise")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::invalid_argument("surprise")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestValidationErrorsAreInvalidArgument();
  TestClientFaultsMapByEngineCode();
  TestServerFaultsAreInternal();
  TestUnknownExceptionsAreInternal();

  std::cout << "renter_control_unit_grpc_status: pass\n";
  return 0;
}
