#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace renter::util {

/*
  Central error types.

  InputValidationError is raised before the engine is called.
  EngineError carries a failure reported by the storage engine together with
  the fault class it is surfaced as. Both get translated later to gRPC status
  codes.
*/

enum class ValidationCode {
  kInvalidAmount,
  kInvalidCount,
  kInvalidPeriod,
  kInvalidRenewWindow,
  kBelowMinimum,
  kRelativePathRejected,
};

enum class EngineCode {
  kRejected,
  kPathNotFound,
  kPathExists,
  kBundleCorrupt,
  kIoFailure,
  kUnavailable,
  kInternal,
};

enum class Fault {
  kClient,
  kServer,
};

std::string_view ToString(ValidationCode code);
std::string_view ToString(EngineCode code);
std::string_view ToString(Fault fault);

class InputValidationError : public std::runtime_error {
 public:
  InputValidationError(ValidationCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ValidationCode code() const {
    return code_;
  }

 private:
  ValidationCode code_;
};

class EngineError : public std::runtime_error {
 public:
  EngineError(EngineCode code, const std::string& msg, Fault fault = Fault::kClient)
      : std::runtime_error(msg), code_(code), fault_(fault) {
  }

  EngineCode code() const {
    return code_;
  }

  Fault fault() const {
    return fault_;
  }

 private:
  EngineCode code_;
  Fault      fault_;
};

} // namespace renter::util
