#include "errors.hpp"

namespace renter::util {

std::string_view ToString(ValidationCode code) {
  switch (code) {
    case ValidationCode::kInvalidAmount:
      return "InvalidAmount";
    case ValidationCode::kInvalidCount:
      return "InvalidCount";
    case ValidationCode::kInvalidPeriod:
      return "InvalidPeriod";
    case ValidationCode::kInvalidRenewWindow:
      return "InvalidRenewWindow";
    case ValidationCode::kBelowMinimum:
      return "BelowMinimum";
    case ValidationCode::kRelativePathRejected:
      return "RelativePathRejected";
  }
  return "Unknown";
}

std::string_view ToString(EngineCode code) {
  switch (code) {
    case EngineCode::kRejected:
      return "EngineRejected";
    case EngineCode::kPathNotFound:
      return "PathNotFound";
    case EngineCode::kPathExists:
      return "PathExists";
    case EngineCode::kBundleCorrupt:
      return "BundleCorrupt";
    case EngineCode::kIoFailure:
      return "IoFailure";
    case EngineCode::kUnavailable:
      return "Unavailable";
    case EngineCode::kInternal:
      return "Internal";
  }
  return "Unknown";
}

std::string_view ToString(Fault fault) {
  return fault == Fault::kServer ? "server" : "client";
}

} // namespace renter::util
