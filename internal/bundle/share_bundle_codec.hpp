#pragma once

#include <cstdint>
#include <string>

#include "renter/control/v1/bundle.pb.h"

namespace renter::bundle {

/*
  Share bundle encoding.

  Binary layout:

    [8]  magic "RSBUNDLE"
    [4]  format version, little endian
    [8]  payload length, little endian
    [n]  serialized renter.control.v1.ShareBundle

  The text form is standard base64 of exactly those bytes. Every decode
  failure is util::EngineError{kBundleCorrupt}.
*/
class ShareBundleCodec {
public:
  static constexpr std::uint32_t kFormatVersion = 1;

  static std::string Encode(const renter::control::v1::ShareBundle& bundle);
  static std::string EncodeText(const renter::control::v1::ShareBundle& bundle);

  static renter::control::v1::ShareBundle Decode(const std::string& bytes);
  // Surrounding whitespace is ignored.
  static renter::control::v1::ShareBundle DecodeText(const std::string& text);

  // Both require an absolute path (RelativePathRejected) and report I/O
  // problems as IoFailure.
  static void WriteFile(const renter::control::v1::ShareBundle& bundle, const std::string& path);
  static renter::control::v1::ShareBundle ReadFile(const std::string& path);
};

} // namespace renter::bundle
