#include "share_bundle_codec.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <string_view>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "internal/catalog/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace renter::bundle {

using renter::control::v1::ShareBundle;
using renter::util::EngineCode;
using renter::util::EngineError;

namespace {

constexpr std::string_view kMagic      = "RSBUNDLE";
constexpr std::size_t      kHeaderSize = 8 + 4 + 8;

template <typename T>
void PutLittleEndian(std::string& out, T value) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

template <typename T>
T GetLittleEndian(std::string_view in) {
  T value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<T>(static_cast<unsigned char>(in[i])) << (8 * i);
  }
  return value;
}

[[noreturn]] void Corrupt(const std::string& reason) {
  throw EngineError(EngineCode::kBundleCorrupt, "share bundle is corrupt: " + reason);
}

void ValidateBundle(const ShareBundle& bundle) {
  if (bundle.format_version() != ShareBundleCodec::kFormatVersion) {
    Corrupt("unsupported format version " + std::to_string(bundle.format_version()));
  }

  std::set<std::string> seen;
  for (const auto& file : bundle.files()) {
    if (file.siapath().empty()) {
      Corrupt("file with empty siapath");
    }
    if (!seen.insert(file.siapath()).second) {
      Corrupt("duplicate siapath '" + file.siapath() + "'");
    }

    const auto& ec = file.erasure_code();
    if (ec.data_pieces() == 0) {
      Corrupt("'" + file.siapath() + "' has zero data pieces");
    }
    const std::uint64_t total_pieces = std::uint64_t{ec.data_pieces()} + ec.parity_pieces();
    for (const auto& contract : file.contracts()) {
      for (const auto& piece : contract.pieces()) {
        if (piece.piece() >= total_pieces) {
          Corrupt("'" + file.siapath() + "' piece index " + std::to_string(piece.piece()) +
                  " outside erasure code of " + std::to_string(total_pieces));
        }
      }
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Binary
// ------------------------------------------------------------

std::string ShareBundleCodec::Encode(const ShareBundle& bundle) {
  std::string payload;
  if (!bundle.SerializeToString(&payload)) {
    throw EngineError(EngineCode::kInternal, "failed to serialize share bundle");
  }

  std::string out;
  out.reserve(kHeaderSize + payload.size());
  out.append(kMagic);
  PutLittleEndian<std::uint32_t>(out, kFormatVersion);
  PutLittleEndian<std::uint64_t>(out, payload.size());
  out.append(payload);
  return out;
}

ShareBundle ShareBundleCodec::Decode(const std::string& bytes) {
  const std::string_view in(bytes);
  if (in.size() < kHeaderSize) {
    Corrupt("truncated header");
  }
  if (in.substr(0, kMagic.size()) != kMagic) {
    Corrupt("bad magic");
  }

  const auto version = GetLittleEndian<std::uint32_t>(in.substr(8, 4));
  if (version != kFormatVersion) {
    Corrupt("unsupported format version " + std::to_string(version));
  }

  const auto length = GetLittleEndian<std::uint64_t>(in.substr(12, 8));
  if (length > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    Corrupt("payload length " + std::to_string(length) + " exceeds the protobuf message limit");
  }

  const auto payload = in.substr(kHeaderSize);
  if (payload.size() != length) {
    Corrupt("payload length " + std::to_string(payload.size()) + " does not match header " +
            std::to_string(length));
  }

  ShareBundle bundle;
  if (!bundle.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
    Corrupt("payload does not parse");
  }
  ValidateBundle(bundle);
  return bundle;
}

// ------------------------------------------------------------
// Text
// ------------------------------------------------------------

std::string ShareBundleCodec::EncodeText(const ShareBundle& bundle) {
  return absl::Base64Escape(Encode(bundle));
}

ShareBundle ShareBundleCodec::DecodeText(const std::string& text) {
  const auto trimmed = absl::StripAsciiWhitespace(text);
  if (trimmed.empty()) {
    Corrupt("empty text bundle");
  }

  std::string bytes;
  if (!absl::Base64Unescape(trimmed, &bytes)) {
    Corrupt("text bundle is not valid base64");
  }
  return Decode(bytes);
}

// ------------------------------------------------------------
// Disk
// ------------------------------------------------------------

void ShareBundleCodec::WriteFile(const ShareBundle& bundle, const std::string& path) {
  renter::catalog::RequireAbsolute(path, "bundle destination");

  const auto bytes = Encode(bundle);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw EngineError(EngineCode::kIoFailure, "cannot open '" + path + "' for writing");
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw EngineError(EngineCode::kIoFailure, "failed writing bundle to '" + path + "'");
  }
}

ShareBundle ShareBundleCodec::ReadFile(const std::string& path) {
  renter::catalog::RequireAbsolute(path, "bundle source");

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw EngineError(EngineCode::kIoFailure, "cannot open '" + path + "' for reading");
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw EngineError(EngineCode::kIoFailure, "failed reading bundle from '" + path + "'");
  }
  return Decode(bytes);
}

} // namespace renter::bundle
