#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace renter::catalog {

/*
  Catalog paths (siapaths) are addressed without a leading slash; "/a/b" and
  "a/b" name the same entry. Exactly one leading '/' is stripped.
*/
inline std::string NormalizeSiaPath(const std::string& siapath) {
  if (!siapath.empty() && siapath.front() == '/') {
    return siapath.substr(1);
  }
  return siapath;
}

// Local filesystem arguments must be absolute; checked before any engine call.
inline void RequireAbsolute(const std::string& path, const char* what) {
  if (path.empty() || !std::filesystem::path(path).is_absolute()) {
    throw util::InputValidationError(util::ValidationCode::kRelativePathRejected,
                                     std::string(what) + " must be an absolute path, got '" + path + "'");
  }
}

} // namespace renter::catalog
