#pragma once

#include <string>

namespace renter::engine::model {

/*
  Upload request handed to the engine. Erasure coding is left to the
  engine's defaults.
*/

struct FileUploadParams {
  std::string source;   // absolute local path
  std::string siapath;  // normalized catalog path
};

} // namespace renter::engine::model
