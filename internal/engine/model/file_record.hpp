#pragma once

#include <cstdint>
#include <string>

#include "internal/model/profile.hpp"

namespace renter::engine::model {

/*
  Read model of one catalog entry, as reported by FileList().
*/

struct FileRecord {
  std::string siapath;

  std::uint64_t filesize = 0;

  // every chunk can currently be recovered
  bool available = false;

  // contracts backing the file are renewed by the allowance
  bool renewing = false;

  // holding contracts / data pieces
  double redundancy = 0.0;

  // percent, 0..100
  double upload_progress = 0.0;

  // lowest end height among the backing contracts
  renter::model::BlockHeight expiration = 0;
};

} // namespace renter::engine::model
