#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/engine/model/host_record.hpp"

namespace renter::views {

/*
  Host pagination.

  An absent or empty count returns every host. A count that does not parse
  is an InvalidCount error; a count larger than the list is clamped.
*/
class HostDirectoryView {
public:
  static std::vector<engine::model::HostRecord> Slice(const std::vector<engine::model::HostRecord>& hosts,
                                                      const std::optional<std::string>& requested_count);
};

} // namespace renter::views
