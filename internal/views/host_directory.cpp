#include "host_directory.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

namespace renter::views {

std::vector<engine::model::HostRecord> HostDirectoryView::Slice(const std::vector<engine::model::HostRecord>& hosts,
                                                                const std::optional<std::string>& requested_count) {
  if (!requested_count.has_value() || requested_count->empty()) {
    return hosts;
  }

  auto count = renter::util::ParseUint64(*requested_count);
  if (!count) {
    throw renter::util::InputValidationError(renter::util::ValidationCode::kInvalidCount,
                                             "couldn't parse num_hosts: '" + *requested_count + "'");
  }

  const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(*count, hosts.size()));
  return {hosts.begin(), hosts.begin() + static_cast<std::ptrdiff_t>(n)};
}

} // namespace renter::views
