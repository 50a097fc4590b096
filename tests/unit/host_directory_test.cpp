#include "internal/views/host_directory.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using renter::engine::model::HostRecord;
using renter::views::HostDirectoryView;

std::vector<HostRecord> ThreeHosts() {
  std::vector<HostRecord> hosts(3);
  hosts[0].net_address = "host-a:9982";
  hosts[1].net_address = "host-b:9982";
  hosts[2].net_address = "host-c:9982";
  return hosts;
}

bool RejectsCount(const std::string& requested) {
  try {
    (void)HostDirectoryView::Slice(ThreeHosts(), requested);
  } catch (const renter::util::InputValidationError& e) {
    return e.code() == renter::util::ValidationCode::kInvalidCount;
  }
  return false;
}

void TestAbsentCountReturnsEveryHost() {
  assert(HostDirectoryView::Slice(ThreeHosts(), std::nullopt).size() == 3);
  assert(HostDirectoryView::Slice(ThreeHosts(), std::string()).size() == 3);
}

void TestOvershootIsClamped() {
  const auto hosts = HostDirectoryView::Slice(ThreeHosts(), std::string("5"));
  assert(hosts.size() == 3);
  assert(hosts[2].net_address == "host-c:9982");

  assert(HostDirectoryView::Slice(ThreeHosts(), std::string("18446744073709551615")).size() == 3);
  assert(HostDirectoryView::Slice({}, std::string("4")).empty());
}

void TestPrefixKeepsEngineOrder() {
  const auto hosts = HostDirectoryView::Slice(ThreeHosts(), std::string("2"));
  assert(hosts.size() == 2);
  assert(hosts[0].net_address == "host-a:9982");
  assert(hosts[1].net_address == "host-b:9982");

  assert(HostDirectoryView::Slice(ThreeHosts(), std::string("0")).empty());
}

void TestUnparsableCountIsRejected() {
  assert(RejectsCount("-1"));
  assert(RejectsCount("two"));
  assert(RejectsCount("2.0"));
  assert(RejectsCount(" 2"));
  assert(RejectsCount("18446744073709551616"));
}

} // namespace

int main() {
  TestAbsentCountReturnsEveryHost();
  TestOvershootIsClamped();
  TestPrefixKeepsEngineOrder();
  TestUnparsableCountIsRejected();

  std::cout << "renter_control_unit_host_directory: pass\n";
  return 0;
}
