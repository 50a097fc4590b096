#include "internal/views/list_views.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace renter::engine::model;
using renter::model::Currency;

void TestContractSizeIsDerivedFromRoots() {
  std::vector<ContractRecord> records(2);
  records[0].id           = "c1";
  records[0].end_height   = 110;
  records[0].net_address  = "host-a:9982";
  records[0].renter_funds = Currency(500);
  records[0].merkle_roots = {"r1", "r2", "r3"};
  records[1].id           = "c2";

  const auto contracts = renter::views::ProjectContracts(records, 4096);
  assert(contracts.size() == 2);
  assert(contracts[0].id() == "c1");
  assert(contracts[0].end_height() == 110);
  assert(contracts[0].net_address() == "host-a:9982");
  assert(contracts[0].renter_funds() == "500");
  assert(contracts[0].size() == 3 * 4096);
  assert(contracts[1].id() == "c2");
  assert(contracts[1].size() == 0);
  assert(contracts[1].renter_funds() == "0");
}

void TestDownloadsAndFilesKeepOrder() {
  std::vector<DownloadRecord> downloads(2);
  downloads[0].siapath     = "b";
  downloads[0].destination = "/tmp/b";
  downloads[0].filesize    = 10;
  downloads[0].received    = 4;
  downloads[0].start_time  = renter::util::TimePoint(std::chrono::seconds(1700000000) + std::chrono::milliseconds(250));
  downloads[1].siapath     = "a";

  const auto infos = renter::views::ProjectDownloads(downloads);
  assert(infos.size() == 2);
  assert(infos[0].siapath() == "b");
  assert(infos[0].destination() == "/tmp/b");
  assert(infos[0].filesize() == 10);
  assert(infos[0].received() == 4);
  assert(infos[0].start_time().seconds() == 1700000000);
  assert(infos[0].start_time().nanos() == 250000000);
  assert(infos[1].siapath() == "a");

  std::vector<FileRecord> files(1);
  files[0].siapath         = "docs/a.txt";
  files[0].filesize        = 42;
  files[0].available       = true;
  files[0].renewing        = true;
  files[0].redundancy      = 1.5;
  files[0].upload_progress = 100.0;
  files[0].expiration      = 900;

  const auto file_infos = renter::views::ProjectFiles(files);
  assert(file_infos.size() == 1);
  assert(file_infos[0].siapath() == "docs/a.txt");
  assert(file_infos[0].filesize() == 42);
  assert(file_infos[0].available());
  assert(file_infos[0].renewing());
  assert(file_infos[0].redundancy() == 1.5);
  assert(file_infos[0].upload_progress() == 100.0);
  assert(file_infos[0].expiration() == 900);
}

void TestSettingsAndMetrics() {
  renter::model::RenterSettings settings;
  settings.allowance.funds        = *Currency::Parse("1SC");
  settings.allowance.hosts        = 30;
  settings.allowance.period       = 100;
  settings.allowance.renew_window = 50;

  const auto projected = renter::views::ProjectSettings(settings);
  assert(projected.allowance().funds() == "1000000000000000000000000");
  assert(projected.allowance().hosts() == 30);
  assert(projected.allowance().period() == 100);
  assert(projected.allowance().renew_window() == 50);

  renter::model::FinancialMetrics metrics;
  metrics.contract_spending = Currency(1);
  metrics.download_spending = Currency(2);
  metrics.storage_spending  = Currency(3);
  metrics.upload_spending   = Currency(4);
  metrics.unspent           = Currency(5);

  const auto fm = renter::views::ProjectFinancialMetrics(metrics);
  assert(fm.contract_spending() == "1");
  assert(fm.download_spending() == "2");
  assert(fm.storage_spending() == "3");
  assert(fm.upload_spending() == "4");
  assert(fm.unspent() == "5");
}

void TestHostsCopyEveryField() {
  HostRecord host;
  host.net_address              = "host-a:9982";
  host.public_key               = "ed25519:aa";
  host.accepting_contracts      = true;
  host.max_duration             = 144;
  host.contract_price           = Currency(10);
  host.storage_price            = Currency(11);
  host.upload_bandwidth_price   = Currency(12);
  host.download_bandwidth_price = Currency(13);
  host.total_storage            = 1000;
  host.remaining_storage        = 600;
  host.version                  = "1.3.0";

  const auto entries = renter::views::ProjectHosts({host, HostRecord{}});
  assert(entries.size() == 2);
  const auto& e = entries[0];
  assert(e.net_address() == "host-a:9982");
  assert(e.public_key() == "ed25519:aa");
  assert(e.accepting_contracts());
  assert(e.max_duration() == 144);
  assert(e.contract_price() == "10");
  assert(e.storage_price() == "11");
  assert(e.upload_bandwidth_price() == "12");
  assert(e.download_bandwidth_price() == "13");
  assert(e.total_storage() == 1000);
  assert(e.remaining_storage() == 600);
  assert(e.version() == "1.3.0");
  assert(!entries[1].accepting_contracts());
}

} // namespace

int main() {
  TestContractSizeIsDerivedFromRoots();
  TestDownloadsAndFilesKeepOrder();
  TestSettingsAndMetrics();
  TestHostsCopyEveryField();

  std::cout << "renter_control_unit_list_views: pass\n";
  return 0;
}
