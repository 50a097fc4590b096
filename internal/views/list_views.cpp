#include "list_views.hpp"

#include "internal/util/time.hpp"

namespace renter::views {

using namespace renter::control::v1;

// ------------------------------------------------------------
// Contracts
// ------------------------------------------------------------

Contract ProjectContract(const engine::model::ContractRecord& record, std::uint64_t sector_size) {
  Contract out;
  out.set_id(record.id);
  out.set_end_height(record.end_height);
  out.set_net_address(record.net_address);
  out.set_renter_funds(record.renter_funds.ToString());
  out.set_size(sector_size * static_cast<std::uint64_t>(record.merkle_roots.size()));
  return out;
}

std::vector<Contract> ProjectContracts(const std::vector<engine::model::ContractRecord>& records,
                                       std::uint64_t sector_size) {
  std::vector<Contract> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ProjectContract(record, sector_size));
  }
  return out;
}

// ------------------------------------------------------------
// Downloads and files
// ------------------------------------------------------------

std::vector<DownloadInfo> ProjectDownloads(const std::vector<engine::model::DownloadRecord>& records) {
  std::vector<DownloadInfo> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    DownloadInfo info;
    info.set_siapath(record.siapath);
    info.set_destination(record.destination);
    info.set_filesize(record.filesize);
    info.set_received(record.received);
    *info.mutable_start_time() = renter::util::ToProto(record.start_time);
    out.push_back(std::move(info));
  }
  return out;
}

std::vector<FileInfo> ProjectFiles(const std::vector<engine::model::FileRecord>& records) {
  std::vector<FileInfo> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    FileInfo info;
    info.set_siapath(record.siapath);
    info.set_filesize(record.filesize);
    info.set_available(record.available);
    info.set_renewing(record.renewing);
    info.set_redundancy(record.redundancy);
    info.set_upload_progress(record.upload_progress);
    info.set_expiration(record.expiration);
    out.push_back(std::move(info));
  }
  return out;
}

// ------------------------------------------------------------
// Settings
// ------------------------------------------------------------

RenterSettings ProjectSettings(const renter::model::RenterSettings& settings) {
  RenterSettings out;
  auto*          allowance = out.mutable_allowance();
  allowance->set_funds(settings.allowance.funds.ToString());
  allowance->set_hosts(settings.allowance.hosts);
  allowance->set_period(settings.allowance.period);
  allowance->set_renew_window(settings.allowance.renew_window);
  return out;
}

FinancialMetrics ProjectFinancialMetrics(const renter::model::FinancialMetrics& metrics) {
  FinancialMetrics out;
  out.set_contract_spending(metrics.contract_spending.ToString());
  out.set_download_spending(metrics.download_spending.ToString());
  out.set_storage_spending(metrics.storage_spending.ToString());
  out.set_upload_spending(metrics.upload_spending.ToString());
  out.set_unspent(metrics.unspent.ToString());
  return out;
}

// ------------------------------------------------------------
// Hosts
// ------------------------------------------------------------

HostEntry ProjectHost(const engine::model::HostRecord& record) {
  HostEntry out;
  out.set_net_address(record.net_address);
  out.set_public_key(record.public_key);
  out.set_accepting_contracts(record.accepting_contracts);
  out.set_max_duration(record.max_duration);
  out.set_contract_price(record.contract_price.ToString());
  out.set_storage_price(record.storage_price.ToString());
  out.set_upload_bandwidth_price(record.upload_bandwidth_price.ToString());
  out.set_download_bandwidth_price(record.download_bandwidth_price.ToString());
  out.set_total_storage(record.total_storage);
  out.set_remaining_storage(record.remaining_storage);
  out.set_version(record.version);
  return out;
}

std::vector<HostEntry> ProjectHosts(const std::vector<engine::model::HostRecord>& records) {
  std::vector<HostEntry> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ProjectHost(record));
  }
  return out;
}

} // namespace renter::views
