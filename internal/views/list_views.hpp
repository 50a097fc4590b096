#pragma once

#include <cstdint>
#include <vector>

#include "internal/engine/model/contract_record.hpp"
#include "internal/engine/model/download_record.hpp"
#include "internal/engine/model/file_record.hpp"
#include "internal/engine/model/host_record.hpp"
#include "internal/model/allowance.hpp"
#include "renter/control/v1/types.pb.h"

namespace renter::views {

/*
  Stateless projections of engine records into public messages.

  No filtering, sorting or caching: output order mirrors input order.
*/

renter::control::v1::Contract ProjectContract(const engine::model::ContractRecord& record, std::uint64_t sector_size);

std::vector<renter::control::v1::Contract> ProjectContracts(const std::vector<engine::model::ContractRecord>& records,
                                                            std::uint64_t sector_size);

std::vector<renter::control::v1::DownloadInfo> ProjectDownloads(
    const std::vector<engine::model::DownloadRecord>& records);

std::vector<renter::control::v1::FileInfo> ProjectFiles(const std::vector<engine::model::FileRecord>& records);

renter::control::v1::RenterSettings ProjectSettings(const renter::model::RenterSettings& settings);

renter::control::v1::FinancialMetrics ProjectFinancialMetrics(const renter::model::FinancialMetrics& metrics);

renter::control::v1::HostEntry ProjectHost(const engine::model::HostRecord& record);

std::vector<renter::control::v1::HostEntry> ProjectHosts(const std::vector<engine::model::HostRecord>& records);

} // namespace renter::views
