#pragma once

#include <string>
#include <vector>

#include "internal/engine/model/contract_record.hpp"
#include "internal/engine/model/download_record.hpp"
#include "internal/engine/model/file_record.hpp"
#include "internal/engine/model/host_record.hpp"
#include "internal/engine/model/upload_params.hpp"
#include "internal/model/allowance.hpp"

namespace renter::engine {

/*
  Storage engine abstraction.

  The control surface never negotiates contracts, moves file data or keeps
  state of its own; everything below goes through this interface.

  GUARANTEES REQUIRED FROM IMPLEMENTATIONS:

  - At most one in-flight mutation per catalog path
  - SetSettings is all-or-nothing: readers never observe a partly applied
    allowance
  - Long transfers must not hold a catalog-wide lock for their duration
  - Failures are thrown as util::EngineError

  Catalog paths passed in are already normalized.
*/

class RenterEngine {
 public:
  virtual ~RenterEngine() = default;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual renter::model::RenterSettings Settings() const = 0;

  virtual void SetSettings(const renter::model::RenterSettings& settings) = 0;

  virtual renter::model::FinancialMetrics FinancialMetrics() const = 0;

  // ---------------------------------------------------------------------
  // Read models
  // ---------------------------------------------------------------------

  virtual std::vector<model::ContractRecord> Contracts() const = 0;

  virtual std::vector<model::DownloadRecord> DownloadQueue() const = 0;

  virtual std::vector<model::FileRecord> FileList() const = 0;

  // ---------------------------------------------------------------------
  // Share bundles
  // ---------------------------------------------------------------------

  // Returns the catalog paths added, in bundle order.
  virtual std::vector<std::string> LoadSharedFiles(const std::string& source) = 0;

  virtual std::vector<std::string> LoadSharedFilesAscii(const std::string& ascii) = 0;

  virtual void ShareFiles(const std::vector<std::string>& siapaths, const std::string& destination) = 0;

  virtual std::string ShareFilesAscii(const std::vector<std::string>& siapaths) = 0;

  // ---------------------------------------------------------------------
  // Catalog mutation
  // ---------------------------------------------------------------------

  virtual void RenameFile(const std::string& current_siapath, const std::string& new_siapath) = 0;

  virtual void DeleteFile(const std::string& siapath) = 0;

  virtual void Download(const std::string& siapath, const std::string& destination) = 0;

  virtual void Upload(const model::FileUploadParams& params) = 0;

  // ---------------------------------------------------------------------
  // Host database
  // ---------------------------------------------------------------------

  virtual std::vector<model::HostRecord> ActiveHosts() const = 0;

  virtual std::vector<model::HostRecord> AllHosts() const = 0;
};

} // namespace renter::engine
