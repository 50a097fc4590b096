#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/engine/renter_engine.hpp"
#include "internal/model/profile.hpp"
#include "renter/control/v1/bundle.pb.h"

namespace renter::engine::memory {

/*
  In-process reference engine.

  Hosts come from configuration and never change. Contracts, the file
  catalog and stored sectors live in memory behind one shared_mutex; file
  and bundle I/O runs outside it.

  Catalog entries are kept in their shareable form (SharedFile) so export
  and import are a straight copy through ShareBundleCodec.
*/
class MemoryRenter final : public RenterEngine {
public:
  MemoryRenter(const renter::runtime::config::MemoryEngineConfig& config, renter::model::Profile profile);

  renter::model::RenterSettings Settings() const override;
  void SetSettings(const renter::model::RenterSettings& settings) override;
  renter::model::FinancialMetrics FinancialMetrics() const override;

  std::vector<model::ContractRecord> Contracts() const override;
  std::vector<model::DownloadRecord> DownloadQueue() const override;
  std::vector<model::FileRecord> FileList() const override;

  std::vector<std::string> LoadSharedFiles(const std::string& source) override;
  std::vector<std::string> LoadSharedFilesAscii(const std::string& ascii) override;
  void ShareFiles(const std::vector<std::string>& siapaths, const std::string& destination) override;
  std::string ShareFilesAscii(const std::vector<std::string>& siapaths) override;

  void RenameFile(const std::string& current_siapath, const std::string& new_siapath) override;
  void DeleteFile(const std::string& siapath) override;
  void Download(const std::string& siapath, const std::string& destination) override;
  void Upload(const model::FileUploadParams& params) override;

  std::vector<model::HostRecord> ActiveHosts() const override;
  std::vector<model::HostRecord> AllHosts() const override;

private:
  struct Spending {
    renter::model::Currency contract;
    renter::model::Currency download;
    renter::model::Currency storage;
    renter::model::Currency upload;
  };

  // All helpers below expect mutex_ to be held by the caller.
  const model::HostRecord* FindHost(const std::string& net_address) const;
  std::unordered_set<std::string> HeldRoots() const;
  std::unordered_map<std::string, const model::ContractRecord*> ContractsById() const;
  renter::control::v1::ShareBundle BuildBundle(const std::vector<std::string>& siapaths) const;
  std::vector<std::string> Import(const renter::control::v1::ShareBundle& bundle);
  void ReleaseUnreferencedSectors(const renter::control::v1::SharedFile& removed);

  const renter::model::ProfileConstants constants_;
  const renter::model::BlockHeight      block_height_;
  const std::vector<model::HostRecord>  hosts_;

  mutable std::shared_mutex mutex_;

  renter::model::RenterSettings                          settings_;
  Spending                                               spending_;
  std::vector<model::ContractRecord>                     contracts_;
  std::map<std::string, renter::control::v1::SharedFile> files_;
  std::unordered_map<std::string, std::string>           sectors_;
  std::vector<model::DownloadRecord>                     downloads_;
};

} // namespace renter::engine::memory
