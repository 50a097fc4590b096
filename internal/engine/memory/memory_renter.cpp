#include "memory_renter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>

#include "internal/bundle/share_bundle_codec.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace renter::engine::memory {

using renter::control::v1::ShareBundle;
using renter::control::v1::SharedFile;
using renter::model::Currency;
using renter::util::EngineCode;
using renter::util::EngineError;

namespace {

Currency PriceFromConfig(const std::string& raw, const std::string& host, const char* field) {
  if (raw.empty()) {
    return Currency();
  }
  auto price = Currency::Parse(raw);
  if (!price) {
    throw std::invalid_argument("host " + host + ": invalid " + field + " '" + raw + "'");
  }
  return *price;
}

std::vector<model::HostRecord> LoadHosts(const renter::runtime::config::MemoryEngineConfig& config) {
  std::vector<model::HostRecord> hosts;
  std::set<std::string>          seen;
  hosts.reserve(config.hosts_size());

  for (const auto& h : config.hosts()) {
    if (h.net_address().empty()) {
      throw std::invalid_argument("engine.memory.hosts entry without net_address");
    }
    if (!seen.insert(h.net_address()).second) {
      throw std::invalid_argument("duplicate host " + h.net_address());
    }

    model::HostRecord r;
    r.net_address              = h.net_address();
    r.public_key               = h.public_key();
    r.accepting_contracts      = h.accepting_contracts();
    r.max_duration             = h.max_duration();
    r.contract_price           = PriceFromConfig(h.contract_price(), h.net_address(), "contract_price");
    r.storage_price            = PriceFromConfig(h.storage_price(), h.net_address(), "storage_price");
    r.upload_bandwidth_price   = PriceFromConfig(h.upload_bandwidth_price(), h.net_address(), "upload_bandwidth_price");
    r.download_bandwidth_price = PriceFromConfig(h.download_bandwidth_price(), h.net_address(), "download_bandwidth_price");
    r.total_storage            = h.total_storage();
    r.remaining_storage        = h.remaining_storage();
    r.version                  = h.version();
    hosts.push_back(std::move(r));
  }
  return hosts;
}

std::uint64_t ChunkCount(const SharedFile& file) {
  if (file.filesize() == 0) {
    return 0;
  }
  if (file.piece_size() == 0) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return (file.filesize() + file.piece_size() - 1) / file.piece_size();
}

std::string ReadLocalFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw EngineError(EngineCode::kIoFailure, "cannot open '" + path + "' for reading");
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw EngineError(EngineCode::kIoFailure, "failed reading '" + path + "'");
  }
  return data;
}

std::uint32_t LocalMode(const std::string& path) {
  std::error_code ec;
  auto            status = std::filesystem::status(path, ec);
  if (ec) {
    return 0644;
  }
  return static_cast<std::uint32_t>(status.permissions() & std::filesystem::perms::mask);
}

} // namespace

MemoryRenter::MemoryRenter(const renter::runtime::config::MemoryEngineConfig& config, renter::model::Profile profile)
    : constants_(renter::model::ConstantsFor(profile)), block_height_(config.block_height()), hosts_(LoadHosts(config)) {}

// ------------------------------------------------------------
// Lock-held helpers
// ------------------------------------------------------------

const model::HostRecord* MemoryRenter::FindHost(const std::string& net_address) const {
  for (const auto& host : hosts_) {
    if (host.net_address == net_address) return &host;
  }
  return nullptr;
}

std::unordered_set<std::string> MemoryRenter::HeldRoots() const {
  std::unordered_set<std::string> held;
  for (const auto& contract : contracts_) {
    for (const auto& root : contract.merkle_roots) {
      if (sectors_.contains(root)) held.insert(root);
    }
  }
  return held;
}

std::unordered_map<std::string, const model::ContractRecord*> MemoryRenter::ContractsById() const {
  std::unordered_map<std::string, const model::ContractRecord*> by_id;
  for (const auto& contract : contracts_) {
    by_id.emplace(contract.id, &contract);
  }
  return by_id;
}

ShareBundle MemoryRenter::BuildBundle(const std::vector<std::string>& siapaths) const {
  if (siapaths.empty()) {
    throw EngineError(EngineCode::kRejected, "no files requested for sharing");
  }

  ShareBundle           bundle;
  std::set<std::string> added;
  bundle.set_format_version(bundle::ShareBundleCodec::kFormatVersion);

  for (const auto& siapath : siapaths) {
    if (!added.insert(siapath).second) continue;

    auto it = files_.find(siapath);
    if (it == files_.end()) {
      throw EngineError(EngineCode::kPathNotFound, "no file known by the path '" + siapath + "'");
    }
    *bundle.add_files() = it->second;
  }
  return bundle;
}

std::vector<std::string> MemoryRenter::Import(const ShareBundle& bundle) {
  std::vector<std::string> added;
  added.reserve(bundle.files_size());

  // Bundle siapaths are catalog keys already; the codec has rejected
  // duplicates among them.
  for (const auto& file : bundle.files()) {
    auto it = files_.find(file.siapath());
    if (it != files_.end()) {
      SharedFile replaced = std::move(it->second);
      it->second          = file;
      ReleaseUnreferencedSectors(replaced);
    } else {
      files_.emplace(file.siapath(), file);
    }
    added.push_back(file.siapath());
  }
  return added;
}

void MemoryRenter::ReleaseUnreferencedSectors(const SharedFile& removed) {
  std::unordered_set<std::string> candidates;
  for (const auto& contract : removed.contracts()) {
    for (const auto& piece : contract.pieces()) {
      candidates.insert(piece.merkle_root());
    }
  }
  for (const auto& [_, file] : files_) {
    for (const auto& contract : file.contracts()) {
      for (const auto& piece : contract.pieces()) {
        candidates.erase(piece.merkle_root());
      }
    }
  }
  if (candidates.empty()) return;

  for (const auto& root : candidates) {
    sectors_.erase(root);
  }
  for (auto& contract : contracts_) {
    auto& roots = contract.merkle_roots;
    roots.erase(std::remove_if(roots.begin(), roots.end(), [&](const std::string& r) { return candidates.contains(r); }),
                roots.end());
  }
}

// ------------------------------------------------------------
// Settings
// ------------------------------------------------------------

renter::model::RenterSettings MemoryRenter::Settings() const {
  std::shared_lock lock(mutex_);
  return settings_;
}

void MemoryRenter::SetSettings(const renter::model::RenterSettings& settings) {
  const auto& allowance = settings.allowance;
  if (allowance.hosts == 0) {
    throw EngineError(EngineCode::kRejected, "allowance must use at least one host");
  }
  if (allowance.period == 0) {
    throw EngineError(EngineCode::kRejected, "allowance period must be positive");
  }
  if (allowance.renew_window >= allowance.period) {
    throw EngineError(EngineCode::kRejected, "renew window (" + std::to_string(allowance.renew_window) +
                                                 ") must be smaller than the period (" +
                                                 std::to_string(allowance.period) + ")");
  }

  std::unique_lock lock(mutex_);

  std::vector<const model::HostRecord*> chosen;
  for (const auto& host : hosts_) {
    if (chosen.size() >= allowance.hosts) break;
    if (host.accepting_contracts) chosen.push_back(&host);
  }

  std::vector<model::ContractRecord> formed;
  Currency                           allocated;
  if (!chosen.empty()) {
    const auto per_contract = allowance.funds.DivideBy(chosen.size());
    for (const auto* host : chosen) {
      model::ContractRecord contract;
      auto existing = std::find_if(contracts_.begin(), contracts_.end(),
                                   [&](const model::ContractRecord& c) { return c.net_address == host->net_address; });
      if (existing != contracts_.end()) {
        contract.id           = existing->id;
        contract.merkle_roots = std::move(existing->merkle_roots);
      } else {
        contract.id = renter::util::GenerateHexId();
      }
      contract.net_address  = host->net_address;
      contract.end_height   = block_height_ + allowance.period;
      contract.renter_funds = per_contract;
      allocated             = allocated + per_contract;
      formed.push_back(std::move(contract));
    }
  }

  settings_          = settings;
  contracts_         = std::move(formed);
  spending_.contract = allocated;
}

renter::model::FinancialMetrics MemoryRenter::FinancialMetrics() const {
  std::shared_lock lock(mutex_);

  renter::model::FinancialMetrics metrics;
  metrics.contract_spending = spending_.contract;
  metrics.download_spending = spending_.download;
  metrics.storage_spending  = spending_.storage;
  metrics.upload_spending   = spending_.upload;

  const auto spent = spending_.contract + spending_.download + spending_.storage + spending_.upload;
  metrics.unspent  = settings_.allowance.funds.SaturatingSub(spent);
  return metrics;
}

// ------------------------------------------------------------
// Read models
// ------------------------------------------------------------

std::vector<model::ContractRecord> MemoryRenter::Contracts() const {
  std::shared_lock lock(mutex_);
  return contracts_;
}

std::vector<model::DownloadRecord> MemoryRenter::DownloadQueue() const {
  std::shared_lock lock(mutex_);
  return downloads_;
}

std::vector<model::FileRecord> MemoryRenter::FileList() const {
  std::shared_lock lock(mutex_);

  const auto held  = HeldRoots();
  const auto by_id = ContractsById();
  const bool renewing = settings_.allowance.hosts > 0;

  std::vector<model::FileRecord> out;
  out.reserve(files_.size());
  for (const auto& [siapath, file] : files_) {
    model::FileRecord record;
    record.siapath         = siapath;
    record.filesize        = file.filesize();
    record.renewing        = renewing;
    record.upload_progress = 100.0;

    const auto     chunks = ChunkCount(file);
    std::set<std::uint64_t> recoverable;
    std::uint64_t  holding = 0;
    renter::model::BlockHeight expiration = 0;

    for (const auto& shared : file.contracts()) {
      auto contract = by_id.find(shared.contract_id());
      if (contract == by_id.end()) continue;

      bool holds_all = true;
      for (const auto& piece : shared.pieces()) {
        if (held.contains(piece.merkle_root())) {
          recoverable.insert(piece.chunk());
        } else {
          holds_all = false;
        }
      }
      if (!holds_all) continue;

      ++holding;
      const auto end = contract->second->end_height;
      expiration     = holding == 1 ? end : std::min(expiration, end);
    }

    record.available  = chunks != std::numeric_limits<std::uint64_t>::max() && recoverable.size() >= chunks;
    record.redundancy = static_cast<double>(holding) / file.erasure_code().data_pieces();
    record.expiration = expiration;
    out.push_back(std::move(record));
  }
  return out;
}

// ------------------------------------------------------------
// Share bundles
// ------------------------------------------------------------

std::vector<std::string> MemoryRenter::LoadSharedFiles(const std::string& source) {
  auto bundle = bundle::ShareBundleCodec::ReadFile(source);

  std::unique_lock lock(mutex_);
  return Import(bundle);
}

std::vector<std::string> MemoryRenter::LoadSharedFilesAscii(const std::string& ascii) {
  auto bundle = bundle::ShareBundleCodec::DecodeText(ascii);

  std::unique_lock lock(mutex_);
  return Import(bundle);
}

void MemoryRenter::ShareFiles(const std::vector<std::string>& siapaths, const std::string& destination) {
  ShareBundle bundle;
  {
    std::shared_lock lock(mutex_);
    bundle = BuildBundle(siapaths);
  }
  bundle::ShareBundleCodec::WriteFile(bundle, destination);
}

std::string MemoryRenter::ShareFilesAscii(const std::vector<std::string>& siapaths) {
  ShareBundle bundle;
  {
    std::shared_lock lock(mutex_);
    bundle = BuildBundle(siapaths);
  }
  return bundle::ShareBundleCodec::EncodeText(bundle);
}

// ------------------------------------------------------------
// Catalog mutation
// ------------------------------------------------------------

void MemoryRenter::RenameFile(const std::string& current_siapath, const std::string& new_siapath) {
  if (new_siapath.empty()) {
    throw EngineError(EngineCode::kRejected, "new siapath must not be empty");
  }

  std::unique_lock lock(mutex_);

  auto it = files_.find(current_siapath);
  if (it == files_.end()) {
    throw EngineError(EngineCode::kPathNotFound, "no file known by the path '" + current_siapath + "'");
  }
  if (files_.contains(new_siapath)) {
    throw EngineError(EngineCode::kPathExists, "a file already exists at '" + new_siapath + "'");
  }

  auto node = files_.extract(it);
  node.key() = new_siapath;
  node.mapped().set_siapath(new_siapath);
  files_.insert(std::move(node));
}

void MemoryRenter::DeleteFile(const std::string& siapath) {
  std::unique_lock lock(mutex_);

  auto it = files_.find(siapath);
  if (it == files_.end()) {
    throw EngineError(EngineCode::kPathNotFound, "no file known by the path '" + siapath + "'");
  }
  SharedFile removed = std::move(it->second);
  files_.erase(it);
  ReleaseUnreferencedSectors(removed);
}

void MemoryRenter::Download(const std::string& siapath, const std::string& destination) {
  const auto started_at = renter::util::Now();

  std::string   data;
  Currency      cost;
  std::uint64_t filesize = 0;
  {
    std::shared_lock lock(mutex_);

    auto it = files_.find(siapath);
    if (it == files_.end()) {
      throw EngineError(EngineCode::kPathNotFound, "no file known by the path '" + siapath + "'");
    }
    const auto& file   = it->second;
    const auto  chunks = ChunkCount(file);
    if (chunks == std::numeric_limits<std::uint64_t>::max()) {
      throw EngineError(EngineCode::kUnavailable, "'" + siapath + "' has no piece size");
    }

    const auto by_id = ContractsById();
    filesize         = file.filesize();
    data.reserve(filesize);

    for (std::uint64_t chunk = 0; chunk < chunks; ++chunk) {
      const std::string* sector = nullptr;
      const model::ContractRecord* source = nullptr;

      for (const auto& shared : file.contracts()) {
        auto contract = by_id.find(shared.contract_id());
        if (contract == by_id.end()) continue;
        const auto& roots = contract->second->merkle_roots;

        for (const auto& piece : shared.pieces()) {
          if (piece.chunk() != chunk) continue;
          if (std::find(roots.begin(), roots.end(), piece.merkle_root()) == roots.end()) continue;
          auto stored = sectors_.find(piece.merkle_root());
          if (stored == sectors_.end()) continue;
          sector = &stored->second;
          source = contract->second;
          break;
        }
        if (sector != nullptr) break;
      }

      if (sector == nullptr) {
        throw EngineError(EngineCode::kUnavailable,
                          "chunk " + std::to_string(chunk) + " of '" + siapath + "' is not held by any contract");
      }
      data.append(*sector);
      if (const auto* host = FindHost(source->net_address)) {
        cost = cost + host->download_bandwidth_price;
      }
    }
    data.resize(std::min<std::uint64_t>(data.size(), filesize));
  }

  {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw EngineError(EngineCode::kIoFailure, "cannot open '" + destination + "' for writing");
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
      throw EngineError(EngineCode::kIoFailure, "failed writing '" + destination + "'");
    }
  }

  std::unique_lock lock(mutex_);
  spending_.download = spending_.download + cost;
  downloads_.push_back(model::DownloadRecord{siapath, destination, filesize, data.size(), started_at});
  renter::observability::Metrics::Instance().AddTransferredBytes("download", data.size());
}

void MemoryRenter::Upload(const model::FileUploadParams& params) {
  if (params.siapath.empty()) {
    throw EngineError(EngineCode::kRejected, "siapath must not be empty");
  }

  const auto data = ReadLocalFile(params.source);
  const auto mode = LocalMode(params.source);

  std::unique_lock lock(mutex_);

  if (files_.contains(params.siapath)) {
    throw EngineError(EngineCode::kPathExists, "a file already exists at '" + params.siapath + "'");
  }
  if (contracts_.empty()) {
    throw EngineError(EngineCode::kRejected, "no contracts to upload to; set an allowance first");
  }

  const auto sector_size = constants_.sector_size;
  const auto key         = renter::util::GenerateHash();

  SharedFile file;
  file.set_siapath(params.siapath);
  file.set_filesize(data.size());
  file.set_master_key(reinterpret_cast<const char*>(key.data()), key.size());
  file.mutable_erasure_code()->set_data_pieces(1);
  file.mutable_erasure_code()->set_parity_pieces(static_cast<std::uint32_t>(contracts_.size() - 1));
  file.set_piece_size(sector_size);
  file.set_mode(mode);

  for (const auto& contract : contracts_) {
    auto* shared = file.add_contracts();
    shared->set_contract_id(contract.id);
    shared->set_net_address(contract.net_address);
    shared->set_end_height(contract.end_height);
  }

  const std::uint64_t chunks = (data.size() + sector_size - 1) / sector_size;
  for (std::uint64_t chunk = 0; chunk < chunks; ++chunk) {
    const auto root = renter::util::GenerateHexId();
    sectors_.emplace(root, data.substr(chunk * sector_size, sector_size));

    for (std::size_t i = 0; i < contracts_.size(); ++i) {
      contracts_[i].merkle_roots.push_back(root);

      auto* piece = file.mutable_contracts(static_cast<int>(i))->add_pieces();
      piece->set_chunk(chunk);
      piece->set_piece(static_cast<std::uint32_t>(i));
      piece->set_merkle_root(root);

      if (const auto* host = FindHost(contracts_[i].net_address)) {
        spending_.upload  = spending_.upload + host->upload_bandwidth_price;
        spending_.storage = spending_.storage + host->storage_price;
      }
    }
  }

  files_.emplace(params.siapath, std::move(file));
  renter::observability::Metrics::Instance().AddTransferredBytes("upload", data.size());
}

// ------------------------------------------------------------
// Host database
// ------------------------------------------------------------

std::vector<model::HostRecord> MemoryRenter::ActiveHosts() const {
  std::vector<model::HostRecord> active;
  for (const auto& host : hosts_) {
    if (host.accepting_contracts) active.push_back(host);
  }
  return active;
}

std::vector<model::HostRecord> MemoryRenter::AllHosts() const {
  return hosts_;
}

} // namespace renter::engine::memory
