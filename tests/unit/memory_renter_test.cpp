#include "internal/engine/memory/memory_renter.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using renter::engine::memory::MemoryRenter;
using renter::engine::model::FileUploadParams;
using renter::model::Currency;
using renter::model::Profile;
using renter::util::EngineCode;
using renter::util::EngineError;

std::filesystem::path TempDir() {
  const auto dir = std::filesystem::temp_directory_path() / "renter_control_memory_renter_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::string WriteLocal(const std::string& name, const std::string& content) {
  const auto    path = TempDir() / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return path.string();
}

std::string ReadLocal(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

renter::runtime::config::MemoryEngineConfig EngineConfig() {
  renter::runtime::config::MemoryEngineConfig config;
  config.set_block_height(10);

  auto* a = config.add_hosts();
  a->set_net_address("host-a:9982");
  a->set_accepting_contracts(true);
  a->set_upload_bandwidth_price("1");
  a->set_storage_price("2");
  a->set_download_bandwidth_price("3");

  auto* b = config.add_hosts();
  b->set_net_address("host-b:9982");
  b->set_accepting_contracts(true);

  auto* c = config.add_hosts();
  c->set_net_address("host-c:9982");
  c->set_accepting_contracts(false);
  return config;
}

renter::model::RenterSettings Settings(std::uint64_t funds, std::uint64_t hosts, std::uint64_t period,
                                       std::uint64_t renew_window) {
  renter::model::RenterSettings settings;
  settings.allowance.funds        = Currency(funds);
  settings.allowance.hosts        = hosts;
  settings.allowance.period       = period;
  settings.allowance.renew_window = renew_window;
  return settings;
}

std::optional<EngineCode> EngineFailure(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const EngineError& e) {
    return e.code();
  }
  return std::nullopt;
}

// 5000 bytes: two 4 KiB sectors under the testing profile.
std::string Payload() {
  std::string data;
  for (int i = 0; i < 5000; ++i) data.push_back(static_cast<char>('a' + i % 26));
  return data;
}

void TestHostsComeFromConfig() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);

  const auto active = engine.ActiveHosts();
  assert(active.size() == 2);
  assert(active[0].net_address == "host-a:9982");
  assert(active[0].storage_price == Currency(2));
  assert(engine.AllHosts().size() == 3);
}

void TestInvalidHostConfigThrows() {
  auto config = EngineConfig();
  config.mutable_hosts(0)->set_storage_price("cheap");

  bool threw = false;
  try {
    MemoryRenter engine(config, Profile::kTesting);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSetSettingsRejectsInconsistentAllowance() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);

  assert(EngineFailure([&] { engine.SetSettings(Settings(1000, 0, 100, 50)); }) == EngineCode::kRejected);
  assert(EngineFailure([&] { engine.SetSettings(Settings(1000, 2, 0, 0)); }) == EngineCode::kRejected);
  assert(EngineFailure([&] { engine.SetSettings(Settings(1000, 2, 100, 100)); }) == EngineCode::kRejected);

  // Nothing applied.
  assert(engine.Settings().allowance.hosts == 0);
  assert(engine.Contracts().empty());
}

void TestSetSettingsFormsContracts() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1001, 5, 100, 50));

  assert(engine.Settings() == Settings(1001, 5, 100, 50));

  const auto contracts = engine.Contracts();
  assert(contracts.size() == 2);
  assert(contracts[0].net_address == "host-a:9982");
  assert(contracts[1].net_address == "host-b:9982");
  assert(contracts[0].renter_funds == Currency(500));
  assert(contracts[0].end_height == 110);
  assert(contracts[0].id.size() == 64);
  assert(contracts[0].id != contracts[1].id);

  const auto metrics = engine.FinancialMetrics();
  assert(metrics.contract_spending == Currency(1000));
  assert(metrics.unspent == Currency(1));
}

void TestUploadRequiresContracts() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  const auto   source = WriteLocal("no_contracts.bin", "data");

  assert(EngineFailure([&] { engine.Upload(FileUploadParams{source, "a"}); }) == EngineCode::kRejected);
  assert(engine.FileList().empty());
}

void TestUploadDownloadAndListing() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(100000, 2, 100, 50));

  const auto source = WriteLocal("upload.bin", Payload());
  engine.Upload(FileUploadParams{source, "docs/a.bin"});

  assert(EngineFailure([&] { engine.Upload(FileUploadParams{source, "docs/a.bin"}); }) == EngineCode::kPathExists);
  assert(EngineFailure([&] { engine.Upload(FileUploadParams{(TempDir() / "missing").string(), "x"}); }) ==
         EngineCode::kIoFailure);

  const auto files = engine.FileList();
  assert(files.size() == 1);
  assert(files[0].siapath == "docs/a.bin");
  assert(files[0].filesize == 5000);
  assert(files[0].available);
  assert(files[0].renewing);
  assert(files[0].redundancy == 2.0);
  assert(files[0].upload_progress == 100.0);
  assert(files[0].expiration == 110);

  for (const auto& contract : engine.Contracts()) {
    assert(contract.merkle_roots.size() == 2);
  }

  const auto destination = (TempDir() / "download.bin").string();
  engine.Download("docs/a.bin", destination);
  assert(ReadLocal(destination) == Payload());

  const auto queue = engine.DownloadQueue();
  assert(queue.size() == 1);
  assert(queue[0].siapath == "docs/a.bin");
  assert(queue[0].destination == destination);
  assert(queue[0].received == 5000);

  const auto metrics = engine.FinancialMetrics();
  assert(metrics.upload_spending == Currency(2));
  assert(metrics.storage_spending == Currency(4));
  assert(metrics.download_spending == Currency(6));
}

void TestDownloadFailures() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 2, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("dl_fail.bin", "hello"), "a"});

  assert(EngineFailure([&] { engine.Download("missing", (TempDir() / "x").string()); }) ==
         EngineCode::kPathNotFound);
  assert(EngineFailure([&] { engine.Download("a", "/nonexistent-renter-dir/out.bin"); }) == EngineCode::kIoFailure);
  assert(engine.DownloadQueue().empty());
}

void TestEmptyFileIsAvailable() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 1, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("empty.bin", ""), "empty"});

  const auto files = engine.FileList();
  assert(files.size() == 1);
  assert(files[0].available);

  const auto destination = (TempDir() / "empty.out").string();
  engine.Download("empty", destination);
  assert(ReadLocal(destination).empty());
}

void TestRenameAndDelete() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 2, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("rename.bin", Payload()), "a"});
  engine.Upload(FileUploadParams{WriteLocal("other.bin", "x"), "other"});

  engine.RenameFile("a", "b");
  assert(EngineFailure([&] { engine.RenameFile("a", "c"); }) == EngineCode::kPathNotFound);
  assert(EngineFailure([&] { engine.RenameFile("b", "other"); }) == EngineCode::kPathExists);

  const auto files = engine.FileList();
  assert(files.size() == 2);
  assert(files[0].siapath == "b");
  assert(files[0].available);

  engine.DeleteFile("b");
  assert(EngineFailure([&] { engine.DeleteFile("b"); }) == EngineCode::kPathNotFound);
  assert(engine.FileList().size() == 1);

  // Only the sector of "other" is still stored.
  for (const auto& contract : engine.Contracts()) {
    assert(contract.merkle_roots.size() == 1);
  }
}

void TestResettingKeepsExistingContracts() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 2, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("keep.bin", Payload()), "a"});
  const auto before = engine.Contracts();

  engine.SetSettings(Settings(4000, 2, 200, 50));
  const auto after = engine.Contracts();
  assert(after.size() == 2);
  assert(after[0].id == before[0].id);
  assert(after[0].merkle_roots == before[0].merkle_roots);
  assert(after[0].renter_funds == Currency(2000));
  assert(after[0].end_height == 210);
  assert(engine.FileList()[0].available);

  // Shrinking to one host drops the second contract.
  engine.SetSettings(Settings(4000, 1, 200, 50));
  assert(engine.Contracts().size() == 1);
  const auto files = engine.FileList();
  assert(files[0].available);
  assert(files[0].redundancy == 1.0);

  // Every sector is pushed to each contract, and the first accepting host is
  // always re-formed, so the dropped contract held no sector of its own.
  const auto survivor = engine.Contracts();
  assert(survivor[0].id == before[0].id);
  assert(survivor[0].merkle_roots == before[1].merkle_roots);

  const auto out = (TempDir() / "keep.out").string();
  engine.Download("a", out);
  assert(ReadLocal(out) == Payload());
}

void TestShareAndImport() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 2, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("share_a.bin", Payload()), "docs/a.txt"});
  engine.Upload(FileUploadParams{WriteLocal("share_b.bin", "b"), "docs/b.txt"});

  assert(EngineFailure([&] { engine.ShareFilesAscii({}); }) == EngineCode::kRejected);
  assert(EngineFailure([&] { engine.ShareFilesAscii({"docs/missing"}); }) == EngineCode::kPathNotFound);

  const auto ascii = engine.ShareFilesAscii({"docs/b.txt", "docs/a.txt", "docs/b.txt"});

  MemoryRenter other(EngineConfig(), Profile::kTesting);
  const auto   added = other.LoadSharedFilesAscii(ascii);
  assert(added.size() == 2);
  assert(added[0] == "docs/b.txt");
  assert(added[1] == "docs/a.txt");

  // The importing renter holds none of the sectors.
  const auto files = other.FileList();
  assert(files.size() == 2);
  assert(!files[0].available);
  assert(files[0].filesize == 5000);

  // Importing over an existing entry replaces it.
  assert(engine.LoadSharedFilesAscii(ascii).size() == 2);
  assert(engine.FileList().size() == 2);
  assert(engine.FileList()[0].available);

  assert(EngineFailure([&] { engine.LoadSharedFilesAscii("garbage"); }) == EngineCode::kBundleCorrupt);
}

void TestShareToFile() {
  MemoryRenter engine(EngineConfig(), Profile::kTesting);
  engine.SetSettings(Settings(1000, 2, 100, 50));
  engine.Upload(FileUploadParams{WriteLocal("share_file.bin", "content"), "x"});

  const auto path = (TempDir() / "x.sia").string();
  engine.ShareFiles({"x"}, path);

  MemoryRenter other(EngineConfig(), Profile::kTesting);
  const auto   added = other.LoadSharedFiles(path);
  assert(added.size() == 1);
  assert(added[0] == "x");
}

} // namespace

int main() {
  TestHostsComeFromConfig();
  TestInvalidHostConfigThrows();
  TestSetSettingsRejectsInconsistentAllowance();
  TestSetSettingsFormsContracts();
  TestUploadRequiresContracts();
  TestUploadDownloadAndListing();
  TestDownloadFailures();
  TestEmptyFileIsAvailable();
  TestRenameAndDelete();
  TestResettingKeepsExistingContracts();
  TestShareAndImport();
  TestShareToFile();

  std::cout << "renter_control_unit_memory_renter: pass\n";
  return 0;
}
