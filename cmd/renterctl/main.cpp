#include <grpcpp/grpcpp.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "renter/control/v1/renter_service.grpc.pb.h"

using namespace renter::control::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  renterctl <addr> settings\n"
            << "  renterctl <addr> set-settings <funds> <period> [hosts] [renew_window]\n"
            << "  renterctl <addr> contracts\n"
            << "  renterctl <addr> downloads\n"
            << "  renterctl <addr> files\n"
            << "  renterctl <addr> load <bundle_path>\n"
            << "  renterctl <addr> load-text <ascii_bundle>\n"
            << "  renterctl <addr> export <siapath[,siapath...]> <destination>\n"
            << "  renterctl <addr> export-text <siapath[,siapath...]>\n"
            << "  renterctl <addr> rename <siapath> <new_siapath>\n"
            << "  renterctl <addr> delete <siapath>\n"
            << "  renterctl <addr> download <siapath> <destination>\n"
            << "  renterctl <addr> upload <source> <siapath>\n"
            << "  renterctl <addr> hosts [num_hosts]\n"
            << "  renterctl <addr> all-hosts\n";
}

static std::vector<std::string> SplitPaths(const std::string& list) {
  std::vector<std::string> out;
  std::stringstream        in(list);
  std::string              item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintHosts(const ListHostsResponse& resp) {
  for (const auto& h : resp.hosts()) {
    std::cout << h.net_address() << " accepting=" << (h.accepting_contracts() ? "true" : "false")
              << " storage_price=" << h.storage_price() << " remaining=" << h.remaining_storage() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RenterControlService::NewStub(channel);

  grpc::ClientContext     ctx;
  google::protobuf::Empty empty;

  // ------------------------------------------------------------

  if (cmd == "settings") {
    GetSettingsResponse resp;
    auto status = stub->GetSettings(&ctx, GetSettingsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    const auto& a = resp.settings().allowance();
    const auto& m = resp.financial_metrics();
    std::cout << "funds=" << a.funds() << " hosts=" << a.hosts() << " period=" << a.period()
              << " renew_window=" << a.renew_window() << "\n";
    std::cout << "contract_spending=" << m.contract_spending() << " download_spending=" << m.download_spending()
              << " storage_spending=" << m.storage_spending() << " upload_spending=" << m.upload_spending()
              << " unspent=" << m.unspent() << "\n";
    return 0;
  }

  if (cmd == "set-settings") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    SetSettingsRequest req;
    req.set_funds(argv[3]);
    req.set_period(argv[4]);
    if (argc >= 6) req.set_hosts(argv[5]);
    if (argc >= 7) req.set_renew_window(argv[6]);

    SetSettingsResponse resp;
    auto status = stub->SetSettings(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& a = resp.settings().allowance();
    std::cout << "funds=" << a.funds() << " hosts=" << a.hosts() << " period=" << a.period()
              << " renew_window=" << a.renew_window() << "\n";
    return 0;
  }

  if (cmd == "contracts") {
    ListContractsResponse resp;
    auto status = stub->ListContracts(&ctx, ListContractsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& c : resp.contracts()) {
      std::cout << c.id() << " " << c.net_address() << " end_height=" << c.end_height()
                << " renter_funds=" << c.renter_funds() << " size=" << c.size() << "\n";
    }
    return 0;
  }

  if (cmd == "downloads") {
    ListDownloadsResponse resp;
    auto status = stub->ListDownloads(&ctx, ListDownloadsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& d : resp.downloads()) {
      std::cout << d.siapath() << " -> " << d.destination() << " " << d.received() << "/" << d.filesize() << "\n";
    }
    return 0;
  }

  if (cmd == "files") {
    ListFilesResponse resp;
    auto status = stub->ListFiles(&ctx, ListFilesRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& f : resp.files()) {
      std::cout << f.siapath() << " size=" << f.filesize() << " available=" << (f.available() ? "true" : "false")
                << " redundancy=" << f.redundancy() << " expiration=" << f.expiration() << "\n";
    }
    return 0;
  }

  if (cmd == "load" || cmd == "load-text") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    LoadBundleResponse resp;
    grpc::Status       status;
    if (cmd == "load") {
      LoadBundleRequest req;
      req.set_source(argv[3]);
      status = stub->LoadBundle(&ctx, req, &resp);
    } else {
      LoadBundleTextRequest req;
      req.set_ascii_bundle(argv[3]);
      status = stub->LoadBundleText(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    for (const auto& siapath : resp.files_added()) {
      std::cout << siapath << "\n";
    }
    return 0;
  }

  if (cmd == "export") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ExportBundleRequest req;
    for (const auto& siapath : SplitPaths(argv[3])) req.add_siapaths(siapath);
    req.set_destination(argv[4]);

    auto status = stub->ExportBundle(&ctx, req, &empty);
    if (!status.ok()) return Fail(status);

    std::cout << "exported\n";
    return 0;
  }

  if (cmd == "export-text") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ExportBundleTextRequest req;
    for (const auto& siapath : SplitPaths(argv[3])) req.add_siapaths(siapath);

    ExportBundleTextResponse resp;
    auto status = stub->ExportBundleText(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.ascii_bundle() << "\n";
    return 0;
  }

  if (cmd == "rename") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RenameFileRequest req;
    req.set_siapath(argv[3]);
    req.set_new_siapath(argv[4]);

    auto status = stub->RenameFile(&ctx, req, &empty);
    if (!status.ok()) return Fail(status);

    std::cout << "renamed\n";
    return 0;
  }

  if (cmd == "delete") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    DeleteFileRequest req;
    req.set_siapath(argv[3]);

    auto status = stub->DeleteFile(&ctx, req, &empty);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "download") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    DownloadFileRequest req;
    req.set_siapath(argv[3]);
    req.set_destination(argv[4]);

    auto status = stub->DownloadFile(&ctx, req, &empty);
    if (!status.ok()) return Fail(status);

    std::cout << "downloaded\n";
    return 0;
  }

  if (cmd == "upload") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    UploadFileRequest req;
    req.set_source(argv[3]);
    req.set_siapath(argv[4]);

    auto status = stub->UploadFile(&ctx, req, &empty);
    if (!status.ok()) return Fail(status);

    std::cout << "uploaded\n";
    return 0;
  }

  if (cmd == "hosts") {
    ListActiveHostsRequest req;
    if (argc >= 4) req.set_num_hosts(argv[3]);

    ListHostsResponse resp;
    auto status = stub->ListActiveHosts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintHosts(resp);
    return 0;
  }

  if (cmd == "all-hosts") {
    ListHostsResponse resp;
    auto status = stub->ListAllHosts(&ctx, ListAllHostsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    PrintHosts(resp);
    return 0;
  }

  Usage();
  return 1;
}
