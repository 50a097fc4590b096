#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "renter/control/v1/renter_service.grpc.pb.h"
#include "internal/service/control_service.hpp"

namespace renter::grpc {

class RenterServer final : public renter::control::v1::RenterControlService::Service {
public:
  explicit RenterServer(std::shared_ptr<renter::service::ControlService> svc);

  ::grpc::Status GetSettings(::grpc::ServerContext*,
                             const renter::control::v1::GetSettingsRequest*,
                             renter::control::v1::GetSettingsResponse*) override;

  ::grpc::Status SetSettings(::grpc::ServerContext*,
                             const renter::control::v1::SetSettingsRequest*,
                             renter::control::v1::SetSettingsResponse*) override;

  ::grpc::Status ListContracts(::grpc::ServerContext*,
                               const renter::control::v1::ListContractsRequest*,
                               renter::control::v1::ListContractsResponse*) override;

  ::grpc::Status ListDownloads(::grpc::ServerContext*,
                               const renter::control::v1::ListDownloadsRequest*,
                               renter::control::v1::ListDownloadsResponse*) override;

  ::grpc::Status ListFiles(::grpc::ServerContext*,
                           const renter::control::v1::ListFilesRequest*,
                           renter::control::v1::ListFilesResponse*) override;

  ::grpc::Status LoadBundle(::grpc::ServerContext*,
                            const renter::control::v1::LoadBundleRequest*,
                            renter::control::v1::LoadBundleResponse*) override;

  ::grpc::Status LoadBundleText(::grpc::ServerContext*,
                                const renter::control::v1::LoadBundleTextRequest*,
                                renter::control::v1::LoadBundleResponse*) override;

  ::grpc::Status ExportBundle(::grpc::ServerContext*,
                              const renter::control::v1::ExportBundleRequest*,
                              google::protobuf::Empty*) override;

  ::grpc::Status ExportBundleText(::grpc::ServerContext*,
                                  const renter::control::v1::ExportBundleTextRequest*,
                                  renter::control::v1::ExportBundleTextResponse*) override;

  ::grpc::Status RenameFile(::grpc::ServerContext*,
                            const renter::control::v1::RenameFileRequest*,
                            google::protobuf::Empty*) override;

  ::grpc::Status DeleteFile(::grpc::ServerContext*,
                            const renter::control::v1::DeleteFileRequest*,
                            google::protobuf::Empty*) override;

  ::grpc::Status DownloadFile(::grpc::ServerContext*,
                              const renter::control::v1::DownloadFileRequest*,
                              google::protobuf::Empty*) override;

  ::grpc::Status UploadFile(::grpc::ServerContext*,
                            const renter::control::v1::UploadFileRequest*,
                            google::protobuf::Empty*) override;

  ::grpc::Status ListActiveHosts(::grpc::ServerContext*,
                                 const renter::control::v1::ListActiveHostsRequest*,
                                 renter::control::v1::ListHostsResponse*) override;

  ::grpc::Status ListAllHosts(::grpc::ServerContext*,
                              const renter::control::v1::ListAllHostsRequest*,
                              renter::control::v1::ListHostsResponse*) override;

private:
  std::shared_ptr<renter::service::ControlService> service_;
};

}
