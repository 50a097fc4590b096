#include "renter_server.hpp"
#include "grpc_error.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace renter::grpc {

using namespace renter::control::v1;

RenterServer::RenterServer(std::shared_ptr<renter::service::ControlService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RenterServer::GetSettings(::grpc::ServerContext*,
                                         const GetSettingsRequest* req,
                                         GetSettingsResponse* resp) {
  try {
    *resp = service_->GetSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::SetSettings(::grpc::ServerContext*,
                                         const SetSettingsRequest* req,
                                         SetSettingsResponse* resp) {
  try {
    *resp = service_->SetSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ListContracts(::grpc::ServerContext*,
                                           const ListContractsRequest* req,
                                           ListContractsResponse* resp) {
  try {
    *resp = service_->ListContracts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ListDownloads(::grpc::ServerContext*,
                                           const ListDownloadsRequest* req,
                                           ListDownloadsResponse* resp) {
  try {
    *resp = service_->ListDownloads(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ListFiles(::grpc::ServerContext*,
                                       const ListFilesRequest* req,
                                       ListFilesResponse* resp) {
  try {
    *resp = service_->ListFiles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::LoadBundle(::grpc::ServerContext*,
                                        const LoadBundleRequest* req,
                                        LoadBundleResponse* resp) {
  try {
    *resp = service_->LoadBundle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::LoadBundleText(::grpc::ServerContext*,
                                            const LoadBundleTextRequest* req,
                                            LoadBundleResponse* resp) {
  try {
    *resp = service_->LoadBundleText(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ExportBundle(::grpc::ServerContext*,
                                          const ExportBundleRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->ExportBundle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ExportBundleText(::grpc::ServerContext*,
                                              const ExportBundleTextRequest* req,
                                              ExportBundleTextResponse* resp) {
  try {
    *resp = service_->ExportBundleText(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::RenameFile(::grpc::ServerContext*,
                                        const RenameFileRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->RenameFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::DeleteFile(::grpc::ServerContext*,
                                        const DeleteFileRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->DeleteFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::DownloadFile(::grpc::ServerContext*,
                                          const DownloadFileRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->DownloadFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::UploadFile(::grpc::ServerContext*,
                                        const UploadFileRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->UploadFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ListActiveHosts(::grpc::ServerContext*,
                                             const ListActiveHostsRequest* req,
                                             ListHostsResponse* resp) {
  try {
    *resp = service_->ListActiveHosts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RenterServer::ListAllHosts(::grpc::ServerContext*,
                                          const ListAllHostsRequest* req,
                                          ListHostsResponse* resp) {
  try {
    *resp = service_->ListAllHosts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace renter::grpc
