#pragma once

#include "renter/control/v1.hpp"
#include "internal/allowance/settings_validator.hpp"
#include "service_context.hpp"

namespace renter::service {

/*
  The renter control surface.

  Parses and validates caller input, calls the engine and projects the
  result. Holds no mutable state of its own. Failures are thrown as
  util::InputValidationError (before the engine is reached) or
  util::EngineError with a fault class.
*/
class ControlService {
public:
  explicit ControlService(ServiceContext ctx);

  renter::control::v1::GetSettingsResponse
  GetSettings(const renter::control::v1::GetSettingsRequest& req);

  renter::control::v1::SetSettingsResponse
  SetSettings(const renter::control::v1::SetSettingsRequest& req);

  renter::control::v1::ListContractsResponse
  ListContracts(const renter::control::v1::ListContractsRequest& req);

  renter::control::v1::ListDownloadsResponse
  ListDownloads(const renter::control::v1::ListDownloadsRequest& req);

  renter::control::v1::ListFilesResponse
  ListFiles(const renter::control::v1::ListFilesRequest& req);

  renter::control::v1::LoadBundleResponse
  LoadBundle(const renter::control::v1::LoadBundleRequest& req);

  renter::control::v1::LoadBundleResponse
  LoadBundleText(const renter::control::v1::LoadBundleTextRequest& req);

  void ExportBundle(const renter::control::v1::ExportBundleRequest& req);

  renter::control::v1::ExportBundleTextResponse
  ExportBundleText(const renter::control::v1::ExportBundleTextRequest& req);

  void RenameFile(const renter::control::v1::RenameFileRequest& req);

  void DeleteFile(const renter::control::v1::DeleteFileRequest& req);

  void DownloadFile(const renter::control::v1::DownloadFileRequest& req);

  void UploadFile(const renter::control::v1::UploadFileRequest& req);

  renter::control::v1::ListHostsResponse
  ListActiveHosts(const renter::control::v1::ListActiveHostsRequest& req);

  renter::control::v1::ListHostsResponse
  ListAllHosts(const renter::control::v1::ListAllHostsRequest& req);

private:
  ServiceContext                       ctx_;
  renter::model::ProfileConstants      constants_;
  renter::allowance::SettingsValidator validator_;
};

}
