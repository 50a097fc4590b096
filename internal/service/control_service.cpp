#include "control_service.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/catalog/path_utils.hpp"
#include "internal/engine/renter_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/views/host_directory.hpp"
#include "internal/views/list_views.hpp"

namespace renter::service {

using namespace renter::control::v1;
using renter::util::EngineCode;
using renter::util::EngineError;
using renter::util::Fault;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  renter::observability::SpanScope span(route);
  auto&                             metrics = renter::observability::Metrics::Instance();

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RENTER_LOG_ERROR("RPC failed", {renter::observability::StringField("route", route),
                                    renter::observability::StringField("error", ex.what()),
                                    renter::observability::IntField(
                                        "elapsed_ms", static_cast<std::int64_t>(renter::util::MillisSince(started_at)))});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

// Runs one engine call and classifies what escapes it. Transfer failures are
// reported as server faults with a prefix; everything else is a client
// fault. Validation errors raised below the engine boundary pass through.
template <typename Fn>
auto CallEngine(Fault fault, std::string_view prefix, Fn&& fn) {
  try {
    return fn();
  } catch (const renter::util::InputValidationError&) {
    throw;
  } catch (const EngineError& e) {
    throw EngineError(e.code(), std::string(prefix) + e.what(), fault);
  } catch (const std::exception& e) {
    throw EngineError(EngineCode::kInternal, std::string(prefix) + e.what(), fault);
  }
}

template <typename Fn>
auto CallEngine(Fn&& fn) {
  return CallEngine(Fault::kClient, "", std::forward<Fn>(fn));
}

std::vector<std::string> NormalizeAll(const google::protobuf::RepeatedPtrField<std::string>& siapaths) {
  std::vector<std::string> out;
  out.reserve(siapaths.size());
  for (const auto& siapath : siapaths) {
    out.push_back(renter::catalog::NormalizeSiaPath(siapath));
  }
  return out;
}

std::optional<std::string> OptionalField(bool has, const std::string& value) {
  if (!has) {
    return std::nullopt;
  }
  return value;
}

} // namespace

ControlService::ControlService(ServiceContext ctx)
    : ctx_(std::move(ctx)), constants_(renter::model::ConstantsFor(ctx_.profile)), validator_(constants_) {
  if (!ctx_.engine) {
    throw std::invalid_argument("control service requires an engine");
  }
}

// ------------------------------------------------------------
// Settings
// ------------------------------------------------------------

GetSettingsResponse ControlService::GetSettings(const GetSettingsRequest&) {
  return ObserveRpc("ControlService.GetSettings", [&] {
    GetSettingsResponse resp;
    *resp.mutable_settings()          = renter::views::ProjectSettings(CallEngine([&] { return ctx_.engine->Settings(); }));
    *resp.mutable_financial_metrics() =
        renter::views::ProjectFinancialMetrics(CallEngine([&] { return ctx_.engine->FinancialMetrics(); }));
    return resp;
  });
}

SetSettingsResponse ControlService::SetSettings(const SetSettingsRequest& req) {
  return ObserveRpc("ControlService.SetSettings", [&] {
    renter::allowance::RawAllowance raw;
    raw.funds        = req.funds();
    raw.hosts        = OptionalField(req.has_hosts(), req.hosts());
    raw.period       = req.period();
    raw.renew_window = OptionalField(req.has_renew_window(), req.renew_window());

    renter::model::RenterSettings settings;
    settings.allowance = validator_.Resolve(raw);

    CallEngine([&] { ctx_.engine->SetSettings(settings); });

    SetSettingsResponse resp;
    *resp.mutable_settings() = renter::views::ProjectSettings(settings);
    return resp;
  });
}

// ------------------------------------------------------------
// Listings
// ------------------------------------------------------------

ListContractsResponse ControlService::ListContracts(const ListContractsRequest&) {
  return ObserveRpc("ControlService.ListContracts", [&] {
    const auto records = CallEngine([&] { return ctx_.engine->Contracts(); });

    ListContractsResponse resp;
    for (auto& contract : renter::views::ProjectContracts(records, constants_.sector_size)) {
      *resp.add_contracts() = std::move(contract);
    }
    return resp;
  });
}

ListDownloadsResponse ControlService::ListDownloads(const ListDownloadsRequest&) {
  return ObserveRpc("ControlService.ListDownloads", [&] {
    const auto records = CallEngine([&] { return ctx_.engine->DownloadQueue(); });

    ListDownloadsResponse resp;
    for (auto& download : renter::views::ProjectDownloads(records)) {
      *resp.add_downloads() = std::move(download);
    }
    return resp;
  });
}

ListFilesResponse ControlService::ListFiles(const ListFilesRequest&) {
  return ObserveRpc("ControlService.ListFiles", [&] {
    const auto records = CallEngine([&] { return ctx_.engine->FileList(); });

    ListFilesResponse resp;
    for (auto& file : renter::views::ProjectFiles(records)) {
      *resp.add_files() = std::move(file);
    }
    return resp;
  });
}

// ------------------------------------------------------------
// Share bundles
// ------------------------------------------------------------

LoadBundleResponse ControlService::LoadBundle(const LoadBundleRequest& req) {
  return ObserveRpc("ControlService.LoadBundle", [&] {
    renter::catalog::RequireAbsolute(req.source(), "bundle source");

    LoadBundleResponse resp;
    for (auto& siapath : CallEngine([&] { return ctx_.engine->LoadSharedFiles(req.source()); })) {
      resp.add_files_added(std::move(siapath));
    }
    return resp;
  });
}

LoadBundleResponse ControlService::LoadBundleText(const LoadBundleTextRequest& req) {
  return ObserveRpc("ControlService.LoadBundleText", [&] {
    LoadBundleResponse resp;
    for (auto& siapath : CallEngine([&] { return ctx_.engine->LoadSharedFilesAscii(req.ascii_bundle()); })) {
      resp.add_files_added(std::move(siapath));
    }
    return resp;
  });
}

void ControlService::ExportBundle(const ExportBundleRequest& req) {
  ObserveRpc("ControlService.ExportBundle", [&] {
    renter::catalog::RequireAbsolute(req.destination(), "bundle destination");
    const auto siapaths = NormalizeAll(req.siapaths());

    CallEngine([&] { ctx_.engine->ShareFiles(siapaths, req.destination()); });
  });
}

ExportBundleTextResponse ControlService::ExportBundleText(const ExportBundleTextRequest& req) {
  return ObserveRpc("ControlService.ExportBundleText", [&] {
    const auto siapaths = NormalizeAll(req.siapaths());

    ExportBundleTextResponse resp;
    resp.set_ascii_bundle(CallEngine([&] { return ctx_.engine->ShareFilesAscii(siapaths); }));
    return resp;
  });
}

// ------------------------------------------------------------
// Catalog mutation
// ------------------------------------------------------------

void ControlService::RenameFile(const RenameFileRequest& req) {
  ObserveRpc("ControlService.RenameFile", [&] {
    const auto from = renter::catalog::NormalizeSiaPath(req.siapath());
    const auto to   = renter::catalog::NormalizeSiaPath(req.new_siapath());

    CallEngine([&] { ctx_.engine->RenameFile(from, to); });
  });
}

void ControlService::DeleteFile(const DeleteFileRequest& req) {
  ObserveRpc("ControlService.DeleteFile", [&] {
    const auto siapath = renter::catalog::NormalizeSiaPath(req.siapath());

    CallEngine([&] { ctx_.engine->DeleteFile(siapath); });
  });
}

void ControlService::DownloadFile(const DownloadFileRequest& req) {
  ObserveRpc("ControlService.DownloadFile", [&] {
    renter::catalog::RequireAbsolute(req.destination(), "download destination");
    const auto siapath = renter::catalog::NormalizeSiaPath(req.siapath());

    CallEngine(Fault::kServer, "download failed: ", [&] { ctx_.engine->Download(siapath, req.destination()); });
  });
}

void ControlService::UploadFile(const UploadFileRequest& req) {
  ObserveRpc("ControlService.UploadFile", [&] {
    renter::catalog::RequireAbsolute(req.source(), "upload source");

    renter::engine::model::FileUploadParams params;
    params.source  = req.source();
    params.siapath = renter::catalog::NormalizeSiaPath(req.siapath());

    CallEngine(Fault::kServer, "upload failed: ", [&] { ctx_.engine->Upload(params); });
  });
}

// ------------------------------------------------------------
// Host discovery
// ------------------------------------------------------------

ListHostsResponse ControlService::ListActiveHosts(const ListActiveHostsRequest& req) {
  return ObserveRpc("ControlService.ListActiveHosts", [&] {
    const auto requested = OptionalField(req.has_num_hosts(), req.num_hosts());
    const auto hosts     = CallEngine([&] { return ctx_.engine->ActiveHosts(); });

    ListHostsResponse resp;
    for (auto& host : renter::views::ProjectHosts(renter::views::HostDirectoryView::Slice(hosts, requested))) {
      *resp.add_hosts() = std::move(host);
    }
    return resp;
  });
}

ListHostsResponse ControlService::ListAllHosts(const ListAllHostsRequest&) {
  return ObserveRpc("ControlService.ListAllHosts", [&] {
    const auto hosts = CallEngine([&] { return ctx_.engine->AllHosts(); });

    ListHostsResponse resp;
    for (auto& host : renter::views::ProjectHosts(hosts)) {
      *resp.add_hosts() = std::move(host);
    }
    return resp;
  });
}

} // namespace renter::service
