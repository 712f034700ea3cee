#include "content_service.hpp"

#include <optional>
#include <stdexcept>

#include "internal/backend/content_facade.hpp"
#include "internal/diagnostics/diagnostics_harness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/preflight/preflight_gate.hpp"

namespace vodbridge::service {

using namespace vodbridge::services::v1;

namespace {

std::optional<std::string> Cursor(const std::string& cursor) {
  if (cursor.empty()) {
    return std::nullopt;
  }
  return cursor;
}

PageResponse ToPageResponse(backend::Fetched<content::v1::RailPage> fetched) {
  PageResponse resp;
  *resp.mutable_page() = std::move(fetched.value);
  resp.set_from_cache(fetched.from_cache);
  return resp;
}

} // namespace

ContentService::ContentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.facade) {
    throw std::invalid_argument("content service requires a facade");
  }
}

void ContentService::EnsureReady() {
  if (ctx_.preflight) {
    ctx_.preflight->EnsureReady();
  }
}

GetHomeRailsResponse ContentService::GetHomeRails(const GetHomeRailsRequest& req) {
  EnsureReady();

  auto fetched = ctx_.facade->GetHomeRails(req.force_refresh());

  GetHomeRailsResponse resp;
  resp.mutable_rails()->Swap(fetched.value.mutable_rails());
  resp.set_from_cache(fetched.from_cache);
  return resp;
}

PageResponse ContentService::GetRail(const GetRailRequest& req) {
  EnsureReady();
  return ToPageResponse(ctx_.facade->GetRail(req.rail_id(), Cursor(req.cursor()), req.limit(), req.force_refresh()));
}

PageResponse ContentService::Search(const SearchRequest& req) {
  EnsureReady();
  return ToPageResponse(ctx_.facade->Search(req.query(), Cursor(req.cursor()), req.limit(), req.force_refresh()));
}

GetPlayableResponse ContentService::GetPlayable(const GetPlayableRequest& req) {
  if (req.id().empty()) {
    throw std::invalid_argument("id is required");
  }
  EnsureReady();

  auto fetched = ctx_.facade->GetPlayable(req.id(), req.force_refresh());

  GetPlayableResponse resp;
  *resp.mutable_playable() = std::move(fetched.value);
  resp.set_from_cache(fetched.from_cache);
  return resp;
}

content::v1::PreflightReport ContentService::CheckReadiness(const CheckReadinessRequest&) {
  if (!ctx_.preflight) {
    content::v1::PreflightReport report;
    report.set_ready(true);
    return report;
  }
  return ctx_.preflight->Evaluate();
}

content::v1::DiagnosticsReport ContentService::RunDiagnostics(const RunDiagnosticsRequest&) {
  if (!ctx_.diagnostics) {
    throw std::invalid_argument("diagnostics are not configured");
  }
  return ctx_.diagnostics->Run();
}

content::v1::BackendDescriptor ContentService::DescribeBackend(const DescribeBackendRequest&) {
  return ctx_.facade->Descriptor();
}

} // namespace vodbridge::service
