#pragma once

#include "service_context.hpp"
#include "vodbridge/content/v1.hpp"
#include "vodbridge/services/v1/content_service.pb.h"

namespace vodbridge::service {

/*
  Request/response layer over the facade. Every content call passes the
  preflight gate first.
*/
class ContentService {
public:
  explicit ContentService(ServiceContext ctx);

  vodbridge::services::v1::GetHomeRailsResponse
  GetHomeRails(const vodbridge::services::v1::GetHomeRailsRequest& req);

  vodbridge::services::v1::PageResponse
  GetRail(const vodbridge::services::v1::GetRailRequest& req);

  vodbridge::services::v1::PageResponse
  Search(const vodbridge::services::v1::SearchRequest& req);

  vodbridge::services::v1::GetPlayableResponse
  GetPlayable(const vodbridge::services::v1::GetPlayableRequest& req);

  vodbridge::content::v1::PreflightReport
  CheckReadiness(const vodbridge::services::v1::CheckReadinessRequest& req);

  vodbridge::content::v1::DiagnosticsReport
  RunDiagnostics(const vodbridge::services::v1::RunDiagnosticsRequest& req);

  vodbridge::content::v1::BackendDescriptor
  DescribeBackend(const vodbridge::services::v1::DescribeBackendRequest& req);

private:
  void EnsureReady();

  ServiceContext ctx_;
};

} // namespace vodbridge::service
