#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/content_service.hpp"
#include "vodbridge/services/v1/content_service.grpc.pb.h"

namespace vodbridge::grpc {

class ContentServer final : public vodbridge::services::v1::ContentService::Service {
public:
  explicit ContentServer(std::shared_ptr<vodbridge::service::ContentService> svc);

  ::grpc::Status GetHomeRails(::grpc::ServerContext*,
                              const vodbridge::services::v1::GetHomeRailsRequest*,
                              vodbridge::services::v1::GetHomeRailsResponse*) override;

  ::grpc::Status GetRail(::grpc::ServerContext*,
                         const vodbridge::services::v1::GetRailRequest*,
                         vodbridge::services::v1::PageResponse*) override;

  ::grpc::Status Search(::grpc::ServerContext*,
                        const vodbridge::services::v1::SearchRequest*,
                        vodbridge::services::v1::PageResponse*) override;

  ::grpc::Status GetPlayable(::grpc::ServerContext*,
                             const vodbridge::services::v1::GetPlayableRequest*,
                             vodbridge::services::v1::GetPlayableResponse*) override;

  ::grpc::Status CheckReadiness(::grpc::ServerContext*,
                                const vodbridge::services::v1::CheckReadinessRequest*,
                                vodbridge::content::v1::PreflightReport*) override;

  ::grpc::Status RunDiagnostics(::grpc::ServerContext*,
                                const vodbridge::services::v1::RunDiagnosticsRequest*,
                                vodbridge::content::v1::DiagnosticsReport*) override;

  ::grpc::Status DescribeBackend(::grpc::ServerContext*,
                                 const vodbridge::services::v1::DescribeBackendRequest*,
                                 vodbridge::content::v1::BackendDescriptor*) override;

private:
  std::shared_ptr<vodbridge::service::ContentService> service_;
};

} // namespace vodbridge::grpc
