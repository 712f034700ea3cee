#include "content_server.hpp"
#include "grpc_error.hpp"

namespace vodbridge::grpc {

using namespace vodbridge::services::v1;

namespace {

// Runs one unary call, translating exceptions into a status.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

ContentServer::ContentServer(std::shared_ptr<vodbridge::service::ContentService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ContentServer::GetHomeRails(::grpc::ServerContext*, const GetHomeRailsRequest* req, GetHomeRailsResponse* resp) {
  return Invoke([&] { *resp = service_->GetHomeRails(*req); });
}

::grpc::Status ContentServer::GetRail(::grpc::ServerContext*, const GetRailRequest* req, PageResponse* resp) {
  return Invoke([&] { *resp = service_->GetRail(*req); });
}

::grpc::Status ContentServer::Search(::grpc::ServerContext*, const SearchRequest* req, PageResponse* resp) {
  return Invoke([&] { *resp = service_->Search(*req); });
}

::grpc::Status ContentServer::GetPlayable(::grpc::ServerContext*, const GetPlayableRequest* req, GetPlayableResponse* resp) {
  return Invoke([&] { *resp = service_->GetPlayable(*req); });
}

::grpc::Status ContentServer::CheckReadiness(::grpc::ServerContext*, const CheckReadinessRequest* req, vodbridge::content::v1::PreflightReport* resp) {
  return Invoke([&] { *resp = service_->CheckReadiness(*req); });
}

::grpc::Status ContentServer::RunDiagnostics(::grpc::ServerContext*, const RunDiagnosticsRequest* req, vodbridge::content::v1::DiagnosticsReport* resp) {
  return Invoke([&] { *resp = service_->RunDiagnostics(*req); });
}

::grpc::Status ContentServer::DescribeBackend(::grpc::ServerContext*, const DescribeBackendRequest* req, vodbridge::content::v1::BackendDescriptor* resp) {
  return Invoke([&] { *resp = service_->DescribeBackend(*req); });
}

} // namespace vodbridge::grpc
