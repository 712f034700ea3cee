#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/backend/content_facade.hpp"
#include "internal/grpc/content_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/preflight/preflight_gate.hpp"
#include "internal/service/content_service.hpp"
#include "internal/service/service_context.hpp"
#include "tests/support/fakes.hpp"

namespace {

using vodbridge::testing::FakeAdapter;
using vodbridge::testing::FakeExtensionRegistry;
using vodbridge::testing::FakeSessionStore;
using vodbridge::testing::MakeTempDir;
using vodbridge::testing::ParseJson;
using vodbridge::testing::SelectorFor;

struct Fixture {
  explicit Fixture(const std::string& name) {
    adapter           = std::make_shared<FakeAdapter>();
    adapter->home     = ParseJson(R"([{"id": "r1", "title": "Top"}])");
    adapter->playable = ParseJson(R"({"license_key": "only a key"})");
    registry          = std::make_shared<FakeExtensionRegistry>();
    registry->Install("inputstream.adaptive");

    auto cache = std::make_shared<vodbridge::cache::TtlCache>(MakeTempDir(name));

    vodbridge::service::ServiceContext ctx;
    ctx.facade    = std::make_shared<vodbridge::backend::ContentFacade>(SelectorFor(adapter), cache, vodbridge::backend::ContentFacade::Options{});
    ctx.preflight = std::make_shared<vodbridge::preflight::PreflightGate>(ctx.facade, registry, std::make_shared<FakeSessionStore>(),
                                                                          vodbridge::preflight::PreflightGate::Options{});
    server = std::make_unique<vodbridge::grpc::ContentServer>(std::make_shared<vodbridge::service::ContentService>(ctx));
  }

  std::shared_ptr<FakeAdapter>                    adapter;
  std::shared_ptr<FakeExtensionRegistry>          registry;
  std::unique_ptr<vodbridge::grpc::ContentServer> server;
};

void TestExceptionMapping() {
  using vodbridge::grpc::ToStatus;
  assert(ToStatus(vodbridge::util::BackendUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(vodbridge::util::TransportError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(vodbridge::util::PreflightError({})).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(vodbridge::util::BackendError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestHomeRailsReturnsOk() {
  Fixture f("grpc_ok");

  vodbridge::services::v1::GetHomeRailsRequest  req;
  vodbridge::services::v1::GetHomeRailsResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = f.server->GetHomeRails(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.rails_size() == 1);
}

void TestEmptyPlayableIdReturnsInvalidArgument() {
  Fixture f("grpc_invalid");

  vodbridge::services::v1::GetPlayableRequest  req;
  vodbridge::services::v1::GetPlayableResponse resp;
  ::grpc::ServerContext                        grpc_ctx;

  const auto status = f.server->GetPlayable(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestMissingStreamUrlReturnsInternal() {
  Fixture f("grpc_internal");

  vodbridge::services::v1::GetPlayableRequest req;
  req.set_id("B1");
  vodbridge::services::v1::GetPlayableResponse resp;
  ::grpc::ServerContext                        grpc_ctx;

  const auto status = f.server->GetPlayable(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestNotLoggedInReturnsFailedPrecondition() {
  Fixture f("grpc_precondition");
  f.adapter->logged_in = false;

  vodbridge::services::v1::GetRailRequest req;
  req.set_rail_id("r1");
  vodbridge::services::v1::PageResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = f.server->GetRail(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_message() == "not-ready");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestHomeRailsReturnsOk();
  TestEmptyPlayableIdReturnsInvalidArgument();
  TestMissingStreamUrlReturnsInternal();
  TestNotLoggedInReturnsFailedPrecondition();

  std::cout << "vodbridge_unit_grpc_status: pass\n";
  return 0;
}
