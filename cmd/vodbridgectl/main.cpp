#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "vodbridge/content/v1.hpp"
#include "vodbridge/services/v1/content_service.grpc.pb.h"

using namespace vodbridge::services::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vodbridgectl <addr> home [--refresh]\n"
            << "  vodbridgectl <addr> rail <rail_id> [cursor] [limit]\n"
            << "  vodbridgectl <addr> search <query> [cursor] [limit]\n"
            << "  vodbridgectl <addr> play <id>\n"
            << "  vodbridgectl <addr> ready\n"
            << "  vodbridgectl <addr> diagnostics\n"
            << "  vodbridgectl <addr> backend\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << out;
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "rpc failed (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }
  PrintJson(resp);
  return 0;
}

static uint32_t ParseLimit(const char* value) {
  char*               end    = nullptr;
  const unsigned long parsed = std::strtoul(value, &end, 10);
  if (end == value || *end != '\0') {
    std::cerr << "invalid limit: " << value << "\n";
    std::exit(1);
  }
  return static_cast<uint32_t>(parsed);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ContentService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "home") {
    GetHomeRailsRequest req;
    req.set_force_refresh(argc >= 4 && std::string(argv[3]) == "--refresh");

    GetHomeRailsResponse resp;
    return Report(stub->GetHomeRails(&ctx, req, &resp), resp);
  }

  if (cmd == "rail") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    GetRailRequest req;
    req.set_rail_id(argv[3]);
    if (argc >= 5) req.set_cursor(argv[4]);
    if (argc >= 6) req.set_limit(ParseLimit(argv[5]));

    PageResponse resp;
    return Report(stub->GetRail(&ctx, req, &resp), resp);
  }

  if (cmd == "search") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    SearchRequest req;
    req.set_query(argv[3]);
    if (argc >= 5) req.set_cursor(argv[4]);
    if (argc >= 6) req.set_limit(ParseLimit(argv[5]));

    PageResponse resp;
    return Report(stub->Search(&ctx, req, &resp), resp);
  }

  if (cmd == "play") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    GetPlayableRequest req;
    req.set_id(argv[3]);

    GetPlayableResponse resp;
    return Report(stub->GetPlayable(&ctx, req, &resp), resp);
  }

  if (cmd == "ready") {
    vodbridge::content::v1::PreflightReport resp;
    return Report(stub->CheckReadiness(&ctx, CheckReadinessRequest{}, &resp), resp);
  }

  if (cmd == "diagnostics") {
    vodbridge::content::v1::DiagnosticsReport resp;
    return Report(stub->RunDiagnostics(&ctx, RunDiagnosticsRequest{}, &resp), resp);
  }

  if (cmd == "backend") {
    vodbridge::content::v1::BackendDescriptor resp;
    return Report(stub->DescribeBackend(&ctx, DescribeBackendRequest{}, &resp), resp);
  }

  Usage();
  return 1;
}
