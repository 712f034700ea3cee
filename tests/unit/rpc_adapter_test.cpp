#include "internal/backend/rpc_adapter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using vodbridge::backend::RpcAdapter;
using vodbridge::platform::DirectoryEntry;
using vodbridge::testing::FakeExtensionRegistry;
using vodbridge::testing::FakeRpcExecutor;
using vodbridge::testing::ParseJson;
namespace json = vodbridge::util::json;

constexpr const char* kAddon = "plugin.video.amazonvod";

struct Fixture {
  std::shared_ptr<FakeExtensionRegistry> registry = std::make_shared<FakeExtensionRegistry>();
  std::shared_ptr<FakeRpcExecutor>       executor = std::make_shared<FakeRpcExecutor>();

  Fixture() {
    registry->Install(kAddon);
  }

  RpcAdapter Make() {
    return RpcAdapter(kAddon, registry, executor);
  }
};

DirectoryEntry Entry(const std::string& label, const std::string& file, bool folder) {
  DirectoryEntry entry;
  entry.label     = label;
  entry.file      = file;
  entry.is_folder = folder;
  return entry;
}

void TestConstructionRequiresInstalledExtension() {
  auto registry = std::make_shared<FakeExtensionRegistry>();
  auto executor = std::make_shared<FakeRpcExecutor>();

  bool raised = false;
  try {
    RpcAdapter adapter(kAddon, registry, executor);
  } catch (const vodbridge::util::BackendUnavailable&) {
    raised = true;
  }
  assert(raised);
}

void TestEnvelopeDecoding() {
  const auto direct = RpcAdapter::DecodeEnvelope(ParseJson(R"({"result": {"items": []}})"));
  assert(json::IsStruct(direct));

  const auto encoded = RpcAdapter::DecodeEnvelope(ParseJson(R"({"result": "{\"items\": [1]}"})"));
  assert(json::Field(encoded, "items")->list_value().values_size() == 1);

  const auto twice = RpcAdapter::DecodeEnvelope(ParseJson(R"({"result": "\"{\\\"ok\\\": true}\""})"));
  assert(json::IsStruct(twice));
  assert(json::Field(twice, "ok")->bool_value());

  const auto bare = RpcAdapter::DecodeEnvelope(ParseJson(R"({"rails": []})"));
  assert(json::Field(bare, "rails") != nullptr);

  const auto text = RpcAdapter::DecodeEnvelope(ParseJson(R"({"result": "not json"})"));
  assert(text.string_value() == "not json");

  const auto null_error = RpcAdapter::DecodeEnvelope(ParseJson(R"({"error": null, "result": [1]})"));
  assert(json::IsList(null_error));
}

void TestEnvelopeErrorRaises() {
  std::string message;
  try {
    RpcAdapter::DecodeEnvelope(ParseJson(R"({"error": {"code": -32602, "message": "Invalid params"}})"));
  } catch (const vodbridge::util::BackendError& e) {
    message = e.what();
  }
  assert(message == "Invalid params");
}

void TestEncodedErrorEnvelopeRaises() {
  const auto message_of = [](const char* envelope) {
    try {
      RpcAdapter::DecodeEnvelope(ParseJson(envelope));
    } catch (const vodbridge::util::BackendError& e) {
      return std::string(e.what());
    }
    return std::string();
  };

  assert(message_of(R"({"result": "{\"error\": {\"message\": \"session expired\"}}"})") == "session expired");
  assert(message_of(R"("{\"error\": \"geo blocked\"}")") == "geo blocked");

  const auto wrapped = RpcAdapter::DecodeEnvelope(ParseJson(R"("{\"result\": [1, 2]}")"));
  assert(json::IsList(wrapped));
  assert(wrapped.list_value().values_size() == 2);

  Fixture f;
  f.executor->OnAction("home_rails", ParseJson(R"({"result": "{\"error\": {\"message\": \"session expired\"}}"})"));
  f.executor->OnAction("login_state", ParseJson(R"({"result": "{\"error\": \"not signed in\"}"})"));
  auto adapter = f.Make();

  std::string home_error;
  try {
    adapter.HomeRails();
  } catch (const vodbridge::util::BackendError& e) {
    home_error = e.what();
  }
  assert(home_error == "session expired");
  assert(!adapter.LoginState().has_value());
}

void TestActionsCarryParameters() {
  Fixture f;
  f.executor->OnAction("search", ParseJson(R"({"result": {"items": []}})"));

  auto adapter = f.Make();
  adapter.Search("the boys", std::string("c1"), 30);

  assert(f.executor->last_extension == kAddon);
  assert(f.executor->last_params.at("action") == "search");
  assert(f.executor->last_params.at("query") == "the boys");
  assert(f.executor->last_params.at("cursor") == "c1");
  assert(f.executor->last_params.at("limit") == "30");

  f.executor->OnAction("playable", ParseJson(R"({"result": {"url": "u"}})"));
  adapter.Playable("B1");
  assert(f.executor->last_params.at("id") == "B1");
}

void TestRailIsEmulatedThroughListing() {
  Fixture f;

  auto movie = Entry("Movie", "plugin://plugin.video.amazonvod/?action=play&asin=B1&mediatype=movie", false);
  movie.plot           = "plot";
  movie.art            = ParseJson(R"({"poster": "p.jpg"})");
  movie.stream_details = ParseJson(R"({"video": [{"duration": 6000}]})");

  auto show   = Entry("Show", "plugin://plugin.video.amazonvod/?action=browse&id=S1", true);
  show.resume = ParseJson(R"({"position": 0, "total": 1200})");

  auto more = Entry("Next page", "plugin://plugin.video.amazonvod/?action=rail&rail_id=r1&cursor=c2", true);

  const auto uri = RpcAdapter::RailUri(kAddon, "r1", std::nullopt, 20);
  assert(uri == "plugin://plugin.video.amazonvod/?action=rail&rail_id=r1&limit=20");
  f.executor->OnListing(uri, {movie, show, more});

  const auto page  = f.Make().Rail("r1", std::nullopt, 20);
  const auto items = json::Field(page, "items")->list_value();
  assert(items.values_size() == 2);

  const auto& first = items.values(0).struct_value().fields();
  assert(first.at("id").string_value() == "B1");
  assert(first.at("title").string_value() == "Movie");
  assert(first.at("is_playable").bool_value());
  assert(first.at("duration_seconds").number_value() == 6000);
  assert(first.at("mediatype").string_value() == "movie");
  assert(first.at("art").struct_value().fields().at("poster").string_value() == "p.jpg");

  const auto& second = items.values(1).struct_value().fields();
  assert(second.at("id").string_value() == "S1");
  assert(!second.at("is_playable").bool_value());
  assert(second.at("duration_seconds").number_value() == 1200);

  assert(json::Field(page, "next_cursor")->string_value() == "c2");
}

void TestRailUriEncodesArguments() {
  assert(RpcAdapter::RailUri("x", "a b", std::string("c/1"), 0) == "plugin://x/?action=rail&rail_id=a%20b&cursor=c%2F1");
}

void TestStatusQueriesReadAsUnknownOnError() {
  Fixture f;
  f.executor->OnAction("login_state", ParseJson(R"({"result": {"loggedIn": false}})"));
  f.executor->OnAction("region", ParseJson(R"({"result": "de"})"));

  auto adapter = f.Make();
  assert(adapter.LoginState() == false);
  assert(adapter.Region() == "de");
  // no drm_status action scripted: the host answers with an error envelope
  assert(!adapter.DrmReady().has_value());
}

void TestTransportFailureIsUnavailable() {
  Fixture f;
  auto    adapter = f.Make();
  f.executor->FailWith("connection refused");

  bool raised = false;
  try {
    adapter.HomeRails();
  } catch (const vodbridge::util::BackendUnavailable& e) {
    raised = std::string(e.what()).find("content service unreachable") == 0;
  }
  assert(raised);
}

} // namespace

int main() {
  TestConstructionRequiresInstalledExtension();
  TestEnvelopeDecoding();
  TestEnvelopeErrorRaises();
  TestEncodedErrorEnvelopeRaises();
  TestActionsCarryParameters();
  TestRailIsEmulatedThroughListing();
  TestRailUriEncodesArguments();
  TestStatusQueriesReadAsUnknownOnError();
  TestTransportFailureIsUnavailable();

  std::cout << "vodbridge_unit_rpc_adapter: pass\n";
  return 0;
}
