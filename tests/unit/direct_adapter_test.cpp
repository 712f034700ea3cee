#include "internal/backend/direct_adapter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using vodbridge::backend::DirectAdapter;
using vodbridge::testing::FakeExtensionRegistry;
using vodbridge::testing::FakeModule;
using vodbridge::testing::FakeModuleLoader;
using vodbridge::testing::FakeProviderObject;
using vodbridge::testing::ParseJson;
namespace json = vodbridge::util::json;

constexpr const char* kAddon = "plugin.video.amazon-test";

DirectAdapter::Options MakeOptions() {
  DirectAdapter::Options options;
  options.module_names = {"resources.lib.backend", "resources.lib.api"};
  options.class_names  = {"PrimeVideo", "Provider"};
  options.probe_table  = vodbridge::backend::DefaultProbeTable();
  options.root_rail_id = "root";
  return options;
}

struct Fixture {
  std::shared_ptr<FakeExtensionRegistry> registry = std::make_shared<FakeExtensionRegistry>();
  std::shared_ptr<FakeModuleLoader>      loader   = std::make_shared<FakeModuleLoader>();

  Fixture() {
    registry->Install(kAddon, true, std::string("/addons/") + kAddon);
  }

  std::shared_ptr<FakeProviderObject> AddObject(const std::string& module_name, const std::string& class_name) {
    auto module = std::make_shared<FakeModule>(module_name);
    auto object = std::make_shared<FakeProviderObject>();
    module->AddClass(class_name, object);
    loader->AddModule(module);
    return object;
  }
};

std::string UnavailableMessage(Fixture& f) {
  try {
    DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  } catch (const vodbridge::util::BackendUnavailable& e) {
    return e.what();
  }
  return {};
}

void TestBindsFirstUsableModuleAndClass() {
  Fixture f;
  auto    incomplete = f.AddObject("resources.lib.backend", "PrimeVideo");
  incomplete->Define("search", ParseJson("[]"));

  auto usable = f.AddObject("resources.lib.api", "Provider");
  usable->Define("get_rail", ParseJson("[]"));
  usable->Define("get_playable", ParseJson(R"({"url": "u"})"));

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  assert(adapter.bound_name() == "resources.lib.api.Provider");
  assert(adapter.strategy() == vodbridge::content::v1::STRATEGY_DIRECT);
  assert(f.loader->search_paths.size() == 1);
  assert(f.loader->search_paths.front() == std::string("/addons/") + kAddon);
}

void TestUnavailableListsEveryAttempt() {
  Fixture f;
  f.loader->Break("resources.lib.backend");
  auto object = f.AddObject("resources.lib.api", "PrimeVideo");
  object->Define("search", ParseJson("[]"));

  const auto message = UnavailableMessage(f);
  assert(message.find("resources.lib.backend: cannot load") != std::string::npos);
  assert(message.find("resources.lib.api.PrimeVideo: lacks rail or playback method") != std::string::npos);
}

void TestPositionalCallWithLimit() {
  Fixture f;
  auto    object = f.AddObject("resources.lib.backend", "PrimeVideo");
  object->Define("get_rail_items", ParseJson(R"({"items": []})"));
  object->Define("get_playable", ParseJson("{}"));

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  adapter.Rail("r1", std::string("c2"), 20);

  assert(object->positional_calls["get_rail_items"] == 1);
  assert(object->keyword_calls["get_rail_items"] == 0);
  assert(object->last_positional.size() == 3);
  assert(object->last_positional[0].string_value() == "r1");
  assert(object->last_positional[1].string_value() == "c2");
  assert(object->last_positional[2].number_value() == 20);
}

void TestSignatureMismatchRetriesWithKeywords() {
  Fixture f;
  auto    object = f.AddObject("resources.lib.backend", "PrimeVideo");
  object->Define("get_rail", ParseJson(R"({"items": []})"));
  object->Define("GetStream", ParseJson("{}"));
  object->KeywordOnly("get_rail");
  object->KeywordOnly("GetStream");

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  adapter.Rail("r1", std::nullopt, 0);

  assert(object->positional_calls["get_rail"] == 1);
  assert(object->keyword_calls["get_rail"] == 1);
  const auto& fields = object->last_keywords.fields();
  assert(fields.at("rail_id").string_value() == "r1");
  assert(json::IsNull(fields.at("cursor")));
  assert(fields.count("limit") == 0);

  adapter.Playable("B1");
  assert(object->last_keywords.fields().at("asin").string_value() == "B1");
}

void TestBothShapesRejectedIsBackendError() {
  Fixture f;
  auto    object = f.AddObject("resources.lib.backend", "PrimeVideo");
  object->Define("get_rail", ParseJson("[]"));
  object->Define("get_playable", ParseJson("{}"));
  object->RejectAllShapes("get_playable");

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());

  bool raised = false;
  try {
    adapter.Playable("B1");
  } catch (const vodbridge::util::BackendError& e) {
    raised = std::string(e.what()).find("get_playable") != std::string::npos;
  }
  assert(raised);
}

void TestHomeFallsBackToRootRail() {
  Fixture f;
  auto    object = f.AddObject("resources.lib.backend", "PrimeVideo");
  object->Define("Browse", [](const std::vector<json::Value>& positional, const json::Struct&) {
    return positional.empty() ? json::NullValue() : ParseJson(R"([{"id": ")" + positional[0].string_value() + R"(", "title": "Root"}])");
  });
  object->Define("playback", ParseJson("{}"));

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  const auto    home = adapter.HomeRails();

  assert(json::IsList(home));
  assert(home.list_value().values(0).struct_value().fields().at("id").string_value() == "root");
}

void TestOptionalCapabilitiesReadAsUnknown() {
  Fixture f;
  auto    object = f.AddObject("resources.lib.backend", "PrimeVideo");
  object->Define("home_rails", ParseJson("[]"));
  object->Define("playback", ParseJson("{}"));
  object->Define("is_drm_ready", ParseJson("false"));

  DirectAdapter adapter(kAddon, f.registry, f.loader, MakeOptions());
  assert(!adapter.LoginState().has_value());
  assert(!adapter.Region().has_value());
  assert(adapter.DrmReady() == false);

  bool raised = false;
  try {
    adapter.Search("q", std::nullopt, 0);
  } catch (const vodbridge::util::BackendError&) {
    raised = true;
  }
  assert(raised);
}

} // namespace

int main() {
  TestBindsFirstUsableModuleAndClass();
  TestUnavailableListsEveryAttempt();
  TestPositionalCallWithLimit();
  TestSignatureMismatchRetriesWithKeywords();
  TestBothShapesRejectedIsBackendError();
  TestHomeFallsBackToRootRail();
  TestOptionalCapabilitiesReadAsUnknown();

  std::cout << "vodbridge_unit_direct_adapter: pass\n";
  return 0;
}
