#include "internal/backend/strategy_selector.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using vodbridge::backend::AdapterRegistry;
using vodbridge::backend::BackendLocator;
using vodbridge::backend::StrategySelector;
using vodbridge::content::v1::STRATEGY_DIRECT;
using vodbridge::content::v1::STRATEGY_RPC;
using vodbridge::testing::FakeAdapter;
using vodbridge::testing::FakeExtensionRegistry;

std::shared_ptr<BackendLocator> Locator(std::shared_ptr<FakeExtensionRegistry> registry) {
  return std::make_shared<BackendLocator>(registry, std::vector<std::string>{"ext.a", "ext.b"}, "xbmc.python.pluginsource", std::vector<std::string>{});
}

void TestFallsBackToNextStrategy() {
  auto registry = std::make_shared<FakeExtensionRegistry>();
  registry->Install("ext.b");

  std::vector<std::string> tried;
  AdapterRegistry          adapters;
  adapters.Register(STRATEGY_DIRECT, [&tried](const std::string& id) -> std::shared_ptr<vodbridge::backend::ContentAdapter> {
    tried.push_back("direct:" + id);
    throw vodbridge::util::BackendUnavailable("no module");
  });
  adapters.Register(STRATEGY_RPC, [&tried](const std::string& id) {
    tried.push_back("rpc:" + id);
    return std::make_shared<FakeAdapter>(id, STRATEGY_RPC);
  });

  StrategySelector selector(Locator(registry), std::move(adapters));
  assert(!selector.Descriptor().has_value());

  auto adapter = selector.Get();
  assert(adapter->strategy() == STRATEGY_RPC);
  assert(adapter->backend_id() == "ext.b");
  assert((tried == std::vector<std::string>{"direct:ext.b", "rpc:ext.b"}));

  const auto descriptor = selector.Descriptor();
  assert(descriptor.has_value());
  assert(descriptor->candidate_id() == "ext.b");
  assert(descriptor->strategy() == STRATEGY_RPC);
}

void TestSelectionIsMemoized() {
  auto registry = std::make_shared<FakeExtensionRegistry>();
  registry->Install("ext.a");

  int             builds = 0;
  AdapterRegistry adapters;
  adapters.Register(STRATEGY_DIRECT, [&builds](const std::string& id) {
    ++builds;
    return std::make_shared<FakeAdapter>(id, STRATEGY_DIRECT);
  });

  StrategySelector selector(Locator(registry), std::move(adapters));
  auto             first  = selector.Get();
  auto             second = selector.Get();

  assert(first == second);
  assert(builds == 1);
}

void TestFailureIsNotMemoized() {
  auto registry = std::make_shared<FakeExtensionRegistry>();

  AdapterRegistry adapters;
  adapters.Register(STRATEGY_RPC, [](const std::string& id) { return std::make_shared<FakeAdapter>(id, STRATEGY_RPC); });

  StrategySelector selector(Locator(registry), std::move(adapters));

  bool raised = false;
  try {
    selector.Get();
  } catch (const vodbridge::util::BackendUnavailable& e) {
    raised = std::string(e.what()).find("content service unreachable") == 0;
  }
  assert(raised);

  registry->Install("ext.a");
  assert(selector.Get()->backend_id() == "ext.a");
}

void TestAllStrategiesFailingAggregatesReasons() {
  auto registry = std::make_shared<FakeExtensionRegistry>();
  registry->Install("ext.a");

  AdapterRegistry adapters;
  adapters.Register(STRATEGY_DIRECT, [](const std::string&) -> std::shared_ptr<vodbridge::backend::ContentAdapter> {
    throw vodbridge::util::BackendUnavailable("module missing");
  });
  adapters.Register(STRATEGY_RPC, [](const std::string&) -> std::shared_ptr<vodbridge::backend::ContentAdapter> {
    throw vodbridge::util::BackendUnavailable("extension not installed");
  });

  StrategySelector selector(Locator(registry), std::move(adapters));

  std::string message;
  try {
    selector.Get();
  } catch (const vodbridge::util::BackendUnavailable& e) {
    message = e.what();
  }
  assert(message.find("direct: module missing") != std::string::npos);
  assert(message.find("rpc: extension not installed") != std::string::npos);
  assert(!selector.Descriptor().has_value());
}

} // namespace

int main() {
  TestFallsBackToNextStrategy();
  TestSelectionIsMemoized();
  TestFailureIsNotMemoized();
  TestAllStrategiesFailingAggregatesReasons();

  std::cout << "vodbridge_unit_strategy_selector: pass\n";
  return 0;
}
