#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/backend/backend_locator.hpp"
#include "internal/backend/capability_probe.hpp"
#include "internal/backend/direct_adapter.hpp"
#include "internal/backend/rpc_adapter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/platform/dl/dl_module_loader.hpp"
#include "internal/platform/jsonrpc/json_rpc_client.hpp"
#include "internal/platform/jsonrpc/jsonrpc_executor.hpp"
#include "internal/platform/jsonrpc/jsonrpc_registry.hpp"
#include "internal/service/service_context.hpp"

namespace vodbridge::factory {

using vodbridge::runtime::config::RuntimeConfig;

namespace {

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return {field.begin(), field.end()};
}

backend::AdapterRegistry BuildAdapterRegistry(const RuntimeConfig& config, const Platform& platform) {
  backend::AdapterRegistry registry;

  backend::DirectAdapter::Options direct_options;
  direct_options.module_names = ToVector(config.direct().module_names());
  direct_options.class_names  = ToVector(config.direct().class_names());
  direct_options.probe_table  = backend::ProbeTableFromConfig(config.direct().methods());
  direct_options.root_rail_id = config.content().root_rail_id();

  for (const auto& name : config.backend().strategies()) {
    const auto strategy = backend::ParseStrategy(name);
    if (!strategy) {
      throw std::runtime_error("Invalid configuration: unknown backend strategy '" + name + "'");
    }

    switch (*strategy) {
      case content::v1::STRATEGY_DIRECT:
        registry.Register(*strategy, [direct_options, extensions = platform.registry, loader = platform.loader](const std::string& id) {
          return std::make_shared<backend::DirectAdapter>(id, extensions, loader, direct_options);
        });
        break;

      case content::v1::STRATEGY_RPC:
        registry.Register(*strategy, [extensions = platform.registry, executor = platform.executor](const std::string& id) {
          return std::make_shared<backend::RpcAdapter>(id, extensions, executor);
        });
        break;

      default:
        break;
    }
  }

  return registry;
}

} // namespace

Platform BuildPlatform(const RuntimeConfig& config) {
  auto client = std::make_shared<platform::jsonrpc::JsonRpcClient>(config.host());

  Platform platform;
  platform.registry = std::make_shared<platform::jsonrpc::JsonRpcExtensionRegistry>(client);
  platform.executor = std::make_shared<platform::jsonrpc::JsonRpcExecutor>(client, config.host().action_method());
  platform.loader   = std::make_shared<platform::dl::DlModuleLoader>();
  platform.sessions = std::make_shared<platform::FileSessionStore>(config.preflight().session_path());
  return platform;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, Platform platform) {
  if (!platform.registry || !platform.executor || !platform.loader) {
    throw std::invalid_argument("platform is incomplete");
  }

  Application app;

  // ------------------------------------------------------------------
  // Cache
  // ------------------------------------------------------------------
  app.cache = std::make_shared<cache::TtlCache>(config.cache().root_path());

  // ------------------------------------------------------------------
  // Backend resolution
  // ------------------------------------------------------------------
  auto locator = std::make_shared<backend::BackendLocator>(platform.registry,
                                                           ToVector(config.backend().candidate_ids()),
                                                           config.backend().category(),
                                                           ToVector(config.backend().id_prefixes()));

  app.selector = std::make_shared<backend::StrategySelector>(locator, BuildAdapterRegistry(config, platform));

  backend::ContentFacade::Options facade_options;
  facade_options.cache_enabled        = config.cache().enabled();
  facade_options.ttl_seconds          = config.cache().ttl_seconds();
  facade_options.playable_ttl_seconds = config.cache().playable_ttl_seconds();
  facade_options.rail_limit           = config.content().rail_limit();
  facade_options.search_limit         = config.content().search_limit();
  facade_options.root_rail_id         = config.content().root_rail_id();

  app.facade = std::make_shared<backend::ContentFacade>(app.selector, app.cache, facade_options);

  // ------------------------------------------------------------------
  // Readiness + diagnostics
  // ------------------------------------------------------------------
  preflight::PreflightGate::Options preflight_options;
  preflight_options.enabled      = config.preflight().enabled();
  preflight_options.component_id = config.preflight().component_id();

  app.preflight = std::make_shared<preflight::PreflightGate>(app.facade, platform.registry, platform.sessions, preflight_options);

  const auto&                             diag = config.diagnostics();
  diagnostics::DiagnosticsHarness::Options diagnostics_options;
  diagnostics_options.home           = {diag.home_cold_threshold_ms(), diag.home_warm_threshold_ms()};
  diagnostics_options.rail           = {diag.rail_cold_threshold_ms(), diag.rail_warm_threshold_ms()};
  diagnostics_options.clear_prefixes = ToVector(diag.clear_prefixes());
  diagnostics_options.rail_limit     = config.content().rail_limit();
  diagnostics_options.perf_logging   = diag.perf_logging();

  app.diagnostics = std::make_shared<diagnostics::DiagnosticsHarness>(app.facade, app.cache, app.preflight, diagnostics_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.facade      = app.facade;
  ctx.preflight   = app.preflight;
  ctx.diagnostics = app.diagnostics;

  app.content_service = std::make_shared<service::ContentService>(ctx);
  app.platform        = std::move(platform);

  VODBRIDGE_LOG_INFO("application built",
                     {observability::StringField("cache_root", config.cache().root_path()),
                      observability::BoolField("cache_enabled", config.cache().enabled()),
                      observability::BoolField("preflight_enabled", config.preflight().enabled())});
  return app;
}

Application Build(const RuntimeConfig& config) {
  return Build(config, BuildPlatform(config));
}

} // namespace vodbridge::factory
