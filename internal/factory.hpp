#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/backend/content_facade.hpp"
#include "internal/backend/strategy_selector.hpp"
#include "internal/cache/ttl_cache.hpp"
#include "internal/diagnostics/diagnostics_harness.hpp"
#include "internal/platform/extension_registry.hpp"
#include "internal/platform/module_loader.hpp"
#include "internal/platform/rpc_executor.hpp"
#include "internal/platform/session_store.hpp"
#include "internal/preflight/preflight_gate.hpp"
#include "internal/service/content_service.hpp"

namespace vodbridge::factory {

/*
  Host primitives. Production code gets JSON-RPC / dlopen / file
  implementations; tests inject fakes.
*/
struct Platform {
  std::shared_ptr<platform::ExtensionRegistry> registry;
  std::shared_ptr<platform::RpcExecutor>       executor;
  std::shared_ptr<platform::ModuleLoader>      loader;
  std::shared_ptr<platform::SessionStore>      sessions;
};

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  Platform platform;

  std::shared_ptr<cache::TtlCache>                 cache;
  std::shared_ptr<backend::StrategySelector>       selector;
  std::shared_ptr<backend::ContentFacade>          facade;
  std::shared_ptr<preflight::PreflightGate>        preflight;
  std::shared_ptr<diagnostics::DiagnosticsHarness> diagnostics;
  std::shared_ptr<service::ContentService>         content_service;
};

Platform BuildPlatform(const vodbridge::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole content pipeline from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete platform types.
*/
Application Build(const vodbridge::runtime::config::RuntimeConfig& config, Platform platform);

Application Build(const vodbridge::runtime::config::RuntimeConfig& config);

} // namespace vodbridge::factory
