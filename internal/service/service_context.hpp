#pragma once

#include <memory>

namespace vodbridge::backend { class ContentFacade; }
namespace vodbridge::preflight { class PreflightGate; }
namespace vodbridge::diagnostics { class DiagnosticsHarness; }

namespace vodbridge::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<vodbridge::backend::ContentFacade>          facade;
  std::shared_ptr<vodbridge::preflight::PreflightGate>        preflight;
  std::shared_ptr<vodbridge::diagnostics::DiagnosticsHarness> diagnostics;
};

} // namespace vodbridge::service
