#pragma once

#include <memory>
#include <string>

#include "internal/backend/content_facade.hpp"
#include "internal/platform/extension_registry.hpp"
#include "internal/platform/session_store.hpp"
#include "vodbridge/content/v1.hpp"

namespace vodbridge::preflight {

/*
  Readiness gate run before every content request.

  Checks (all evaluated, failures collected):
    login      provider login state; unknown falls back to the persisted session
    component  stream decryption component installed and enabled
    drm        explicit "not ready" fails; unknown passes

  util::BackendUnavailable from the facade propagates unchanged.
*/
class PreflightGate {
 public:
  struct Options {
    bool        enabled{true};
    std::string component_id{"inputstream.adaptive"};
  };

  PreflightGate(std::shared_ptr<backend::ContentFacade>      facade,
                std::shared_ptr<platform::ExtensionRegistry> registry,
                std::shared_ptr<platform::SessionStore>      sessions,
                Options                                      options);

  content::v1::PreflightReport Evaluate();

  // Throws util::PreflightError carrying every failed check.
  void EnsureReady();

  bool enabled() const {
    return options_.enabled;
  }

 private:
  void CheckLogin(content::v1::PreflightReport* report);
  void CheckComponent(content::v1::PreflightReport* report);
  void CheckDrm(content::v1::PreflightReport* report);

  std::shared_ptr<backend::ContentFacade>      facade_;
  std::shared_ptr<platform::ExtensionRegistry> registry_;
  std::shared_ptr<platform::SessionStore>      sessions_;
  Options                                      options_;
};

} // namespace vodbridge::preflight
