#pragma once

#include <memory>
#include <string>
#include <vector>

#include "capability_probe.hpp"
#include "content_adapter.hpp"
#include "internal/platform/extension_registry.hpp"
#include "internal/platform/module_loader.hpp"

namespace vodbridge::backend {

/*
  In-process binding to the provider's own classes.

  Construction walks module_names x class_names in order and binds the first
  object whose capability probe satisfies the minimum surface; otherwise it
  throws util::BackendUnavailable listing every attempt.

  Calls go positional first and are retried with keyword arguments on
  util::SignatureMismatch.
*/
class DirectAdapter : public ContentAdapter {
 public:
  struct Options {
    std::vector<std::string> module_names;
    std::vector<std::string> class_names;
    ProbeTable               probe_table;
    std::string              root_rail_id{"root"};
  };

  DirectAdapter(std::string                                  backend_id,
                std::shared_ptr<platform::ExtensionRegistry> registry,
                std::shared_ptr<platform::ModuleLoader>      loader,
                Options                                      options);

  content::v1::Strategy strategy() const override {
    return content::v1::STRATEGY_DIRECT;
  }

  const std::string& backend_id() const override {
    return backend_id_;
  }

  util::json::Value HomeRails() override;
  util::json::Value Rail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) override;
  util::json::Value Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit) override;
  util::json::Value Playable(const std::string& id) override;

  std::optional<std::string> Region() override;
  std::optional<bool>        LoginState() override;
  std::optional<bool>        DrmReady() override;

  // "<module>.<class>" of the bound object.
  const std::string& bound_name() const {
    return bound_name_;
  }

  const CapabilityProbe& probe() const {
    return probe_;
  }

 private:
  void Bind(platform::ExtensionRegistry& registry, platform::ModuleLoader& loader);

  util::json::Value Call(const std::string& method, const std::vector<util::json::Value>& positional, const util::json::Struct& keywords);

  std::string                               backend_id_;
  Options                                   options_;
  std::shared_ptr<platform::ModuleLoader>   loader_;
  std::shared_ptr<platform::LoadedModule>   module_;
  std::shared_ptr<platform::ProviderObject> object_;
  CapabilityProbe                           probe_;
  std::string                               bound_name_;
};

} // namespace vodbridge::backend
