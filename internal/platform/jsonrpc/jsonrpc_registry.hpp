#pragma once

#include <memory>

#include "internal/platform/extension_registry.hpp"
#include "json_rpc_client.hpp"

namespace vodbridge::platform::jsonrpc {

// ExtensionRegistry over Addons.GetAddonDetails / Addons.GetAddons.
class JsonRpcExtensionRegistry : public ExtensionRegistry {
 public:
  explicit JsonRpcExtensionRegistry(std::shared_ptr<JsonRpcClient> client);

  bool                       Exists(const std::string& id) override;
  std::vector<ExtensionInfo> Enumerate(const std::string& category) override;
  std::optional<std::string> InstallPath(const std::string& id) override;
  bool                       IsEnabled(const std::string& id) override;

 private:
  // The "addon" member of a details response; nullopt when the host does not know the id.
  std::optional<util::json::Value> Details(const std::string& id);

  std::shared_ptr<JsonRpcClient> client_;
};

} // namespace vodbridge::platform::jsonrpc
