#pragma once

#include <memory>
#include <string>

#include "internal/platform/rpc_executor.hpp"
#include "json_rpc_client.hpp"

namespace vodbridge::platform::jsonrpc {

/*
  RpcExecutor over the host JSON-RPC API.

  ListDirectory  -> Files.GetDirectory
  ExecuteAction  -> configurable method (Addons.ExecuteAddon by default),
                    params: {addonid, params: {...}, wait: true}
*/
class JsonRpcExecutor : public RpcExecutor {
 public:
  JsonRpcExecutor(std::shared_ptr<JsonRpcClient> client, std::string action_method);

  std::vector<DirectoryEntry> ListDirectory(const std::string& uri) override;

  util::json::Value ExecuteAction(const std::string& extension_id, const std::map<std::string, std::string>& params) override;

 private:
  std::shared_ptr<JsonRpcClient> client_;
  std::string                    action_method_;
};

} // namespace vodbridge::platform::jsonrpc
