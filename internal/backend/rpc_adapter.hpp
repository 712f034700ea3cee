#pragma once

#include <map>
#include <memory>
#include <string>

#include "content_adapter.hpp"
#include "internal/platform/extension_registry.hpp"
#include "internal/platform/rpc_executor.hpp"

namespace vodbridge::backend {

/*
  Blind, host-mediated binding: every operation is an action request to the
  extension; rails are emulated through a directory listing of
  plugin://<id>/?action=rail&...

  Response envelopes: a non-null "error" raises util::BackendError; the
  payload is "result" when present, else the envelope; string payloads are
  JSON-decoded up to two levels.
*/
class RpcAdapter : public ContentAdapter {
 public:
  RpcAdapter(std::string backend_id, std::shared_ptr<platform::ExtensionRegistry> registry, std::shared_ptr<platform::RpcExecutor> executor);

  content::v1::Strategy strategy() const override {
    return content::v1::STRATEGY_RPC;
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

  // Payload of one response envelope (see class comment).
  static util::json::Value DecodeEnvelope(const util::json::Value& envelope);

  // BackendError carrying the provider's message when `envelope` has a non-null "error".
  static void ThrowIfError(const util::json::Value& envelope);

  static std::string RailUri(const std::string& backend_id, const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit);

 private:
  util::json::Value Execute(const std::string& action, std::map<std::string, std::string> params = {});

  std::string                            backend_id_;
  std::shared_ptr<platform::RpcExecutor> executor_;
};

} // namespace vodbridge::backend
