#include "jsonrpc_registry.hpp"

#include <initializer_list>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::platform::jsonrpc {

namespace {

util::json::Value PropertyList(std::initializer_list<const char*> names) {
  util::json::Value list;
  auto*             values = list.mutable_list_value();
  for (const char* name : names) {
    *values->add_values() = util::json::StringValue(name);
  }
  return list;
}

} // namespace

JsonRpcExtensionRegistry::JsonRpcExtensionRegistry(std::shared_ptr<JsonRpcClient> client) : client_(std::move(client)) {
}

std::optional<util::json::Value> JsonRpcExtensionRegistry::Details(const std::string& id) {
  util::json::Struct params;
  auto&              fields = *params.mutable_fields();
  fields["addonid"]         = util::json::StringValue(id);
  fields["properties"]      = PropertyList({"name", "enabled", "path"});

  const auto envelope = client_->Call("Addons.GetAddonDetails", params);
  if (const auto error = EnvelopeError(envelope); !error.empty()) {
    VODBRIDGE_LOG_DEBUG("addon details unavailable", {observability::StringField("addon_id", id), observability::StringField("error", error)});
    return std::nullopt;
  }

  const auto* addon = util::json::FieldPath(envelope, {"result", "addon"});
  if (addon == nullptr || !util::json::IsStruct(*addon)) {
    return std::nullopt;
  }
  return *addon;
}

bool JsonRpcExtensionRegistry::Exists(const std::string& id) {
  return Details(id).has_value();
}

std::vector<ExtensionInfo> JsonRpcExtensionRegistry::Enumerate(const std::string& category) {
  util::json::Struct params;
  auto&              fields = *params.mutable_fields();
  fields["type"]            = util::json::StringValue(category);
  fields["properties"]      = PropertyList({"name", "enabled"});

  const auto envelope = client_->Call("Addons.GetAddons", params);
  if (const auto error = EnvelopeError(envelope); !error.empty()) {
    throw util::TransportError("Addons.GetAddons: " + error);
  }

  std::vector<ExtensionInfo> out;

  const auto* addons = util::json::FieldPath(envelope, {"result", "addons"});
  if (addons == nullptr || !util::json::IsList(*addons)) {
    return out;
  }

  for (const auto& addon : addons->list_value().values()) {
    const auto* id = util::json::Field(addon, "addonid");
    if (id == nullptr || !util::json::IsString(*id)) {
      continue;
    }

    ExtensionInfo info;
    info.id = id->string_value();
    if (const auto* name = util::json::Field(addon, "name")) {
      info.name = util::json::AsString(*name).value_or("");
    }
    if (const auto* enabled = util::json::Field(addon, "enabled")) {
      info.enabled = util::json::AsBool(*enabled).value_or(false);
    }
    out.push_back(std::move(info));
  }

  return out;
}

std::optional<std::string> JsonRpcExtensionRegistry::InstallPath(const std::string& id) {
  const auto addon = Details(id);
  if (!addon) {
    return std::nullopt;
  }
  const auto* path = util::json::Field(*addon, "path");
  if (path == nullptr) {
    return std::nullopt;
  }
  return util::json::AsString(*path);
}

bool JsonRpcExtensionRegistry::IsEnabled(const std::string& id) {
  const auto addon = Details(id);
  if (!addon) {
    return false;
  }
  const auto* enabled = util::json::Field(*addon, "enabled");
  return enabled != nullptr && util::json::AsBool(*enabled).value_or(false);
}

} // namespace vodbridge::platform::jsonrpc
