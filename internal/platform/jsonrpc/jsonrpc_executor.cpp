#include "jsonrpc_executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::platform::jsonrpc {

namespace {

std::string StringMember(const util::json::Value& v, std::string_view key) {
  const auto* field = util::json::Field(v, key);
  if (field == nullptr) {
    return {};
  }
  return util::json::AsString(*field).value_or("");
}

util::json::Value ValueMember(const util::json::Value& v, std::string_view key) {
  const auto* field = util::json::Field(v, key);
  return field ? *field : util::json::NullValue();
}

} // namespace

JsonRpcExecutor::JsonRpcExecutor(std::shared_ptr<JsonRpcClient> client, std::string action_method)
    : client_(std::move(client)), action_method_(std::move(action_method)) {
}

std::vector<DirectoryEntry> JsonRpcExecutor::ListDirectory(const std::string& uri) {
  util::json::Struct params;
  auto&              fields = *params.mutable_fields();
  fields["directory"]       = util::json::StringValue(uri);
  fields["media"]           = util::json::StringValue("video");

  auto* properties = fields["properties"].mutable_list_value();
  for (const char* name : {"title", "plot", "art", "streamdetails", "resume", "file"}) {
    *properties->add_values() = util::json::StringValue(name);
  }

  const auto envelope = client_->Call("Files.GetDirectory", params);
  if (const auto error = EnvelopeError(envelope); !error.empty()) {
    throw util::BackendError("Files.GetDirectory: " + error);
  }

  std::vector<DirectoryEntry> entries;

  const auto* files = util::json::FieldPath(envelope, {"result", "files"});
  if (files == nullptr || !util::json::IsList(*files)) {
    return entries;
  }

  entries.reserve(static_cast<size_t>(files->list_value().values_size()));
  for (const auto& file : files->list_value().values()) {
    if (!util::json::IsStruct(file)) {
      continue;
    }

    DirectoryEntry entry;
    entry.label          = StringMember(file, "label");
    entry.file           = StringMember(file, "file");
    entry.plot           = StringMember(file, "plot");
    entry.art            = ValueMember(file, "art");
    entry.stream_details = ValueMember(file, "streamdetails");
    entry.resume         = ValueMember(file, "resume");
    entry.is_folder      = StringMember(file, "filetype") == "directory";
    entries.push_back(std::move(entry));
  }

  VODBRIDGE_LOG_DEBUG("directory listed", {observability::StringField("uri", uri), observability::IntField("entries", static_cast<std::int64_t>(entries.size()))});
  return entries;
}

util::json::Value JsonRpcExecutor::ExecuteAction(const std::string& extension_id, const std::map<std::string, std::string>& params) {
  util::json::Struct request;
  auto&              fields = *request.mutable_fields();
  fields["addonid"]         = util::json::StringValue(extension_id);
  fields["wait"]            = util::json::BoolValue(true);

  auto& action_params = *fields["params"].mutable_struct_value()->mutable_fields();
  for (const auto& [key, value] : params) {
    action_params[key] = util::json::StringValue(value);
  }

  return client_->Call(action_method_, request);
}

} // namespace vodbridge::platform::jsonrpc
