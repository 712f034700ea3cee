#include "rpc_adapter.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace vodbridge::backend {

namespace json = util::json;

namespace {

constexpr int kMaxStringDecodeDepth = 2;

// Duration from Kodi streamdetails ({"video": [{"duration": N}]}), else resume.total.
std::optional<double> EntryDuration(const platform::DirectoryEntry& entry) {
  if (const auto* video = json::Field(entry.stream_details, "video"); video && json::IsList(*video) && video->list_value().values_size() > 0) {
    if (const auto* duration = json::Field(video->list_value().values(0), "duration")) {
      if (auto seconds = json::AsInt(*duration); seconds && *seconds > 0) {
        return *seconds;
      }
    }
  }
  if (const auto* total = json::Field(entry.resume, "total")) {
    if (auto seconds = json::AsInt(*total); seconds && *seconds > 0) {
      return *seconds;
    }
  }
  return std::nullopt;
}

json::Value EntryToRawItem(const platform::DirectoryEntry& entry, const std::map<std::string, std::string>& query) {
  json::Value raw;
  auto&       fields = *raw.mutable_struct_value()->mutable_fields();

  std::string id = entry.file;
  for (const char* key : {"asin", "id"}) {
    if (auto it = query.find(key); it != query.end() && !it->second.empty()) {
      id = it->second;
      break;
    }
  }

  fields["id"]          = json::StringValue(id);
  fields["title"]       = json::StringValue(entry.label);
  fields["plot"]        = json::StringValue(entry.plot);
  fields["is_playable"] = json::BoolValue(!entry.is_folder);
  if (json::IsStruct(entry.art)) {
    fields["art"] = entry.art;
  }
  if (auto duration = EntryDuration(entry)) {
    fields["duration_seconds"] = json::NumberValue(*duration);
  }
  if (auto it = query.find("mediatype"); it != query.end()) {
    fields["mediatype"] = json::StringValue(it->second);
  }
  return raw;
}

} // namespace

RpcAdapter::RpcAdapter(std::string backend_id, std::shared_ptr<platform::ExtensionRegistry> registry, std::shared_ptr<platform::RpcExecutor> executor)
    : backend_id_(std::move(backend_id)), executor_(std::move(executor)) {
  bool present = false;
  try {
    present = registry->Exists(backend_id_);
  } catch (const std::exception& e) {
    throw util::BackendUnavailable("rpc binding failed for " + backend_id_ + ": " + e.what());
  }
  if (!present) {
    throw util::BackendUnavailable("rpc binding failed for " + backend_id_ + ": extension not installed");
  }
  VODBRIDGE_LOG_INFO("rpc adapter bound", {observability::StringField("addon_id", backend_id_)});
}

// ------------------------------------------------------------
// Envelope decoding
// ------------------------------------------------------------

namespace {

// "result" member, including an explicit null.
const json::Value* ResultMember(const json::Value& envelope) {
  if (!json::IsStruct(envelope)) {
    return nullptr;
  }
  const auto& fields = envelope.struct_value().fields();
  auto        it     = fields.find("result");
  return it == fields.end() ? nullptr : &it->second;
}

} // namespace

json::Value RpcAdapter::DecodeEnvelope(const json::Value& envelope) {
  ThrowIfError(envelope);

  json::Value payload = envelope;
  bool        unwrapped = false;
  if (const auto* result = ResultMember(envelope)) {
    payload   = *result;
    unwrapped = true;
  }

  // Each decoded layer may itself be an {"error": ...} or {"result": ...} envelope.
  for (int depth = 0; depth < kMaxStringDecodeDepth && json::IsString(payload); ++depth) {
    auto decoded = json::Parse(payload.string_value());
    if (!decoded) {
      break;
    }
    payload = std::move(*decoded);
    ThrowIfError(payload);
    if (!unwrapped) {
      if (const auto* result = ResultMember(payload)) {
        json::Value inner = *result;
        payload           = std::move(inner);
        unwrapped         = true;
      }
    }
  }
  return payload;
}

void RpcAdapter::ThrowIfError(const json::Value& envelope) {
  const auto* error = json::Field(envelope, "error");
  if (error == nullptr) {
    return;
  }
  std::string message = "provider reported an error";
  if (const auto* text = json::Field(*error, "message")) {
    message = json::AsString(*text).value_or(message);
  } else if (auto literal = json::AsString(*error)) {
    message = *literal;
  }
  throw util::BackendError(message);
}

json::Value RpcAdapter::Execute(const std::string& action, std::map<std::string, std::string> params) {
  observability::TraceSpan span("adapter.rpc.execute");
  span.Tag("action", std::string_view(action));

  params["action"] = action;

  json::Value envelope;
  try {
    envelope = executor_->ExecuteAction(backend_id_, params);
  } catch (const util::TransportError& e) {
    span.MarkFailed(e.what());
    throw util::BackendUnavailable(std::string("content service unreachable: ") + e.what());
  }
  return DecodeEnvelope(envelope);
}

// ------------------------------------------------------------
// Content operations
// ------------------------------------------------------------

json::Value RpcAdapter::HomeRails() {
  return Execute("home_rails");
}

std::string RpcAdapter::RailUri(const std::string& backend_id, const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) {
  std::string uri = "plugin://" + backend_id + "/?action=rail&rail_id=" + util::PercentEncode(rail_id);
  if (cursor) {
    uri += "&cursor=" + util::PercentEncode(*cursor);
  }
  if (limit > 0) {
    uri += "&limit=" + std::to_string(limit);
  }
  return uri;
}

json::Value RpcAdapter::Rail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) {
  observability::TraceSpan span("adapter.rpc.rail");

  std::vector<platform::DirectoryEntry> entries;
  try {
    entries = executor_->ListDirectory(RailUri(backend_id_, rail_id, cursor, limit));
  } catch (const util::TransportError& e) {
    span.MarkFailed(e.what());
    throw util::BackendUnavailable(std::string("content service unreachable: ") + e.what());
  }

  json::Value page;
  auto&       fields = *page.mutable_struct_value()->mutable_fields();
  auto*       items  = fields["items"].mutable_list_value();

  for (const auto& entry : entries) {
    const auto query = util::QueryParams(entry.file);
    if (auto it = query.find("cursor"); it != query.end()) {
      if (!it->second.empty()) {
        fields["next_cursor"] = json::StringValue(it->second);
      }
      continue;
    }
    *items->add_values() = EntryToRawItem(entry, query);
  }
  return page;
}

json::Value RpcAdapter::Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit) {
  std::map<std::string, std::string> params{{"query", query}};
  if (cursor) {
    params["cursor"] = *cursor;
  }
  if (limit > 0) {
    params["limit"] = std::to_string(limit);
  }
  return Execute("search", std::move(params));
}

json::Value RpcAdapter::Playable(const std::string& id) {
  return Execute("playable", {{"id", id}});
}

std::optional<std::string> RpcAdapter::Region() {
  try {
    return json::AsString(Execute("region"));
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_DEBUG("region unknown", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<bool> RpcAdapter::LoginState() {
  try {
    const auto payload = Execute("login_state");
    if (const auto* flag = json::FirstField(payload, {"logged_in", "loggedIn"})) {
      return json::AsBool(*flag);
    }
    return json::AsBool(payload);
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_DEBUG("login state unknown", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<bool> RpcAdapter::DrmReady() {
  try {
    const auto payload = Execute("drm_status");
    if (const auto* flag = json::FirstField(payload, {"ready", "drm_ready"})) {
      return json::AsBool(*flag);
    }
    return json::AsBool(payload);
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_DEBUG("drm status unknown", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace vodbridge::backend
