#include "direct_adapter.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::backend {

namespace json = util::json;

namespace {

json::Value OptionalString(const std::optional<std::string>& s) {
  return s ? json::StringValue(*s) : json::NullValue();
}

std::string Join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += sep;
    out += part;
  }
  return out;
}

} // namespace

DirectAdapter::DirectAdapter(std::string                                  backend_id,
                             std::shared_ptr<platform::ExtensionRegistry> registry,
                             std::shared_ptr<platform::ModuleLoader>      loader,
                             Options                                      options)
    : backend_id_(std::move(backend_id)), options_(std::move(options)), loader_(std::move(loader)) {
  Bind(*registry, *loader_);
}

// ------------------------------------------------------------
// Binding
// ------------------------------------------------------------

void DirectAdapter::Bind(platform::ExtensionRegistry& registry, platform::ModuleLoader& loader) {
  std::vector<std::string> attempts;

  try {
    if (auto path = registry.InstallPath(backend_id_)) {
      loader.AddSearchPath(*path);
    } else {
      attempts.push_back("install path unknown");
    }
  } catch (const std::exception& e) {
    attempts.push_back(std::string("install path lookup failed: ") + e.what());
  }

  for (const auto& module_name : options_.module_names) {
    std::shared_ptr<platform::LoadedModule> module;
    try {
      module = loader.Import(module_name);
    } catch (const std::exception& e) {
      attempts.push_back(module_name + ": " + e.what());
      continue;
    }
    if (!module) {
      attempts.push_back(module_name + ": not found");
      continue;
    }

    for (const auto& class_name : options_.class_names) {
      const std::string qualified = module_name + "." + class_name;

      std::shared_ptr<platform::ProviderObject> object;
      try {
        object = module->Instantiate(class_name);
      } catch (const std::exception& e) {
        attempts.push_back(qualified + ": " + e.what());
        continue;
      }
      if (!object) {
        continue;
      }

      auto probe = CapabilityProbe::Bind(*object, options_.probe_table);
      if (!probe.SatisfiesMinimum()) {
        attempts.push_back(qualified + ": lacks rail or playback method");
        continue;
      }

      if (!probe.Has(Capability::kSearch)) {
        VODBRIDGE_LOG_WARN("provider has no search method", {observability::StringField("addon_id", backend_id_), observability::StringField("class", qualified)});
      }

      module_     = std::move(module);
      object_     = std::move(object);
      probe_      = std::move(probe);
      bound_name_ = qualified;

      VODBRIDGE_LOG_INFO("direct adapter bound", {observability::StringField("addon_id", backend_id_), observability::StringField("class", bound_name_)});
      return;
    }

    attempts.push_back(module_name + ": no usable class");
  }

  throw util::BackendUnavailable("direct binding failed for " + backend_id_ + ": " + Join(attempts, "; "));
}

// ------------------------------------------------------------
// Invocation
// ------------------------------------------------------------

json::Value DirectAdapter::Call(const std::string& method, const std::vector<json::Value>& positional, const json::Struct& keywords) {
  observability::TraceSpan span("adapter.direct.call");
  span.Tag("method", std::string_view(method));

  try {
    return object_->Invoke(method, positional);
  } catch (const util::SignatureMismatch& positional_error) {
    VODBRIDGE_LOG_DEBUG("positional call rejected, retrying with keywords",
                        {observability::StringField("method", method), observability::StringField("error", positional_error.what())});
  }

  try {
    return object_->InvokeWithKeywords(method, keywords);
  } catch (const util::SignatureMismatch& keyword_error) {
    span.MarkFailed(keyword_error.what());
    throw util::BackendError(method + ": rejected positional and keyword arguments (" + keyword_error.what() + ")");
  }
}

json::Value DirectAdapter::HomeRails() {
  if (auto method = probe_.Resolve(Capability::kHome)) {
    return Call(*method, {}, {});
  }
  return Rail(options_.root_rail_id, std::nullopt, 0);
}

json::Value DirectAdapter::Rail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) {
  auto method = probe_.Resolve(Capability::kRail);
  if (!method) {
    throw util::BackendError("provider has no rail method");
  }

  json::Struct keywords;
  auto&        fields = *keywords.mutable_fields();
  fields["rail_id"]   = json::StringValue(rail_id);
  fields["cursor"]    = OptionalString(cursor);

  std::vector<json::Value> positional{json::StringValue(rail_id), OptionalString(cursor)};
  if (limit > 0) {
    positional.push_back(json::NumberValue(limit));
    fields["limit"] = json::NumberValue(limit);
  }
  return Call(*method, positional, keywords);
}

json::Value DirectAdapter::Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit) {
  auto method = probe_.Resolve(Capability::kSearch);
  if (!method) {
    throw util::BackendError("provider has no search method");
  }

  json::Struct keywords;
  auto&        fields = *keywords.mutable_fields();
  fields["query"]     = json::StringValue(query);
  fields["cursor"]    = OptionalString(cursor);

  std::vector<json::Value> positional{json::StringValue(query), OptionalString(cursor)};
  if (limit > 0) {
    positional.push_back(json::NumberValue(limit));
    fields["limit"] = json::NumberValue(limit);
  }
  return Call(*method, positional, keywords);
}

json::Value DirectAdapter::Playable(const std::string& id) {
  auto method = probe_.Resolve(Capability::kPlayable);
  if (!method) {
    throw util::BackendError("provider has no playback method");
  }

  json::Struct keywords;
  (*keywords.mutable_fields())["asin"] = json::StringValue(id);
  return Call(*method, {json::StringValue(id)}, keywords);
}

std::optional<std::string> DirectAdapter::Region() {
  auto method = probe_.Resolve(Capability::kRegion);
  if (!method) {
    return std::nullopt;
  }
  return json::AsString(Call(*method, {}, {}));
}

std::optional<bool> DirectAdapter::LoginState() {
  auto method = probe_.Resolve(Capability::kLogin);
  if (!method) {
    return std::nullopt;
  }
  return json::AsBool(Call(*method, {}, {}));
}

std::optional<bool> DirectAdapter::DrmReady() {
  auto method = probe_.Resolve(Capability::kDrm);
  if (!method) {
    return std::nullopt;
  }
  return json::AsBool(Call(*method, {}, {}));
}

} // namespace vodbridge::backend
