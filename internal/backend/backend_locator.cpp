#include "backend_locator.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace vodbridge::backend {

BackendLocator::BackendLocator(std::shared_ptr<platform::ExtensionRegistry> registry,
                               std::vector<std::string>                     candidate_ids,
                               std::string                                  category,
                               std::vector<std::string>                     id_prefixes)
    : registry_(std::move(registry)),
      candidate_ids_(std::move(candidate_ids)),
      category_(std::move(category)),
      id_prefixes_(std::move(id_prefixes)) {
}

bool BackendLocator::IsPresent(const std::string& id) const {
  try {
    return registry_->Exists(id);
  } catch (const std::exception& e) {
    VODBRIDGE_LOG_WARN("extension lookup failed", {observability::StringField("addon_id", id), observability::StringField("error", e.what())});
    return false;
  }
}

std::optional<std::string> BackendLocator::Discover() const {
  for (const auto& id : candidate_ids_) {
    if (IsPresent(id)) {
      VODBRIDGE_LOG_INFO("provider extension found", {observability::StringField("addon_id", id)});
      return id;
    }
  }

  std::vector<platform::ExtensionInfo> installed;
  try {
    installed = registry_->Enumerate(category_);
  } catch (const std::exception& e) {
    VODBRIDGE_LOG_WARN("extension enumeration failed", {observability::StringField("category", category_), observability::StringField("error", e.what())});
    return std::nullopt;
  }

  for (const auto& info : installed) {
    for (const auto& prefix : id_prefixes_) {
      if (info.id.rfind(prefix, 0) == 0) {
        VODBRIDGE_LOG_INFO("provider extension matched by prefix",
                           {observability::StringField("addon_id", info.id), observability::StringField("prefix", prefix)});
        return info.id;
      }
    }
  }

  VODBRIDGE_LOG_WARN("no provider extension installed", {observability::IntField("candidates", static_cast<std::int64_t>(candidate_ids_.size()))});
  return std::nullopt;
}

} // namespace vodbridge::backend
