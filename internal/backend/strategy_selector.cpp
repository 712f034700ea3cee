#include "strategy_selector.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::backend {

void AdapterRegistry::Register(content::v1::Strategy strategy, AdapterFactory factory) {
  entries_.push_back(Entry{strategy, std::move(factory)});
}

StrategySelector::StrategySelector(std::shared_ptr<BackendLocator> locator, AdapterRegistry registry)
    : locator_(std::move(locator)), registry_(std::move(registry)) {
}

std::shared_ptr<ContentAdapter> StrategySelector::Select(const std::string& backend_id) const {
  std::string reasons;

  for (const auto& entry : registry_.entries()) {
    try {
      auto adapter = entry.factory(backend_id);
      if (adapter) {
        observability::Metrics::Instance().RecordBackendSelection(StrategyName(entry.strategy), true);
        return adapter;
      }
      reasons += std::string(reasons.empty() ? "" : "; ") + StrategyName(entry.strategy) + ": factory returned no adapter";
    } catch (const util::BackendUnavailable& e) {
      observability::Metrics::Instance().RecordBackendSelection(StrategyName(entry.strategy), false);
      VODBRIDGE_LOG_WARN("strategy unavailable",
                         {observability::StringField("addon_id", backend_id),
                          observability::StringField("strategy", StrategyName(entry.strategy)),
                          observability::StringField("error", e.what())});
      reasons += std::string(reasons.empty() ? "" : "; ") + StrategyName(entry.strategy) + ": " + e.what();
    }
  }

  if (reasons.empty()) {
    reasons = "no strategies configured";
  }
  throw util::BackendUnavailable("no usable strategy for " + backend_id + " (" + reasons + ")");
}

std::shared_ptr<ContentAdapter> StrategySelector::Get() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (selected_) {
    return selected_;
  }

  observability::TraceSpan span("backend.select");

  auto backend_id = locator_->Discover();
  if (!backend_id) {
    span.MarkFailed("no provider extension");
    throw util::BackendUnavailable("content service unreachable: no provider extension installed");
  }

  auto adapter = Select(*backend_id);

  descriptor_.set_candidate_id(adapter->backend_id());
  descriptor_.set_strategy(adapter->strategy());
  selected_ = std::move(adapter);

  span.Tag("strategy", std::string_view(StrategyName(descriptor_.strategy())));
  VODBRIDGE_LOG_INFO("backend selected",
                     {observability::StringField("addon_id", descriptor_.candidate_id()),
                      observability::StringField("strategy", StrategyName(descriptor_.strategy()))});
  return selected_;
}

std::optional<content::v1::BackendDescriptor> StrategySelector::Descriptor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!selected_) {
    return std::nullopt;
  }
  return descriptor_;
}

} // namespace vodbridge::backend
