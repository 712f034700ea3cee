#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "backend_locator.hpp"
#include "content_adapter.hpp"

namespace vodbridge::backend {

using AdapterFactory = std::function<std::shared_ptr<ContentAdapter>(const std::string& backend_id)>;

/*
  Ordered {strategy, factory} entries. Factories signal "cannot bind" with
  util::BackendUnavailable.
*/
class AdapterRegistry {
 public:
  struct Entry {
    content::v1::Strategy strategy;
    AdapterFactory        factory;
  };

  void Register(content::v1::Strategy strategy, AdapterFactory factory);

  const std::vector<Entry>& entries() const {
    return entries_;
  }

  bool empty() const {
    return entries_.empty();
  }

 private:
  std::vector<Entry> entries_;
};

/*
  Locator -> adapters in registry order -> first success.

  The first successful selection is memoized for the lifetime of the
  selector; failures are not, so a later call retries discovery.
*/
class StrategySelector {
 public:
  StrategySelector(std::shared_ptr<BackendLocator> locator, AdapterRegistry registry);

  // Bound adapter, selecting it on first use. Throws util::BackendUnavailable.
  std::shared_ptr<ContentAdapter> Get();

  // Tries every strategy for `backend_id`; does not memoize.
  std::shared_ptr<ContentAdapter> Select(const std::string& backend_id) const;

  // Descriptor of the memoized selection, if any.
  std::optional<content::v1::BackendDescriptor> Descriptor() const;

 private:
  std::shared_ptr<BackendLocator> locator_;
  AdapterRegistry                 registry_;

  mutable std::mutex              mutex_;
  std::shared_ptr<ContentAdapter> selected_;
  content::v1::BackendDescriptor  descriptor_;
};

} // namespace vodbridge::backend
