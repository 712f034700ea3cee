#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/platform/extension_registry.hpp"

namespace vodbridge::backend {

/*
  Finds the installed provider extension.

  Known ids are tried in order; when none is present the registry is
  enumerated for the category and the first id with a known prefix wins.
  Registry failures are logged and treated as "absent".
*/
class BackendLocator {
 public:
  BackendLocator(std::shared_ptr<platform::ExtensionRegistry> registry,
                 std::vector<std::string>                     candidate_ids,
                 std::string                                  category,
                 std::vector<std::string>                     id_prefixes);

  std::optional<std::string> Discover() const;

  const std::vector<std::string>& candidate_ids() const {
    return candidate_ids_;
  }

 private:
  bool IsPresent(const std::string& id) const;

  std::shared_ptr<platform::ExtensionRegistry> registry_;
  std::vector<std::string>                     candidate_ids_;
  std::string                                  category_;
  std::vector<std::string>                     id_prefixes_;
};

} // namespace vodbridge::backend
