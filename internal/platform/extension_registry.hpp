#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vodbridge::platform {

struct ExtensionInfo {
  std::string id;
  std::string name;
  bool        enabled{false};
};

/*
  Host extension registry.

  Implementations may throw util::TransportError when the host cannot be
  reached; callers decide whether that means "absent".
*/
class ExtensionRegistry {
 public:
  virtual ~ExtensionRegistry() = default;

  virtual bool Exists(const std::string& id) = 0;

  // Installed extensions of one category, in host order.
  virtual std::vector<ExtensionInfo> Enumerate(const std::string& category) = 0;

  virtual std::optional<std::string> InstallPath(const std::string& id) = 0;

  virtual bool IsEnabled(const std::string& id) = 0;
};

} // namespace vodbridge::platform
