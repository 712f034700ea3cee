#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/platform/module_loader.hpp"

namespace vodbridge::platform::dl {

/*
  ModuleLoader over dlopen().

  Dotted module names resolve against the search paths in the order they
  were added: "resources.lib.api" -> "<path>/resources/lib/api.so".
  Classes are bound through api/vodbridge/provider/v1/provider_abi.h.

  Imported modules stay loaded for the loader's lifetime; provider objects
  keep their module mapped until they are destroyed.
*/
class DlModuleLoader : public ModuleLoader {
 public:
  DlModuleLoader() = default;

  void AddSearchPath(const std::string& path) override;

  std::shared_ptr<LoadedModule> Import(const std::string& name) override;

  // Candidate file for `name` under `search_path` (no filesystem access).
  static std::string ModuleFile(const std::string& search_path, const std::string& name);

 private:
  std::mutex                                           mutex_;
  std::vector<std::string>                             search_paths_;
  std::map<std::string, std::shared_ptr<LoadedModule>> modules_;
};

} // namespace vodbridge::platform::dl
