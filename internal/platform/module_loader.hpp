#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/util/json.hpp"

namespace vodbridge::platform {

/*
  An instantiated provider class.

  Invoke / InvokeWithKeywords throw util::SignatureMismatch when the method
  rejects the argument shape, util::BackendError for any other failure.
*/
class ProviderObject {
 public:
  virtual ~ProviderObject() = default;

  virtual bool HasMethod(const std::string& method) const = 0;

  virtual util::json::Value Invoke(const std::string& method, const std::vector<util::json::Value>& positional) = 0;

  virtual util::json::Value InvokeWithKeywords(const std::string& method, const util::json::Struct& keywords) = 0;
};

class LoadedModule {
 public:
  virtual ~LoadedModule() = default;

  virtual const std::string& Name() const = 0;

  // nullptr when the module has no class of that name.
  virtual std::shared_ptr<ProviderObject> Instantiate(const std::string& class_name) = 0;
};

/*
  In-process module loader.

  Import returns nullptr when the module is not found and throws
  util::BackendError when it is found but cannot be loaded.
*/
class ModuleLoader {
 public:
  virtual ~ModuleLoader() = default;

  virtual void AddSearchPath(const std::string& path) = 0;

  virtual std::shared_ptr<LoadedModule> Import(const std::string& name) = 0;
};

} // namespace vodbridge::platform
