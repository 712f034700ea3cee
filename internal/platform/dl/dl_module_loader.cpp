#include "dl_module_loader.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "vodbridge/provider/v1/provider_abi.h"

namespace vodbridge::platform::dl {

namespace {

// dlclose()s the shared object once the last module / object reference goes.
class SharedObject {
 public:
  explicit SharedObject(void* handle) : handle_(handle) {
  }

  ~SharedObject() {
    if (handle_) dlclose(handle_);
  }

  SharedObject(const SharedObject&)            = delete;
  SharedObject& operator=(const SharedObject&) = delete;

  void* handle() const {
    return handle_;
  }

 private:
  void* handle_;
};

class DlProviderObject : public ProviderObject {
 public:
  DlProviderObject(std::shared_ptr<SharedObject> so, const vb_provider_class* cls, void* self)
      : so_(std::move(so)), cls_(cls), self_(self) {
  }

  ~DlProviderObject() override {
    if (cls_->destroy) cls_->destroy(self_);
  }

  bool HasMethod(const std::string& method) const override {
    if (cls_->methods == nullptr) {
      return false;
    }
    for (const char* const* m = cls_->methods; *m != nullptr; ++m) {
      if (method == *m) {
        return true;
      }
    }
    return false;
  }

  util::json::Value Invoke(const std::string& method, const std::vector<util::json::Value>& positional) override {
    util::json::Value args;
    auto*             list = args.mutable_list_value();
    for (const auto& arg : positional) {
      *list->add_values() = arg;
    }
    return Call(method, util::json::Serialize(args), 0);
  }

  util::json::Value InvokeWithKeywords(const std::string& method, const util::json::Struct& keywords) override {
    util::json::Value args;
    *args.mutable_struct_value() = keywords;
    return Call(method, util::json::Serialize(args), 1);
  }

 private:
  util::json::Value Call(const std::string& method, const std::string& args_json, int keyword_args) {
    char* raw = nullptr;
    int   rc  = VB_INVOKE_ERROR;
    {
      // provider classes are not required to be re-entrant
      std::lock_guard<std::mutex> lock(mutex_);
      rc = cls_->invoke(self_, method.c_str(), args_json.c_str(), keyword_args, &raw);
    }

    std::string result;
    if (raw != nullptr) {
      result = raw;
      if (cls_->free_string) cls_->free_string(raw);
    }

    switch (rc) {
      case VB_INVOKE_OK: {
        if (result.empty()) {
          return util::json::NullValue();
        }
        auto parsed = util::json::Parse(result);
        if (!parsed) {
          throw util::BackendError(std::string(cls_->name) + "." + method + ": result is not valid JSON");
        }
        return *parsed;
      }
      case VB_INVOKE_SIGNATURE_MISMATCH:
        throw util::SignatureMismatch(std::string(cls_->name) + "." + method + ": " + (result.empty() ? "signature mismatch" : result));
      default:
        throw util::BackendError(std::string(cls_->name) + "." + method + ": " + (result.empty() ? "invocation failed" : result));
    }
  }

  std::shared_ptr<SharedObject> so_;
  const vb_provider_class*      cls_;
  void*                         self_;
  std::mutex                    mutex_;
};

class DlModule : public LoadedModule {
 public:
  DlModule(std::string name, std::shared_ptr<SharedObject> so, vb_provider_find_class_fn find)
      : name_(std::move(name)), so_(std::move(so)), find_(find) {
  }

  const std::string& Name() const override {
    return name_;
  }

  std::shared_ptr<ProviderObject> Instantiate(const std::string& class_name) override {
    const vb_provider_class* cls = find_(class_name.c_str());
    if (cls == nullptr) {
      return nullptr;
    }
    if (cls->abi_version != VB_PROVIDER_ABI_VERSION) {
      throw util::BackendError(name_ + "." + class_name + ": unsupported provider ABI version " + std::to_string(cls->abi_version));
    }
    if (cls->create == nullptr || cls->invoke == nullptr) {
      throw util::BackendError(name_ + "." + class_name + ": incomplete class table");
    }

    void* self = cls->create();
    if (self == nullptr) {
      throw util::BackendError(name_ + "." + class_name + ": create() returned null");
    }
    return std::make_shared<DlProviderObject>(so_, cls, self);
  }

 private:
  std::string                   name_;
  std::shared_ptr<SharedObject> so_;
  vb_provider_find_class_fn     find_;
};

} // namespace

void DlModuleLoader::AddSearchPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(search_paths_.begin(), search_paths_.end(), path) == search_paths_.end()) {
    search_paths_.push_back(path);
  }
}

std::string DlModuleLoader::ModuleFile(const std::string& search_path, const std::string& name) {
  std::string relative = name;
  std::replace(relative.begin(), relative.end(), '.', '/');
  return (std::filesystem::path(search_path) / (relative + ".so")).string();
}

std::shared_ptr<LoadedModule> DlModuleLoader::Import(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (auto it = modules_.find(name); it != modules_.end()) {
    return it->second;
  }

  for (const auto& search_path : search_paths_) {
    const auto      file = ModuleFile(search_path, name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
      continue;
    }

    void* handle = dlopen(file.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
      const char* err = dlerror();
      throw util::BackendError("dlopen failed for " + file + ": " + (err ? err : "unknown error"));
    }
    auto so = std::make_shared<SharedObject>(handle);

    dlerror();
    auto find = reinterpret_cast<vb_provider_find_class_fn>(dlsym(handle, VB_PROVIDER_FIND_CLASS_SYMBOL));
    if (find == nullptr) {
      throw util::BackendError(file + ": missing symbol " VB_PROVIDER_FIND_CLASS_SYMBOL);
    }

    VODBRIDGE_LOG_INFO("provider module loaded", {observability::StringField("module", name), observability::StringField("file", file)});

    auto module    = std::make_shared<DlModule>(name, std::move(so), find);
    modules_[name] = module;
    return module;
  }

  return nullptr;
}

} // namespace vodbridge::platform::dl
