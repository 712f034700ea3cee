#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/backend/backend_locator.hpp"
#include "internal/backend/content_adapter.hpp"
#include "internal/backend/strategy_selector.hpp"
#include "internal/platform/extension_registry.hpp"
#include "internal/platform/module_loader.hpp"
#include "internal/platform/rpc_executor.hpp"
#include "internal/platform/session_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace vodbridge::testing {

namespace json = util::json;

inline json::Value ParseJson(const std::string& text) {
  auto parsed = json::Parse(text);
  if (!parsed) {
    throw std::runtime_error("test fixture is not valid JSON: " + text);
  }
  return *parsed;
}

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path MakeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "vodbridge_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// ------------------------------------------------------------
// Clocks
// ------------------------------------------------------------

class ManualClock {
 public:
  explicit ManualClock(util::TimePoint start = util::FromUnixSeconds(1'700'000'000.0)) : now_(std::make_shared<util::TimePoint>(start)) {
  }

  util::ClockFn fn() const {
    auto now = now_;
    return [now] { return *now; };
  }

  void Advance(std::chrono::seconds delta) {
    *now_ += delta;
  }

 private:
  std::shared_ptr<util::TimePoint> now_;
};

// Every reading advances by `step`, or by the next scripted step when queued.
class SteppingSteadyClock {
 public:
  explicit SteppingSteadyClock(std::chrono::milliseconds step = std::chrono::milliseconds(0))
      : state_(std::make_shared<State>()) {
    state_->step = step;
  }

  util::SteadyFn fn() const {
    auto state = state_;
    return [state] {
      const auto reading = state->now;
      auto       step    = state->step;
      if (!state->script.empty()) {
        step = state->script.front();
        state->script.erase(state->script.begin());
      }
      state->now += step;
      return reading;
    };
  }

  void SetStep(std::chrono::milliseconds step) {
    state_->step = step;
  }

  void Script(std::vector<std::chrono::milliseconds> steps) {
    state_->script = std::move(steps);
  }

 private:
  struct State {
    std::chrono::steady_clock::time_point  now{};
    std::chrono::milliseconds              step{0};
    std::vector<std::chrono::milliseconds> script;
  };
  std::shared_ptr<State> state_;
};

// ------------------------------------------------------------
// Host primitives
// ------------------------------------------------------------

class FakeExtensionRegistry : public platform::ExtensionRegistry {
 public:
  void Install(const std::string& id, bool enabled = true, std::optional<std::string> path = std::nullopt, std::string category = "xbmc.python.pluginsource") {
    extensions_[id] = {enabled, std::move(path), std::move(category)};
    order_.push_back(id);
  }

  void FailWith(std::string message) {
    failure_ = std::move(message);
  }

  bool Exists(const std::string& id) override {
    MaybeFail();
    ++exists_calls;
    return extensions_.count(id) > 0;
  }

  std::vector<platform::ExtensionInfo> Enumerate(const std::string& category) override {
    MaybeFail();
    std::vector<platform::ExtensionInfo> out;
    for (const auto& id : order_) {
      const auto& ext = extensions_.at(id);
      if (ext.category == category) {
        out.push_back({id, id, ext.enabled});
      }
    }
    return out;
  }

  std::optional<std::string> InstallPath(const std::string& id) override {
    MaybeFail();
    auto it = extensions_.find(id);
    return it == extensions_.end() ? std::nullopt : it->second.path;
  }

  bool IsEnabled(const std::string& id) override {
    MaybeFail();
    auto it = extensions_.find(id);
    return it != extensions_.end() && it->second.enabled;
  }

  int exists_calls{0};

 private:
  struct Extension {
    bool                       enabled;
    std::optional<std::string> path;
    std::string                category;
  };

  void MaybeFail() const {
    if (failure_) {
      throw util::TransportError(*failure_);
    }
  }

  std::map<std::string, Extension> extensions_;
  std::vector<std::string>         order_;
  std::optional<std::string>       failure_;
};

class FakeRpcExecutor : public platform::RpcExecutor {
 public:
  void OnAction(const std::string& action, json::Value envelope) {
    envelopes_[action] = std::move(envelope);
  }

  void OnListing(const std::string& uri, std::vector<platform::DirectoryEntry> entries) {
    listings_[uri] = std::move(entries);
  }

  void FailWith(std::string message) {
    failure_ = std::move(message);
  }

  std::vector<platform::DirectoryEntry> ListDirectory(const std::string& uri) override {
    if (failure_) throw util::TransportError(*failure_);
    ++list_calls;
    last_uri = uri;
    auto it = listings_.find(uri);
    if (it == listings_.end()) {
      throw util::BackendError("no listing for " + uri);
    }
    return it->second;
  }

  json::Value ExecuteAction(const std::string& extension_id, const std::map<std::string, std::string>& params) override {
    if (failure_) throw util::TransportError(*failure_);
    ++action_calls;
    last_extension = extension_id;
    last_params    = params;

    auto action = params.find("action");
    if (action == params.end()) {
      throw std::logic_error("action parameter missing");
    }
    auto it = envelopes_.find(action->second);
    if (it == envelopes_.end()) {
      return ParseJson(R"({"error": {"message": "unknown action"}})");
    }
    return it->second;
  }

  int                                list_calls{0};
  int                                action_calls{0};
  std::string                        last_uri;
  std::string                        last_extension;
  std::map<std::string, std::string> last_params;

 private:
  std::map<std::string, json::Value>                           envelopes_;
  std::map<std::string, std::vector<platform::DirectoryEntry>> listings_;
  std::optional<std::string>                                   failure_;
};

/*
  Provider object with a scripted method table.

  A method marked keyword-only rejects positional calls with
  SignatureMismatch; one marked broken rejects both shapes.
*/
class FakeProviderObject : public platform::ProviderObject {
 public:
  using Handler = std::function<json::Value(const std::vector<json::Value>&, const json::Struct&)>;

  void Define(const std::string& method, json::Value result) {
    methods_[method] = {[result](const std::vector<json::Value>&, const json::Struct&) { return result; }, false, false};
  }

  void Define(const std::string& method, Handler handler) {
    methods_[method] = {std::move(handler), false, false};
  }

  void KeywordOnly(const std::string& method) {
    methods_.at(method).keyword_only = true;
  }

  void RejectAllShapes(const std::string& method) {
    methods_.at(method).reject_all = true;
  }

  bool HasMethod(const std::string& method) const override {
    return methods_.count(method) > 0;
  }

  json::Value Invoke(const std::string& method, const std::vector<json::Value>& positional) override {
    ++positional_calls[method];
    last_positional = positional;
    const auto& entry = Lookup(method);
    if (entry.keyword_only || entry.reject_all) {
      throw util::SignatureMismatch(method + "() got unexpected positional arguments");
    }
    return entry.handler(positional, json::Struct{});
  }

  json::Value InvokeWithKeywords(const std::string& method, const json::Struct& keywords) override {
    ++keyword_calls[method];
    last_keywords = keywords;
    const auto& entry = Lookup(method);
    if (entry.reject_all) {
      throw util::SignatureMismatch(method + "() got an unexpected keyword argument");
    }
    return entry.handler({}, keywords);
  }

  std::map<std::string, int> positional_calls;
  std::map<std::string, int> keyword_calls;
  std::vector<json::Value>   last_positional;
  json::Struct               last_keywords;

 private:
  struct Method {
    Handler handler;
    bool    keyword_only{false};
    bool    reject_all{false};
  };

  const Method& Lookup(const std::string& method) const {
    auto it = methods_.find(method);
    if (it == methods_.end()) {
      throw util::BackendError("no method " + method);
    }
    return it->second;
  }

  std::map<std::string, Method> methods_;
};

class FakeModule : public platform::LoadedModule {
 public:
  explicit FakeModule(std::string name) : name_(std::move(name)) {
  }

  void AddClass(const std::string& class_name, std::shared_ptr<FakeProviderObject> object) {
    classes_[class_name] = std::move(object);
  }

  const std::string& Name() const override {
    return name_;
  }

  std::shared_ptr<platform::ProviderObject> Instantiate(const std::string& class_name) override {
    auto it = classes_.find(class_name);
    return it == classes_.end() ? nullptr : it->second;
  }

 private:
  std::string                                                name_;
  std::map<std::string, std::shared_ptr<FakeProviderObject>> classes_;
};

class FakeModuleLoader : public platform::ModuleLoader {
 public:
  void AddModule(std::shared_ptr<FakeModule> module) {
    modules_[module->Name()] = std::move(module);
  }

  void Break(const std::string& name) {
    broken_.insert(name);
  }

  void AddSearchPath(const std::string& path) override {
    search_paths.push_back(path);
  }

  std::shared_ptr<platform::LoadedModule> Import(const std::string& name) override {
    imports.push_back(name);
    if (broken_.count(name) > 0) {
      throw util::BackendError("cannot load " + name);
    }
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second;
  }

  std::vector<std::string> search_paths;
  std::vector<std::string> imports;

 private:
  std::map<std::string, std::shared_ptr<FakeModule>> modules_;
  std::set<std::string>                              broken_;
};

class FakeSessionStore : public platform::SessionStore {
 public:
  explicit FakeSessionStore(bool has_session = false) : has_session_(has_session) {
  }

  bool HasSession() override {
    return has_session_;
  }

  void Set(bool has_session) {
    has_session_ = has_session;
  }

 private:
  bool has_session_;
};

// ------------------------------------------------------------
// Adapter
// ------------------------------------------------------------

class FakeAdapter : public backend::ContentAdapter {
 public:
  explicit FakeAdapter(std::string id = "plugin.video.fake", content::v1::Strategy strategy = content::v1::STRATEGY_DIRECT)
      : id_(std::move(id)), strategy_(strategy) {
  }

  content::v1::Strategy strategy() const override {
    return strategy_;
  }

  const std::string& backend_id() const override {
    return id_;
  }

  json::Value HomeRails() override {
    ++home_calls;
    return home;
  }

  json::Value Rail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) override {
    ++rail_calls;
    last_rail_id = rail_id;
    last_cursor  = cursor;
    last_limit   = limit;
    auto it      = rails.find(rail_id);
    if (it == rails.end()) {
      throw util::BackendError("unknown rail " + rail_id);
    }
    return it->second;
  }

  json::Value Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit) override {
    ++search_calls;
    last_query  = query;
    last_cursor = cursor;
    last_limit  = limit;
    return search;
  }

  json::Value Playable(const std::string& id) override {
    ++playable_calls;
    last_playable_id = id;
    return playable;
  }

  std::optional<std::string> Region() override {
    return region;
  }

  std::optional<bool> LoginState() override {
    if (login_error) throw util::BackendError("login probe failed");
    return logged_in;
  }

  std::optional<bool> DrmReady() override {
    return drm_ready;
  }

  json::Value                        home;
  std::map<std::string, json::Value> rails;
  json::Value                        search;
  json::Value                        playable;
  std::optional<std::string>         region;
  std::optional<bool>                logged_in{true};
  std::optional<bool>                drm_ready;
  bool                               login_error{false};

  int                        home_calls{0};
  int                        rail_calls{0};
  int                        search_calls{0};
  int                        playable_calls{0};
  std::string                last_rail_id;
  std::string                last_query;
  std::string                last_playable_id;
  std::optional<std::string> last_cursor;
  std::uint32_t              last_limit{0};

 private:
  std::string           id_;
  content::v1::Strategy strategy_;
};

// Selector that always binds `adapter` (its id is the only installed extension).
inline std::shared_ptr<backend::StrategySelector> SelectorFor(std::shared_ptr<FakeAdapter> adapter) {
  auto registry = std::make_shared<FakeExtensionRegistry>();
  registry->Install(adapter->backend_id());

  auto locator = std::make_shared<backend::BackendLocator>(registry, std::vector<std::string>{adapter->backend_id()}, "xbmc.python.pluginsource",
                                                           std::vector<std::string>{});

  backend::AdapterRegistry adapters;
  adapters.Register(adapter->strategy(), [adapter](const std::string&) { return adapter; });
  return std::make_shared<backend::StrategySelector>(locator, std::move(adapters));
}

} // namespace vodbridge::testing
