#include "capability_probe.hpp"

namespace vodbridge::backend {

namespace {

using google::protobuf::RepeatedPtrField;

void Override(ProbeTable* table, Capability capability, const RepeatedPtrField<std::string>& names) {
  if (!names.empty()) {
    (*table)[capability] = std::vector<std::string>(names.begin(), names.end());
  }
}

} // namespace

const char* CapabilityName(Capability capability) {
  switch (capability) {
    case Capability::kHome:
      return "home";
    case Capability::kRail:
      return "rail";
    case Capability::kSearch:
      return "search";
    case Capability::kPlayable:
      return "playable";
    case Capability::kRegion:
      return "region";
    case Capability::kLogin:
      return "login";
    case Capability::kDrm:
      return "drm";
  }
  return "unknown";
}

ProbeTable DefaultProbeTable() {
  return {
      {Capability::kHome, {"get_home_rails", "home_rails", "get_home", "BuildRoot"}},
      {Capability::kRail, {"get_rail_items", "get_rail", "fetch_rail", "Browse", "browse"}},
      {Capability::kSearch, {"search", "Search", "do_search"}},
      {Capability::kPlayable, {"get_playable", "GetStream", "get_stream", "playback"}},
      {Capability::kRegion, {"get_region", "region", "GetRegion"}},
      {Capability::kLogin, {"is_logged_in", "isLoggedIn", "logged_in"}},
      {Capability::kDrm, {"is_drm_ready", "drm_ready", "check_drm"}},
  };
}

ProbeTable ProbeTableFromConfig(const vodbridge::runtime::config::DirectMethodsConfig& methods) {
  auto table = DefaultProbeTable();
  Override(&table, Capability::kHome, methods.home());
  Override(&table, Capability::kRail, methods.rail());
  Override(&table, Capability::kSearch, methods.search());
  Override(&table, Capability::kPlayable, methods.playable());
  Override(&table, Capability::kRegion, methods.region());
  Override(&table, Capability::kLogin, methods.login());
  Override(&table, Capability::kDrm, methods.drm());
  return table;
}

CapabilityProbe CapabilityProbe::Bind(const platform::ProviderObject& object, const ProbeTable& table) {
  CapabilityProbe probe;
  for (const auto& [capability, candidates] : table) {
    bool found = false;
    for (const auto& name : candidates) {
      if (object.HasMethod(name)) {
        probe.bound_[capability] = name;
        found                    = true;
        break;
      }
    }
    if (!found) {
      probe.missing_.push_back(capability);
    }
  }
  return probe;
}

std::optional<std::string> CapabilityProbe::Resolve(Capability capability) const {
  auto it = bound_.find(capability);
  if (it == bound_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace vodbridge::backend
