#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/platform/module_loader.hpp"

namespace vodbridge::backend {

enum class Capability {
  kHome,
  kRail,
  kSearch,
  kPlayable,
  kRegion,
  kLogin,
  kDrm,
};

const char* CapabilityName(Capability capability);

// Capability -> candidate method names, most preferred first.
using ProbeTable = std::map<Capability, std::vector<std::string>>;

ProbeTable DefaultProbeTable();

// Config lists override the compiled candidates one capability at a time.
ProbeTable ProbeTableFromConfig(const vodbridge::runtime::config::DirectMethodsConfig& methods);

/*
  Resolves every capability against one provider object, once.

  The minimum viable surface is one rail-like method (home or rail) and one
  playback method.
*/
class CapabilityProbe {
 public:
  static CapabilityProbe Bind(const platform::ProviderObject& object, const ProbeTable& table);

  std::optional<std::string> Resolve(Capability capability) const;

  bool Has(Capability capability) const {
    return bound_.count(capability) > 0;
  }

  const std::vector<Capability>& Missing() const {
    return missing_;
  }

  bool SatisfiesMinimum() const {
    return (Has(Capability::kHome) || Has(Capability::kRail)) && Has(Capability::kPlayable);
  }

 private:
  std::map<Capability, std::string> bound_;
  std::vector<Capability>           missing_;
};

} // namespace vodbridge::backend
