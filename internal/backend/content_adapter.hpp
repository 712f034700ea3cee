#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/json.hpp"
#include "vodbridge/content/v1.hpp"

namespace vodbridge::backend {

/*
  One communication strategy bound to one provider extension.

  Content operations return the provider's raw payload; the facade
  normalizes it. Failures:
    util::BackendError        malformed / error-flagged response
    util::BackendUnavailable  the provider can no longer be reached
*/
class ContentAdapter {
 public:
  virtual ~ContentAdapter() = default;

  virtual content::v1::Strategy strategy() const   = 0;
  virtual const std::string&    backend_id() const = 0;

  virtual util::json::Value HomeRails()                                                                                    = 0;
  virtual util::json::Value Rail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) = 0;
  virtual util::json::Value Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit) = 0;
  virtual util::json::Value Playable(const std::string& id)                                                                = 0;

  // nullopt = unknown
  virtual std::optional<std::string> Region()     = 0;
  virtual std::optional<bool>        LoginState() = 0;
  virtual std::optional<bool>        DrmReady()   = 0;
};

const char* StrategyName(content::v1::Strategy strategy);

// "direct" / "rpc"; nullopt for anything else.
std::optional<content::v1::Strategy> ParseStrategy(const std::string& name);

} // namespace vodbridge::backend
