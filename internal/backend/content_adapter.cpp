#include "content_adapter.hpp"

namespace vodbridge::backend {

const char* StrategyName(content::v1::Strategy strategy) {
  switch (strategy) {
    case content::v1::STRATEGY_DIRECT:
      return "direct";
    case content::v1::STRATEGY_RPC:
      return "rpc";
    default:
      return "unspecified";
  }
}

std::optional<content::v1::Strategy> ParseStrategy(const std::string& name) {
  if (name == "direct") return content::v1::STRATEGY_DIRECT;
  if (name == "rpc") return content::v1::STRATEGY_RPC;
  return std::nullopt;
}

} // namespace vodbridge::backend
