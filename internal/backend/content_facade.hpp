#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/ttl_cache.hpp"
#include "strategy_selector.hpp"

namespace vodbridge::backend {

template <typename T>
struct Fetched {
  T    value;
  bool from_cache{false};
};

/*
  Uniform content API over the selected adapter.

  Every read is keyed (operation + normalized arguments), looked up in the
  TTL cache, fetched and normalized on a miss, and written back.
  force_refresh skips the lookup but still writes back.
*/
class ContentFacade {
 public:
  struct Options {
    bool          cache_enabled{true};
    std::int64_t  ttl_seconds{300};
    std::int64_t  playable_ttl_seconds{60};
    std::uint32_t rail_limit{20};
    std::uint32_t search_limit{30};
    std::string   root_rail_id{"root"};
  };

  ContentFacade(std::shared_ptr<StrategySelector> selector, std::shared_ptr<cache::TtlCache> cache, Options options);

  Fetched<content::v1::RailList> GetHomeRails(bool force_refresh = false);

  Fetched<content::v1::RailPage> GetRail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit, bool force_refresh = false);

  Fetched<content::v1::RailPage> Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit, bool force_refresh = false);

  Fetched<content::v1::Playable> GetPlayable(const std::string& id, bool force_refresh = false);

  // Uncached pass-throughs. Adapter errors read as unknown.
  content::v1::BackendDescriptor Descriptor();
  std::optional<bool>            LoginState();
  std::optional<bool>            DrmReady();
  std::optional<std::string>     Region();

  const Options& options() const {
    return options_;
  }

  // Cache keys (exposed for invalidation and tests).
  static std::string HomeKey();
  static std::string RailKey(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit);
  static std::string SearchKey(const std::string& normalized_query, const std::optional<std::string>& cursor, std::uint32_t limit);
  static std::string PlayableKey(const std::string& id);

  // Trimmed, inner whitespace collapsed, lower-cased.
  static std::string NormalizeQuery(const std::string& query);

 private:
  template <typename Message>
  Fetched<Message> Cached(const char* route, const std::string& key, std::int64_t ttl_seconds, bool force_refresh, const std::function<Message()>& load);

  std::shared_ptr<StrategySelector> selector_;
  std::shared_ptr<cache::TtlCache>  cache_;
  Options                           options_;
};

} // namespace vodbridge::backend
