#include "content_facade.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

#include "internal/content/normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"

namespace vodbridge::backend {

namespace json = util::json;

namespace {

std::string Trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  const auto last  = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return first < last ? std::string(first, last) : std::string{};
}

// Absent cursor is "-"; a present one is "@" + encoded value. PercentEncode
// escapes ':' and '@', so every field boundary in a key is unambiguous.
std::string CursorField(const std::optional<std::string>& cursor) {
  return cursor ? "@" + util::PercentEncode(*cursor) : std::string("-");
}

std::optional<std::string> NonEmpty(const std::optional<std::string>& cursor) {
  if (cursor && !cursor->empty()) {
    return cursor;
  }
  return std::nullopt;
}

} // namespace

ContentFacade::ContentFacade(std::shared_ptr<StrategySelector> selector, std::shared_ptr<cache::TtlCache> cache, Options options)
    : selector_(std::move(selector)), cache_(std::move(cache)), options_(std::move(options)) {
}

// ------------------------------------------------------------
// Keys
// ------------------------------------------------------------

std::string ContentFacade::HomeKey() {
  return "home:rails";
}

std::string ContentFacade::RailKey(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit) {
  return "rail:" + util::PercentEncode(rail_id) + ":" + CursorField(cursor) + ":" + std::to_string(limit);
}

std::string ContentFacade::SearchKey(const std::string& normalized_query, const std::optional<std::string>& cursor, std::uint32_t limit) {
  return "search:" + util::PercentEncode(normalized_query) + ":" + CursorField(cursor) + ":" + std::to_string(limit);
}

std::string ContentFacade::PlayableKey(const std::string& id) {
  return "playable:" + util::PercentEncode(id);
}

std::string ContentFacade::NormalizeQuery(const std::string& query) {
  std::string out;
  bool        pending_space = false;
  for (unsigned char c : Trim(query)) {
    if (std::isspace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

// ------------------------------------------------------------
// Cache wrapper
// ------------------------------------------------------------

template <typename Message>
Fetched<Message> ContentFacade::Cached(const char* route, const std::string& key, std::int64_t ttl_seconds, bool force_refresh, const std::function<Message()>& load) {
  observability::TraceSpan span(std::string("facade.") + route);
  span.Tag("cache.key", std::string_view(key));

  auto&      metrics = observability::Metrics::Instance();
  const auto start   = util::SteadyNow();

  if (options_.cache_enabled && !force_refresh) {
    if (auto cached = cache_->Get(key, ttl_seconds)) {
      Message message;
      if (json::ValueToMessage(*cached, &message)) {
        metrics.RecordCacheLookup(route, true);
        metrics.RecordContentRequest(route, true, util::ElapsedMs(start, util::SteadyNow()));
        span.Tag("cache.hit", true);
        return {std::move(message), true};
      }
      VODBRIDGE_LOG_WARN("cached document does not decode, evicting", {observability::StringField("key", key)});
      cache_->Remove(key);
    }
    metrics.RecordCacheLookup(route, false);
  }
  span.Tag("cache.hit", false);

  Message message;
  try {
    message = load();
  } catch (const std::exception& e) {
    metrics.RecordContentRequest(route, false, util::ElapsedMs(start, util::SteadyNow()));
    span.MarkFailed(e.what());
    throw;
  }

  if (options_.cache_enabled) {
    try {
      cache_->Set(key, json::MessageToValue(message), ttl_seconds);
    } catch (const std::exception& e) {
      VODBRIDGE_LOG_WARN("cache write failed", {observability::StringField("key", key), observability::StringField("error", e.what())});
    }
  }

  metrics.RecordContentRequest(route, true, util::ElapsedMs(start, util::SteadyNow()));
  return {std::move(message), false};
}

// ------------------------------------------------------------
// Content operations
// ------------------------------------------------------------

Fetched<content::v1::RailList> ContentFacade::GetHomeRails(bool force_refresh) {
  return Cached<content::v1::RailList>("home_rails", HomeKey(), options_.ttl_seconds, force_refresh, [this] {
    return content::NormalizeRails(selector_->Get()->HomeRails());
  });
}

Fetched<content::v1::RailPage> ContentFacade::GetRail(const std::string& rail_id, const std::optional<std::string>& cursor, std::uint32_t limit, bool force_refresh) {
  const std::string   id        = rail_id.empty() ? options_.root_rail_id : rail_id;
  const auto          page      = NonEmpty(cursor);
  const std::uint32_t effective = limit > 0 ? limit : options_.rail_limit;

  return Cached<content::v1::RailPage>("rail", RailKey(id, page, effective), options_.ttl_seconds, force_refresh, [&] {
    return content::NormalizePage(selector_->Get()->Rail(id, page, effective));
  });
}

Fetched<content::v1::RailPage> ContentFacade::Search(const std::string& query, const std::optional<std::string>& cursor, std::uint32_t limit, bool force_refresh) {
  const std::string trimmed = Trim(query);
  if (trimmed.empty()) {
    return {content::v1::RailPage{}, false};
  }

  const auto          page      = NonEmpty(cursor);
  const std::uint32_t effective = limit > 0 ? limit : options_.search_limit;

  return Cached<content::v1::RailPage>("search", SearchKey(NormalizeQuery(trimmed), page, effective), options_.ttl_seconds, force_refresh, [&] {
    return content::NormalizePage(selector_->Get()->Search(trimmed, page, effective));
  });
}

Fetched<content::v1::Playable> ContentFacade::GetPlayable(const std::string& id, bool force_refresh) {
  if (id.empty()) {
    throw std::invalid_argument("playable id is required");
  }

  return Cached<content::v1::Playable>("playable", PlayableKey(id), options_.playable_ttl_seconds, force_refresh, [&] {
    return content::NormalizePlayable(selector_->Get()->Playable(id));
  });
}

// ------------------------------------------------------------
// Pass-throughs
// ------------------------------------------------------------

content::v1::BackendDescriptor ContentFacade::Descriptor() {
  auto adapter = selector_->Get();

  content::v1::BackendDescriptor descriptor;
  descriptor.set_candidate_id(adapter->backend_id());
  descriptor.set_strategy(adapter->strategy());
  return descriptor;
}

std::optional<bool> ContentFacade::LoginState() {
  auto adapter = selector_->Get();
  try {
    return adapter->LoginState();
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_WARN("login state query failed", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<bool> ContentFacade::DrmReady() {
  auto adapter = selector_->Get();
  try {
    return adapter->DrmReady();
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_WARN("drm status query failed", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<std::string> ContentFacade::Region() {
  auto adapter = selector_->Get();
  try {
    return adapter->Region();
  } catch (const util::BackendError& e) {
    VODBRIDGE_LOG_WARN("region query failed", {observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace vodbridge::backend
