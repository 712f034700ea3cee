#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "vodbridge/content/v1/cache.pb.h"

namespace vodbridge::cache {

/*
  Persistent TTL cache.

  One JSON document (content::v1::CacheEntry) per logical key at
  <root>/<fnv1a64-hex(key)>.json. Writes are atomic (tmp + rename).
  Expired, unreadable and colliding documents read as misses; corrupt ones
  are evicted on sight.

  All operations are serialized by one mutex.
*/
class TtlCache {
 public:
  explicit TtlCache(std::filesystem::path root, util::ClockFn clock = util::Now);

  std::optional<util::json::Value> Get(const std::string& key, std::int64_t ttl_seconds);

  // Throws std::runtime_error when the document cannot be written.
  void Set(const std::string& key, const util::json::Value& value, std::int64_t ttl_seconds);

  bool Remove(const std::string& key);

  // Evicts every document whose logical key starts with `prefix`.
  std::size_t ClearPrefix(const std::string& prefix);

  std::size_t ClearAll();

  std::filesystem::path PathFor(const std::string& key) const;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::optional<content::v1::CacheEntry> ReadEntry(const std::filesystem::path& path) const;
  void                                   Evict(const std::filesystem::path& path) const;

  std::filesystem::path root_;
  util::ClockFn         clock_;
  mutable std::mutex    mutex_;
};

} // namespace vodbridge::cache
