#include "ttl_cache.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"

namespace vodbridge::cache {

namespace {

constexpr const char* kSuffix = ".json";

bool IsCacheDocument(const std::filesystem::directory_entry& entry) {
  return entry.is_regular_file() && entry.path().extension() == kSuffix;
}

} // namespace

TtlCache::TtlCache(std::filesystem::path root, util::ClockFn clock) : root_(std::move(root)), clock_(std::move(clock)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    VODBRIDGE_LOG_WARN("cache root not created", {observability::StringField("root", root_.string()), observability::StringField("error", ec.message())});
  }
}

std::filesystem::path TtlCache::PathFor(const std::string& key) const {
  return root_ / (util::Fnv1a64Hex(key) + kSuffix);
}

// ------------------------------------------------------------
// Document IO
// ------------------------------------------------------------

std::optional<content::v1::CacheEntry> TtlCache::ReadEntry(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  const auto doc = util::json::Parse(buffer.str());
  if (!doc) {
    return std::nullopt;
  }

  content::v1::CacheEntry entry;
  if (!util::json::ValueToMessage(*doc, &entry)) {
    return std::nullopt;
  }
  return entry;
}

void TtlCache::Evict(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    VODBRIDGE_LOG_WARN("cache eviction failed", {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

// ------------------------------------------------------------
// Get / Set
// ------------------------------------------------------------

std::optional<util::json::Value> TtlCache::Get(const std::string& key, std::int64_t ttl_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto      path = PathFor(key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  auto entry = ReadEntry(path);
  if (!entry) {
    VODBRIDGE_LOG_WARN("evicting corrupt cache document", {observability::StringField("key", key)});
    Evict(path);
    return std::nullopt;
  }

  // hash collision: the slot belongs to another key
  if (entry->key() != key) {
    return std::nullopt;
  }

  const double age = util::ToUnixSeconds(clock_()) - entry->timestamp();
  if (age > static_cast<double>(ttl_seconds)) {
    Evict(path);
    return std::nullopt;
  }

  return std::move(*entry->mutable_data());
}

void TtlCache::Set(const std::string& key, const util::json::Value& value, std::int64_t ttl_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);

  content::v1::CacheEntry entry;
  entry.set_key(key);
  entry.set_timestamp(util::ToUnixSeconds(clock_()));
  entry.set_ttl_seconds(ttl_seconds);
  *entry.mutable_data() = value;

  const std::string body = util::json::Serialize(entry);

  std::filesystem::create_directories(root_);

  /*
    write tmp → flush → rename
  */
  const auto final_path = PathFor(key);
  const auto tmp_path   = final_path.string() + ".tmp";
  try {
    {
      std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw std::runtime_error("cache: cannot open " + tmp_path);
      }
      out << body;
      out.flush();
      if (!out) {
        throw std::runtime_error("cache: write failed for " + tmp_path);
      }
    }
    std::filesystem::rename(tmp_path, final_path);
  } catch (const std::exception&) {
    // never leave a partial document behind
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

bool TtlCache::Remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto path  = PathFor(key);
  auto       entry = ReadEntry(path);
  if (entry && entry->key() != key) {
    return false;
  }

  std::error_code ec;
  return std::filesystem::remove(path, ec);
}

std::size_t TtlCache::ClearPrefix(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return 0;
  }

  std::vector<std::filesystem::path> doomed;
  for (const auto& dirent : std::filesystem::directory_iterator(root_, ec)) {
    if (!IsCacheDocument(dirent)) {
      continue;
    }
    auto entry = ReadEntry(dirent.path());
    if (!entry) {
      // unreadable documents cannot be attributed to a key; drop them
      Evict(dirent.path());
      continue;
    }
    if (entry->key().rfind(prefix, 0) == 0) {
      doomed.push_back(dirent.path());
    }
  }

  std::size_t removed = 0;
  for (const auto& path : doomed) {
    if (std::filesystem::remove(path, ec)) {
      ++removed;
    }
  }

  VODBRIDGE_LOG_DEBUG("cache prefix cleared", {observability::StringField("prefix", prefix), observability::IntField("removed", static_cast<std::int64_t>(removed))});
  return removed;
}

std::size_t TtlCache::ClearAll() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return 0;
  }

  std::vector<std::filesystem::path> doomed;
  for (const auto& dirent : std::filesystem::directory_iterator(root_, ec)) {
    if (IsCacheDocument(dirent)) {
      doomed.push_back(dirent.path());
    }
  }

  std::size_t removed = 0;
  for (const auto& path : doomed) {
    if (std::filesystem::remove(path, ec)) {
      ++removed;
    }
  }
  return removed;
}

} // namespace vodbridge::cache
