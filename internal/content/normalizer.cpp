#include "normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::content {

namespace json = util::json;

namespace {

const std::initializer_list<std::string_view> kIdKeys       = {"asin", "id", "content_id", "contentId", "item_id"};
const std::initializer_list<std::string_view> kTitleKeys    = {"title", "name", "label", "display_title"};
const std::initializer_list<std::string_view> kPlotKeys     = {"plot", "synopsis", "description", "overview"};
const std::initializer_list<std::string_view> kYearKeys     = {"year", "release_year", "releaseYear"};
const std::initializer_list<std::string_view> kDurationKeys = {"duration_seconds", "duration", "runtime", "runtime_seconds"};
const std::initializer_list<std::string_view> kKindKeys     = {"mediatype", "content_type", "contentType", "type"};
const std::initializer_list<std::string_view> kRailIdKeys   = {"id", "rail_id", "identifier", "key"};
const std::initializer_list<std::string_view> kItemsKeys    = {"items", "entries", "titles"};
const std::initializer_list<std::string_view> kCursorKeys   = {"next_cursor", "nextPageCursor", "nextCursor", "next_token", "next"};
const std::initializer_list<std::string_view> kUrlKeys      = {"stream_url", "url", "manifest_url", "manifestUrl", "manifest", "stream"};
const std::initializer_list<std::string_view> kLicenseKeys  = {"license_key", "licenseUrl", "license_url"};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// First synonym that coerces to a non-empty string.
std::optional<std::string> FirstString(const json::Value& raw, std::initializer_list<std::string_view> keys) {
  for (auto key : keys) {
    const auto* field = json::Field(raw, key);
    if (field == nullptr) {
      continue;
    }
    if (auto s = json::AsString(*field); s && !s->empty()) {
      return s;
    }
  }
  return std::nullopt;
}

std::optional<std::int32_t> FirstInt(const json::Value& raw, std::initializer_list<std::string_view> keys) {
  for (auto key : keys) {
    if (const auto* field = json::Field(raw, key)) {
      return json::AsInt(*field);
    }
  }
  return std::nullopt;
}

// Titles are plain strings or localized maps {"default": ..., "text": ...}.
std::optional<std::string> CoalesceTitle(const json::Value& raw) {
  for (auto key : kTitleKeys) {
    const auto* field = json::Field(raw, key);
    if (field == nullptr) {
      continue;
    }
    if (json::IsStruct(*field)) {
      if (auto s = FirstString(*field, {"default", "text"})) {
        return s;
      }
      continue;
    }
    if (auto s = json::AsString(*field); s && !s->empty()) {
      return s;
    }
  }
  return std::nullopt;
}

// [false, "reason"] -> BackendError; [true, payload] -> payload.
const json::Value& UnwrapStatusTuple(const json::Value& raw) {
  if (!json::IsList(raw) || raw.list_value().values_size() != 2) {
    return raw;
  }
  const auto& head = raw.list_value().values(0);
  if (head.kind_case() != json::Value::kBoolValue) {
    return raw;
  }
  const auto& tail = raw.list_value().values(1);
  if (!head.bool_value()) {
    throw util::BackendError(json::AsString(tail).value_or("provider reported failure"));
  }
  return tail;
}

// [items, cursor|null] -> items (and the cursor when non-empty); nullptr otherwise.
const json::Value* PageTuple(const json::Value& raw, std::optional<std::string>* cursor) {
  if (!json::IsList(raw) || raw.list_value().values_size() != 2) {
    return nullptr;
  }
  const auto& items = raw.list_value().values(0);
  const auto& tail  = raw.list_value().values(1);
  if (!json::IsList(items) || !(json::IsNull(tail) || json::IsString(tail))) {
    return nullptr;
  }
  if (cursor != nullptr && json::IsString(tail) && !tail.string_value().empty()) {
    *cursor = tail.string_value();
  }
  return &items;
}

std::optional<std::string> CoalesceCursor(const json::Value& raw) {
  return FirstString(raw, kCursorKeys);
}

void FillArt(const json::Value& raw, v1::Art* art) {
  struct Slot {
    std::string_view primary;
    std::string_view alternate;
    std::string* (v1::Art::*field)();
  };
  static const Slot kSlots[] = {
      {"poster", "image", &v1::Art::mutable_poster},
      {"fanart", "background", &v1::Art::mutable_fanart},
      {"thumb", "thumbnail", &v1::Art::mutable_thumb},
  };

  const auto* nested = json::FirstField(raw, {"art", "images"});

  for (const auto& slot : kSlots) {
    std::optional<std::string> value;
    if (nested != nullptr) {
      value = FirstString(*nested, {slot.primary, slot.alternate});
    }
    if (!value) {
      value = FirstString(raw, {slot.primary, slot.alternate});
    }
    if (value) {
      *(art->*slot.field)() = std::move(*value);
    }
  }
}

void FillKind(const json::Value& raw, v1::VideoItem* item) {
  const auto kind = Lower(FirstString(raw, kKindKeys).value_or(""));

  item->set_is_movie(kind == "movie" || kind == "film");
  item->set_is_show(kind == "show" || kind == "tvshow" || kind == "series" || kind == "season");

  bool playable = !item->is_show();
  if (const auto* flag = json::FirstField(raw, {"is_playable", "playable"})) {
    playable = json::AsBool(*flag).value_or(playable);
  }
  item->set_is_playable(playable);
}

const json::Value* ItemsMember(const json::Value& raw) {
  const auto* items = json::FirstField(raw, kItemsKeys);
  return (items != nullptr && json::IsList(*items)) ? items : nullptr;
}

} // namespace

// ------------------------------------------------------------
// Items
// ------------------------------------------------------------

std::optional<v1::VideoItem> NormalizeItem(const json::Value& raw) {
  if (!json::IsStruct(raw)) {
    VODBRIDGE_LOG_DEBUG("dropping item: not an object");
    return std::nullopt;
  }

  auto id    = FirstString(raw, kIdKeys);
  auto title = CoalesceTitle(raw);
  if (!id || !title) {
    VODBRIDGE_LOG_DEBUG("dropping item: missing id or title",
                        {observability::StringField("id", id.value_or("")), observability::StringField("title", title.value_or(""))});
    return std::nullopt;
  }

  v1::VideoItem item;
  item.set_id(std::move(*id));
  item.set_title(std::move(*title));
  item.set_plot(FirstString(raw, kPlotKeys).value_or(""));

  if (auto year = FirstInt(raw, kYearKeys)) {
    item.set_year(*year);
  }
  if (auto duration = FirstInt(raw, kDurationKeys)) {
    item.set_duration_seconds(*duration);
  }

  FillArt(raw, item.mutable_art());
  FillKind(raw, &item);
  return item;
}

std::vector<v1::VideoItem> NormalizeItems(const json::Value& raw_list) {
  std::vector<v1::VideoItem> out;
  if (!json::IsList(raw_list)) {
    return out;
  }
  out.reserve(static_cast<size_t>(raw_list.list_value().values_size()));
  for (const auto& raw : raw_list.list_value().values()) {
    if (auto item = NormalizeItem(raw)) {
      out.push_back(std::move(*item));
    }
  }
  return out;
}

v1::RailPage NormalizePage(const json::Value& input) {
  const auto& raw = UnwrapStatusTuple(input);

  v1::RailPage page;

  if (json::IsNull(raw)) {
    return page;
  }

  const json::Value* items  = nullptr;
  std::optional<std::string> cursor;

  if (json::IsList(raw)) {
    items = PageTuple(raw, &cursor);
    if (items == nullptr) {
      items = &raw;
    }
  } else if (json::IsStruct(raw)) {
    items = ItemsMember(raw);
    if (items == nullptr) {
      throw util::BackendError("page payload has no item list");
    }
    cursor = CoalesceCursor(raw);
  } else {
    throw util::BackendError("page payload is neither a list nor an object");
  }

  for (auto& item : NormalizeItems(*items)) {
    *page.add_items() = std::move(item);
  }
  if (cursor) {
    page.set_next_cursor(*cursor);
  }
  return page;
}

// ------------------------------------------------------------
// Rails
// ------------------------------------------------------------

std::optional<v1::Rail> NormalizeRail(const json::Value& raw) {
  if (!json::IsStruct(raw)) {
    return std::nullopt;
  }

  auto id    = FirstString(raw, kRailIdKeys);
  auto title = CoalesceTitle(raw);
  if (!id || !title) {
    VODBRIDGE_LOG_DEBUG("dropping rail: missing id or title", {observability::StringField("id", id.value_or(""))});
    return std::nullopt;
  }

  v1::Rail rail;
  rail.set_identifier(std::move(*id));
  rail.set_title(std::move(*title));
  rail.set_content_type(FirstString(raw, {"content_type", "contentType", "type"}).value_or("videos"));

  if (const auto* items = ItemsMember(raw)) {
    for (auto& item : NormalizeItems(*items)) {
      *rail.add_items() = std::move(item);
    }
  }
  if (auto cursor = CoalesceCursor(raw)) {
    rail.set_next_cursor(*cursor);
  }
  return rail;
}

v1::RailList NormalizeRails(const json::Value& input) {
  const auto& raw = UnwrapStatusTuple(input);

  const json::Value* list = nullptr;
  if (json::IsList(raw)) {
    // a rail fetch standing in for the home view returns a page tuple
    list = PageTuple(raw, nullptr);
    if (list == nullptr) {
      list = &raw;
    }
  } else if (json::IsStruct(raw)) {
    list = json::FirstField(raw, {"rails", "items", "entries"});
    if (list == nullptr || !json::IsList(*list)) {
      throw util::BackendError("rails payload has no rail list");
    }
  } else if (json::IsNull(raw)) {
    return {};
  } else {
    throw util::BackendError("rails payload is neither a list nor an object");
  }

  v1::RailList rails;
  for (const auto& entry : list->list_value().values()) {
    if (auto rail = NormalizeRail(entry)) {
      *rails.add_rails() = std::move(*rail);
    }
  }
  return rails;
}

// ------------------------------------------------------------
// Playable
// ------------------------------------------------------------

std::string InferManifestType(const std::string& url) {
  std::string_view path = url;
  if (auto q = path.find_first_of("?#"); q != std::string_view::npos) {
    path = path.substr(0, q);
  }

  auto ends_with = [&](std::string_view suffix) {
    return path.size() >= suffix.size() && Lower(std::string(path.substr(path.size() - suffix.size()))) == suffix;
  };

  if (ends_with(".m3u8")) {
    return "hls";
  }
  if (ends_with(".ism") || Lower(std::string(path)).find(".ism/") != std::string::npos || path.ends_with("Manifest")) {
    return "ism";
  }
  return "mpd";
}

v1::Playable NormalizePlayable(const json::Value& input) {
  const auto& raw = UnwrapStatusTuple(input);

  if (!json::IsStruct(raw)) {
    throw util::BackendError("playable payload is not an object");
  }

  auto url = FirstString(raw, kUrlKeys);
  if (!url) {
    if (const auto* nested = json::FieldPath(raw, {"playbackUrls", "mainManifestUrl"})) {
      url = json::AsString(*nested);
    }
  }
  if (!url || url->empty()) {
    throw util::BackendError("playable payload has no stream url");
  }

  v1::Playable playable;
  playable.set_stream_url(*url);

  auto manifest_type = FirstString(raw, {"manifest_type", "manifestType", "type"});
  if (manifest_type) {
    auto type = Lower(*manifest_type);
    if (type == "dash") type = "mpd";
    if (type == "smooth") type = "ism";
    playable.set_manifest_type(type);
  } else {
    playable.set_manifest_type(InferManifestType(*url));
  }

  auto license = FirstString(raw, kLicenseKeys);
  if (!license) {
    if (const auto* nested = json::FieldPath(raw, {"license", "licenseUrl"})) {
      license = json::AsString(*nested);
    }
  }
  if (license && !license->empty()) {
    playable.set_license_key(*license);
  }
  playable.set_license_type(FirstString(raw, {"license_type", "licenseType", "drm_type"}).value_or("com.widevine.alpha"));

  if (const auto* headers = json::FirstField(raw, {"headers", "license_headers"}); headers && json::IsStruct(*headers)) {
    for (const auto& [name, value] : headers->struct_value().fields()) {
      if (auto s = json::AsString(value)) {
        (*playable.mutable_headers())[name] = *s;
      }
    }
  }

  if (const auto* metadata = json::FirstField(raw, {"metadata", "info"}); metadata && json::IsStruct(*metadata)) {
    *playable.mutable_metadata() = metadata->struct_value();
  }
  if (auto title = CoalesceTitle(raw)) {
    auto& fields = *playable.mutable_metadata()->mutable_fields();
    if (fields.find("title") == fields.end()) {
      fields["title"] = json::StringValue(*title);
    }
  }

  return playable;
}

} // namespace vodbridge::content
