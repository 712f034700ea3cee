#pragma once

#include <optional>
#include <vector>

#include "internal/util/json.hpp"
#include "vodbridge/content/v1.hpp"

namespace vodbridge::content {

/*
  Pure mapping from provider-shaped JSON to the canonical schema.

  Every canonical field is coalesced from an ordered list of raw key
  synonyms. Records without an id or a title never leave this module.
  Shape errors (not a list, not a map, status tuple [false, "reason"])
  raise util::BackendError; individual bad records are dropped.
*/

std::optional<v1::VideoItem> NormalizeItem(const util::json::Value& raw);

std::vector<v1::VideoItem> NormalizeItems(const util::json::Value& raw_list);

// Accepts a bare list, a map {items|entries|titles, <cursor>} or an [items, cursor] tuple.
v1::RailPage NormalizePage(const util::json::Value& raw);

std::optional<v1::Rail> NormalizeRail(const util::json::Value& raw);

// Accepts a list of rails or a map {rails|items|entries: [...]}.
v1::RailList NormalizeRails(const util::json::Value& raw);

// stream_url is mandatory; its absence raises util::BackendError.
v1::Playable NormalizePlayable(const util::json::Value& raw);

// "hls" / "ism" / "mpd" from the manifest URL.
std::string InferManifestType(const std::string& url);

} // namespace vodbridge::content
