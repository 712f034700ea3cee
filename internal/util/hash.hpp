#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vodbridge::util {

/*
  Stable (build- and process-independent) string digest.
  Used to derive cache file names from logical keys.
*/

std::uint64_t Fnv1a64(std::string_view data);

// 16 lowercase hex characters.
std::string Fnv1a64Hex(std::string_view data);

} // namespace vodbridge::util
