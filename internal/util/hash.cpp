#include "hash.hpp"

#include <iomanip>
#include <sstream>

namespace vodbridge::util {

std::uint64_t Fnv1a64(std::string_view data) {
  constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
  constexpr std::uint64_t kPrime       = 0x100000001b3ULL;

  std::uint64_t hash = kOffsetBasis;
  for (char c : data) {
    hash ^= static_cast<std::uint8_t>(c);
    hash *= kPrime;
  }
  return hash;
}

std::string Fnv1a64Hex(std::string_view data) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << Fnv1a64(data);
  return oss.str();
}

} // namespace vodbridge::util
