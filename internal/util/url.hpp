#pragma once

#include <map>
#include <string>
#include <string_view>

namespace vodbridge::util {

// RFC 3986 unreserved characters pass through; everything else is %XX.
std::string PercentEncode(std::string_view in);

// '+' decodes to a space; malformed escapes are kept verbatim.
std::string PercentDecode(std::string_view in);

// Decoded query parameters of a URI ("plugin://id/?a=1&b=2").
std::map<std::string, std::string> QueryParams(std::string_view uri);

} // namespace vodbridge::util
