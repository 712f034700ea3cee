#include "session_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace vodbridge::platform {

FileSessionStore::FileSessionStore(std::string path) : path_(std::move(path)) {
}

bool FileSessionStore::HasSession() {
  std::error_code ec;
  if (path_.empty() || !std::filesystem::is_regular_file(path_, ec)) {
    return false;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  const auto doc = util::json::Parse(buffer.str());
  if (!doc || !util::json::IsStruct(*doc)) {
    VODBRIDGE_LOG_WARN("session file is not a JSON object", {observability::StringField("path", path_)});
    return false;
  }

  const auto* cookies = util::json::Field(*doc, "cookies");
  return cookies != nullptr && util::json::IsStruct(*cookies) && cookies->struct_value().fields_size() > 0;
}

} // namespace vodbridge::platform
