#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/util/json.hpp"

namespace vodbridge::platform {

// One row of a host directory listing.
struct DirectoryEntry {
  std::string            label;
  std::string            file;
  std::string            plot;
  util::json::Value      art;
  util::json::Value      stream_details;
  util::json::Value      resume;
  bool                   is_folder{false};
};

/*
  Indirect channel to an extension, mediated by the host.

  ExecuteAction returns the raw response envelope; decoding it is the
  caller's job. Transport failures throw util::TransportError.
*/
class RpcExecutor {
 public:
  virtual ~RpcExecutor() = default;

  virtual std::vector<DirectoryEntry> ListDirectory(const std::string& uri) = 0;

  virtual util::json::Value ExecuteAction(const std::string& extension_id, const std::map<std::string, std::string>& params) = 0;
};

} // namespace vodbridge::platform
