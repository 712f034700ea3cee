#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/util/json.hpp"

namespace vodbridge::platform::jsonrpc {

/*
  Minimal JSON-RPC 2.0 client over HTTP POST (libcurl).

  Call() returns the full response envelope ({"result": ...} or
  {"error": ...}); only transport-level failures throw (util::TransportError).
  Thread-safe: every call uses its own easy handle.
*/
class JsonRpcClient {
 public:
  explicit JsonRpcClient(const vodbridge::runtime::config::HostConfig& config);

  util::json::Value Call(const std::string& method, const util::json::Struct& params);

  const std::string& url() const {
    return url_;
  }

 private:
  std::string Post(const std::string& body);

  std::string                url_;
  std::string                username_;
  std::string                password_;
  long                       timeout_ms_;
  std::atomic<std::uint64_t> next_id_{1};
};

// Error message of an envelope's "error" member; empty when there is none.
std::string EnvelopeError(const util::json::Value& envelope);

} // namespace vodbridge::platform::jsonrpc
