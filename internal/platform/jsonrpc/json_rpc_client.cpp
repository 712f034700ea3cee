#include "json_rpc_client.hpp"

#include <curl/curl.h>

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::platform::jsonrpc {

namespace {

std::once_flag g_curl_init;

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// Owns the easy handle and header list of one request.
struct CurlRequest {
  CURL*              handle{nullptr};
  struct curl_slist* headers{nullptr};

  CurlRequest() : handle(curl_easy_init()) {
  }

  ~CurlRequest() {
    if (headers) curl_slist_free_all(headers);
    if (handle) curl_easy_cleanup(handle);
  }

  CurlRequest(const CurlRequest&)            = delete;
  CurlRequest& operator=(const CurlRequest&) = delete;
};

} // namespace

JsonRpcClient::JsonRpcClient(const vodbridge::runtime::config::HostConfig& config)
    : url_(config.jsonrpc_url()), username_(config.username()), password_(config.password()), timeout_ms_(static_cast<long>(config.timeout_ms())) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

util::json::Value JsonRpcClient::Call(const std::string& method, const util::json::Struct& params) {
  observability::TraceSpan span("jsonrpc.call");
  span.Tag("rpc.method", std::string_view(method));

  util::json::Value request;
  auto&             fields = *request.mutable_struct_value()->mutable_fields();
  fields["jsonrpc"]        = util::json::StringValue("2.0");
  fields["id"]             = util::json::NumberValue(static_cast<double>(next_id_.fetch_add(1)));
  fields["method"]         = util::json::StringValue(method);
  *fields["params"].mutable_struct_value() = params;

  const std::string body = Post(util::json::Serialize(request));

  auto envelope = util::json::Parse(body);
  if (!envelope || !util::json::IsStruct(*envelope)) {
    span.MarkFailed("invalid response body");
    throw util::TransportError("jsonrpc " + method + ": response is not a JSON object");
  }
  return *envelope;
}

std::string JsonRpcClient::Post(const std::string& body) {
  CurlRequest req;
  if (!req.handle) {
    throw util::TransportError("jsonrpc: failed to init curl");
  }

  std::string response;

  curl_easy_setopt(req.handle, CURLOPT_URL, url_.c_str());
  curl_easy_setopt(req.handle, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(req.handle, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(req.handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(req.handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(req.handle, CURLOPT_WRITEDATA, &response);

  req.headers = curl_slist_append(req.headers, "Content-Type: application/json");
  req.headers = curl_slist_append(req.headers, "Accept: application/json");
  curl_easy_setopt(req.handle, CURLOPT_HTTPHEADER, req.headers);

  if (!username_.empty()) {
    curl_easy_setopt(req.handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(req.handle, CURLOPT_USERNAME, username_.c_str());
    curl_easy_setopt(req.handle, CURLOPT_PASSWORD, password_.c_str());
  }

  curl_easy_setopt(req.handle, CURLOPT_POST, 1L);
  curl_easy_setopt(req.handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(req.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  const CURLcode res = curl_easy_perform(req.handle);
  if (res != CURLE_OK) {
    VODBRIDGE_LOG_ERROR("jsonrpc request failed",
                        {observability::StringField("url", url_), observability::StringField("error", curl_easy_strerror(res))});
    throw util::TransportError(std::string("jsonrpc: ") + curl_easy_strerror(res));
  }

  long http_code = 0;
  curl_easy_getinfo(req.handle, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    VODBRIDGE_LOG_ERROR("jsonrpc bad http status", {observability::StringField("url", url_), observability::IntField("status", http_code)});
    throw util::TransportError("jsonrpc: http status " + std::to_string(http_code));
  }

  return response;
}

std::string EnvelopeError(const util::json::Value& envelope) {
  const auto* error = util::json::Field(envelope, "error");
  if (error == nullptr) {
    return {};
  }
  if (const auto* message = util::json::Field(*error, "message")) {
    if (auto text = util::json::AsString(*message); text && !text->empty()) {
      return *text;
    }
  }
  if (auto text = util::json::AsString(*error); text && !text->empty()) {
    return *text;
  }
  return "unspecified error";
}

} // namespace vodbridge::platform::jsonrpc
