#include "wraith_transport.h"
#include "wraith_codec.h"
#include "logger.h"
#include <curl/curl.h>
#include <chrono>

namespace {

// Callback for curl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  ((std::string*)userp)->append((char*)contents, size * nmemb);
  return size * nmemb;
}

std::once_flag curl_init_flag;

}  // namespace

WraithTransport::WraithTransport(int port, int call_timeout_ms)
    : port_(port),
      call_timeout_ms_(call_timeout_ms),
      base_url_("http://127.0.0.1:" + std::to_string(port)) {
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

BridgeResult WraithTransport::Ping(int timeout_ms) {
  return Post("/ping", "{}", "ping", timeout_ms);
}

BridgeResult WraithTransport::Create() {
  json request = {{"id", request_id_++}};
  BridgeResult result = Post("/create", request.dump(), "create", call_timeout_ms_);
  if (!result.success) {
    return result;
  }
  if (!result.value.is_string() || result.value.get<std::string>().empty()) {
    return BridgeResult::DecodeError("create");
  }
  return result;
}

BridgeResult WraithTransport::Call(const std::string& target, const std::string& member,
                                   const json& args, const std::vector<FrameSelector>& frame) {
  json request = WraithCodec::EncodeInvoke(request_id_++, target, member, args, frame);
  return Post("/invoke", request.dump(), member, call_timeout_ms_);
}

BridgeResult WraithTransport::Post(const std::string& endpoint, const std::string& body,
                                   const std::string& what, long timeout_ms) {
  std::lock_guard<std::mutex> lock(io_mutex_);

  CURL* curl = curl_easy_init();
  if (!curl) {
    LOG_ERROR("Transport", "Failed to initialize CURL");
    return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR, "Failed to initialize CURL");
  }

  std::string url = base_url_ + endpoint;
  std::string response_str;

  struct curl_slist* headers = NULL;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Connection: close");
  headers = curl_slist_append(headers, "Expect:");  // no 100-continue round trip

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_str);
  curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");
  curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe
  curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
  if (timeout_ms > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  }

  auto start = std::chrono::high_resolution_clock::now();
  CURLcode res = curl_easy_perform(curl);
  auto end = std::chrono::high_resolution_clock::now();

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  long long elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

  if (res == CURLE_OPERATION_TIMEDOUT) {
    std::string msg = what + ": no response within " + std::to_string(timeout_ms) +
                      "ms (gave up after " + std::to_string(elapsed_ms) + "ms)";
    LOG_WARN("Transport", msg);
    return BridgeResult::Failure(BridgeStatus::TIMEOUT, msg);
  }
  if (res != CURLE_OK) {
    std::string msg = what + ": " + curl_easy_strerror(res);
    // Probe failures are expected while the engine boots
    if (endpoint != "/ping") {
      LOG_ERROR("Transport", msg);
    }
    return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR, msg);
  }

  LOG_DEBUG("Transport", "POST " + endpoint + " (" + what + ") -> HTTP " +
            std::to_string(http_code) + ", " + std::to_string(body.size()) + "/" +
            std::to_string(response_str.size()) + " bytes in " +
            std::to_string(elapsed_ms) + "ms");

  if (http_code != 200 && response_str.empty()) {
    std::string msg = what + ": HTTP error " + std::to_string(http_code);
    LOG_ERROR("Transport", msg);
    return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR, msg);
  }

  BridgeResult result = WraithCodec::DecodeEnvelope(response_str, what);
  if (!result.success && result.status == BridgeStatus::REMOTE_ERROR) {
    LOG_WARN("Transport", result.message);
  }
  return result;
}
