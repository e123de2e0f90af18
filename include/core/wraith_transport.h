#ifndef WRAITH_TRANSPORT_H_
#define WRAITH_TRANSPORT_H_

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "wraith_frame_context.h"
#include "wraith_status.h"

using json = nlohmann::json;

// Synchronous request/response channel to the engine's control endpoint.
//
// Each exchange is one HTTP POST with a JSON body to
// http://127.0.0.1:<port>/<endpoint>. There are no retries: a connection
// fault is reported as TRANSPORT_ERROR straight away, an "error" envelope as
// REMOTE_ERROR. At most one exchange is in flight per transport.
class WraithTransport {
 public:
  // |call_timeout_ms| == 0 waits for the engine without limit
  WraithTransport(int port, int call_timeout_ms);
  ~WraithTransport() = default;

  WraithTransport(const WraithTransport&) = delete;
  WraithTransport& operator=(const WraithTransport&) = delete;

  // Liveness probe. Bounded by |timeout_ms| regardless of the call timeout.
  BridgeResult Ping(int timeout_ms);

  // Ask the engine for a new page object; value is its remote ref (string)
  BridgeResult Create();

  // Invoke |member| on the object |target|, inside |frame| (empty = top level)
  BridgeResult Call(const std::string& target, const std::string& member,
                    const json& args = json::array(),
                    const std::vector<FrameSelector>& frame = {});

  int GetPort() const { return port_; }
  const std::string& GetBaseURL() const { return base_url_; }

 private:
  int port_;
  int call_timeout_ms_;
  std::string base_url_;

  std::atomic<int> request_id_{1};
  std::mutex io_mutex_;

  BridgeResult Post(const std::string& endpoint, const std::string& body,
                    const std::string& what, long timeout_ms);
};

#endif  // WRAITH_TRANSPORT_H_
