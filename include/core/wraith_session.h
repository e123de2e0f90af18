#ifndef WRAITH_SESSION_H_
#define WRAITH_SESSION_H_

#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>

#include "wraith_page_registry.h"
#include "wraith_status.h"
#include "wraith_transport.h"

using json = nlohmann::json;

// Liveness of an engine process
enum class ProcessState {
  UNOPENED,
  OPEN,
  CLOSED
};

inline const char* ProcessStateToString(ProcessState state) {
  switch (state) {
    case ProcessState::UNOPENED: return "unopened";
    case ProcessState::OPEN: return "open";
    case ProcessState::CLOSED: return "closed";
    default: return "unknown";
  }
}

// Which frame a page call is evaluated in
enum class FrameScope {
  TOP_LEVEL,  // the page's main document
  CURRENT     // the frame selected through the page's frame context
};

// State shared by one opened engine process and every page handle derived
// from it. A session is created by a successful WraithProcess::Open and
// only ever moves from OPEN to CLOSED; re-opening the process creates a new
// session, so handles from the old one stay invalid.
class WraithSession {
 public:
  WraithSession(std::unique_ptr<WraithTransport> transport, pid_t pid,
                const std::string& script_dir, int shutdown_timeout_ms);
  ~WraithSession();

  WraithSession(const WraithSession&) = delete;
  WraithSession& operator=(const WraithSession&) = delete;

  ProcessState GetState() const;
  bool IsOpen() const { return GetState() == ProcessState::OPEN; }
  pid_t GetPid() const { return pid_; }

  // Ask the engine for a new top-level page. REGISTRY_ERROR when closed.
  BridgeResult CreatePage(PageId& id);

  // Call |member| on page |id|. Fails with INVALID_HANDLE when the session
  // or the page is closed; a TRANSPORT_ERROR terminates the session.
  BridgeResult Invoke(PageId id, const std::string& member, const json& args,
                      FrameScope scope = FrameScope::TOP_LEVEL);

  // Same as Invoke with an explicit frame path
  BridgeResult InvokeInFrame(PageId id, const std::string& member, const json& args,
                             const std::vector<FrameSelector>& frame_path);

  // Move to CLOSED and tear down the engine. Returns false when the session
  // was already closed. Does not wait for an in-flight call.
  bool Terminate(const std::string& reason);

  WraithPageRegistry& Registry() { return registry_; }

 private:
  std::unique_ptr<WraithTransport> transport_;
  WraithPageRegistry registry_;
  pid_t pid_;
  std::string script_dir_;
  int shutdown_timeout_ms_;

  mutable std::mutex state_mutex_;
  ProcessState state_ = ProcessState::OPEN;

  // One outstanding call at a time
  std::mutex call_mutex_;

  BridgeResult InvokeLocked(const PageRecord& record, const std::string& member,
                            const json& args, const std::vector<FrameSelector>& frame_path);
};

#endif  // WRAITH_SESSION_H_
