#include "wraith_session.h"
#include "wraith_platform_utils.h"
#include "logger.h"

WraithSession::WraithSession(std::unique_ptr<WraithTransport> transport, pid_t pid,
                             const std::string& script_dir, int shutdown_timeout_ms)
    : transport_(std::move(transport)),
      pid_(pid),
      script_dir_(script_dir),
      shutdown_timeout_ms_(shutdown_timeout_ms) {}

WraithSession::~WraithSession() {
  Terminate("session released");
}

ProcessState WraithSession::GetState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool WraithSession::Terminate(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ProcessState::OPEN) {
      return false;
    }
    state_ = ProcessState::CLOSED;
  }

  // Handles are invalid from here on, before the engine is gone
  registry_.InvalidateAll();

  LOG_INFO("Process", "Closing engine pid " + std::to_string(pid_) + " (" + reason + ")");

  if (!WraithPlatform::TerminateChild(pid_, shutdown_timeout_ms_)) {
    LOG_ERROR("Process", "Failed to reap engine pid " + std::to_string(pid_));
  }
  if (!WraithPlatform::RemoveDirectoryTree(script_dir_)) {
    LOG_WARN("Process", "Failed to remove " + script_dir_);
  }
  return true;
}

BridgeResult WraithSession::CreatePage(PageId& id) {
  std::lock_guard<std::mutex> call_lock(call_mutex_);

  if (!IsOpen()) {
    return BridgeResult::Failure(BridgeStatus::REGISTRY_ERROR,
                                 "Cannot create a page: process is not open");
  }

  BridgeResult result = transport_->Create();
  if (!result.success) {
    if (result.status == BridgeStatus::TRANSPORT_ERROR) {
      Terminate("transport failure during create");
    }
    return result;
  }

  id = registry_.Register(result.value.get<std::string>(), 0, "");
  LOG_DEBUG("Registry", "Created page " + std::to_string(id));
  return BridgeResult::Success();
}

BridgeResult WraithSession::Invoke(PageId id, const std::string& member, const json& args,
                                   FrameScope scope) {
  std::lock_guard<std::mutex> call_lock(call_mutex_);

  if (!IsOpen()) {
    return BridgeResult::InvalidHandle("process is closed");
  }

  PageRecord record;
  if (!registry_.Get(id, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  if (!record.open) {
    return BridgeResult::InvalidHandle("page is closed");
  }

  if (scope == FrameScope::CURRENT) {
    return InvokeLocked(record, member, args, record.frame.Path());
  }
  return InvokeLocked(record, member, args, {});
}

BridgeResult WraithSession::InvokeInFrame(PageId id, const std::string& member, const json& args,
                                          const std::vector<FrameSelector>& frame_path) {
  std::lock_guard<std::mutex> call_lock(call_mutex_);

  if (!IsOpen()) {
    return BridgeResult::InvalidHandle("process is closed");
  }

  PageRecord record;
  if (!registry_.Get(id, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  if (!record.open) {
    return BridgeResult::InvalidHandle("page is closed");
  }

  return InvokeLocked(record, member, args, frame_path);
}

BridgeResult WraithSession::InvokeLocked(const PageRecord& record, const std::string& member,
                                         const json& args,
                                         const std::vector<FrameSelector>& frame_path) {
  BridgeResult result = transport_->Call(record.remote_ref, member, args, frame_path);

  if (result.status == BridgeStatus::TRANSPORT_ERROR) {
    // A Close racing with this call already moved us to CLOSED
    if (Terminate("transport failure in " + member)) {
      LOG_ERROR("Process", "Engine connection lost: " + result.message);
    }
  }
  return result;
}
