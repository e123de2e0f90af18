#ifndef WRAITH_PROCESS_H_
#define WRAITH_PROCESS_H_

#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

#include "wraith_config.h"
#include "wraith_session.h"
#include "wraith_status.h"
#include "wraith_web_page.h"

// Supervisor for one headless engine subprocess.
//
// Open() starts the engine with the embedded control script and waits until
// its control endpoint answers; Close() stops it. Pages are created through
// CreateWebPage() and stay usable until they, or the process, are closed.
// A closed process can be opened again; handles from the earlier run stay
// invalid.
class WraithProcess {
 public:
  WraithProcess();
  explicit WraithProcess(const ProcessConfig& config);
  ~WraithProcess();

  WraithProcess(const WraithProcess&) = delete;
  WraithProcess& operator=(const WraithProcess&) = delete;

  // Launch the engine and block until it is ready or the readiness timeout
  // elapses. Never leaves a child process behind on failure.
  BridgeResult Open();

  // Stop the engine. ALREADY_CLOSED when it is not open.
  BridgeResult Close();

  // New top-level page. REGISTRY_ERROR unless the process is open.
  BridgeResult CreateWebPage(WraithWebPage& page);

  ProcessState GetState() const;
  bool IsOpen() const { return GetState() == ProcessState::OPEN; }

  // Directory holding the control script; the engine's default library path
  std::string Path() const;
  int Port() const;
  std::string URL() const;
  pid_t Pid() const;
  std::string InstanceId() const;
  std::string EnginePath() const;
  const ProcessConfig& GetConfig() const { return config_; }

 private:
  ProcessConfig config_;

  mutable std::mutex mutex_;
  std::shared_ptr<WraithSession> session_;
  std::string script_dir_;
  std::string engine_path_;
  std::string instance_id_;
  int port_ = 0;
  pid_t pid_ = -1;

  std::string ResolveEngine() const;
  std::vector<std::string> BuildArgs(const std::string& script_path) const;
  BridgeResult WaitForReady(WraithTransport& transport, pid_t pid);
  void AbortLaunch(pid_t pid, const std::string& dir);
};

#endif  // WRAITH_PROCESS_H_
