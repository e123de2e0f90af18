#include "wraith_process.h"
#include "wraith_platform_utils.h"
#include "wraith_shim_script.h"
#include "logger.h"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

WraithProcess::WraithProcess() : WraithProcess(ProcessConfig()) {}

WraithProcess::WraithProcess(const ProcessConfig& config) : config_(config) {}

WraithProcess::~WraithProcess() {
  if (IsOpen()) {
    Close();
  }
}

ProcessState WraithProcess::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ ? session_->GetState() : ProcessState::UNOPENED;
}

std::string WraithProcess::Path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return script_dir_;
}

int WraithProcess::Port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return port_;
}

std::string WraithProcess::URL() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return port_ > 0 ? "http://127.0.0.1:" + std::to_string(port_) : "";
}

pid_t WraithProcess::Pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_;
}

std::string WraithProcess::InstanceId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return instance_id_;
}

std::string WraithProcess::EnginePath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_path_;
}

std::string WraithProcess::ResolveEngine() const {
  std::string name = config_.engine_path;
  if (name.empty()) {
    const char* env = getenv("WRAITH_ENGINE_PATH");
    if (env && *env) {
      name = env;
    }
  }
  if (name.empty()) {
    name = WRAITH_DEFAULT_ENGINE;
  }
  return WraithPlatform::FindExecutable(name);
}

std::vector<std::string> WraithProcess::BuildArgs(const std::string& script_path) const {
  std::vector<std::string> args;
  args.push_back(engine_path_);
  for (const auto& arg : config_.engine_args) {
    args.push_back(arg);
  }
  if (!config_.offline_storage_path.empty()) {
    args.push_back("--offline-storage-path=" + config_.offline_storage_path);
  }
  if (config_.offline_storage_quota > 0) {
    args.push_back("--offline-storage-quota=" + std::to_string(config_.offline_storage_quota));
  }
  args.push_back(script_path);
  args.push_back(std::to_string(port_));
  return args;
}

void WraithProcess::AbortLaunch(pid_t pid, const std::string& dir) {
  if (pid > 0 && !WraithPlatform::TerminateChild(pid, config_.shutdown_timeout_ms)) {
    LOG_ERROR("Process", "Failed to reap engine pid " + std::to_string(pid));
  }
  if (!dir.empty() && !WraithPlatform::RemoveDirectoryTree(dir)) {
    LOG_WARN("Process", "Failed to remove " + dir);
  }
}

BridgeResult WraithProcess::Open() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (session_ && session_->IsOpen()) {
    return BridgeResult::Failure(BridgeStatus::INVALID_PARAMETER, "Process is already open");
  }
  if (config_.readiness_timeout_ms <= 0 || config_.call_timeout_ms < 0 ||
      config_.shutdown_timeout_ms < 0) {
    return BridgeResult::Failure(BridgeStatus::INVALID_PARAMETER,
                                 "Timeouts must not be negative");
  }

  if (!config_.log_file.empty()) {
    WraithLogger::Logger::Init(config_.log_file);
  }
  if (config_.verbose) {
    WraithLogger::Logger::SetVerbose(true);
  }

  // Locate the engine
  engine_path_ = ResolveEngine();
  if (engine_path_.empty()) {
    std::string wanted = config_.engine_path.empty() ? "engine" : config_.engine_path;
    LOG_ERROR("Process", "Cannot find executable " + wanted);
    return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR,
                                 "Engine executable not found: " + wanted);
  }

  if (!config_.working_dir.empty()) {
    struct stat st;
    if (stat(config_.working_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
      return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR,
                                   "Working directory does not exist: " + config_.working_dir);
    }
  }

  // Control channel
  std::string error;
  int port = WraithPlatform::AllocateLoopbackPort(error);
  if (port <= 0) {
    LOG_ERROR("Process", "Cannot allocate control port: " + error);
    return BridgeResult::Failure(BridgeStatus::CHANNEL_ERROR, error);
  }
  port_ = port;

  // Control script in a private directory
  instance_id_ = WraithPlatform::GenerateInstanceId();
  std::string dir = WraithPlatform::MakeTempDirectory("wraith-" + instance_id_.substr(0, 8), error);
  if (dir.empty()) {
    LOG_ERROR("Process", error);
    return BridgeResult::Failure(BridgeStatus::CHANNEL_ERROR, error);
  }
  std::string script_path = dir + "/" + kShimScriptName;
  if (!WraithPlatform::WriteFile(script_path, GetShimScript(), error)) {
    LOG_ERROR("Process", error);
    AbortLaunch(-1, dir);
    return BridgeResult::Failure(BridgeStatus::CHANNEL_ERROR, error);
  }
  std::vector<std::string> args = BuildArgs(script_path);
  std::vector<const char*> argv;
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  // Reports an execv failure back to us; closes itself on a successful exec
  int exec_pipe[2];
  if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
    error = std::string("pipe2() failed: ") + strerror(errno);
    AbortLaunch(-1, dir);
    return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR, error);
  }

  pid_t pid = fork();

  if (pid < 0) {
    error = std::string("fork() failed: ") + strerror(errno);
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    AbortLaunch(-1, dir);
    LOG_ERROR("Process", error);
    return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR, error);
  }

  if (pid == 0) {
    // Child process
    close(exec_pipe[0]);

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      // Engine console output is only interesting when debugging
      if (!config_.verbose) {
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
      }
      if (devnull > STDERR_FILENO) {
        close(devnull);
      }
    }

    if (!config_.working_dir.empty() && chdir(config_.working_dir.c_str()) != 0) {
      int err = errno;
      ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(127);
    }

    execv(engine_path_.c_str(), const_cast<char* const*>(argv.data()));

    // If execv returns, it failed
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent
  close(exec_pipe[1]);
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  int read_errno = errno;
  close(exec_pipe[0]);

  if (n < 0) {
    error = std::string("Cannot learn whether the engine started: read() failed: ") +
            strerror(read_errno);
    LOG_ERROR("Process", error);
    AbortLaunch(pid, dir);
    return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR, error);
  }
  if (n > 0) {
    error = "Cannot start " + engine_path_ + ": " + strerror(exec_errno);
    LOG_ERROR("Process", error);
    AbortLaunch(pid, dir);
    return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR, error);
  }

  LOG_INFO("Process", "Started " + engine_path_ + " (pid " + std::to_string(pid) +
           ", port " + std::to_string(port_) + ")");

  auto transport = std::make_unique<WraithTransport>(port_, config_.call_timeout_ms);
  BridgeResult ready = WaitForReady(*transport, pid);
  if (!ready.success) {
    AbortLaunch(ready.status == BridgeStatus::LAUNCH_ERROR ? -1 : pid, dir);
    return ready;
  }

  session_ = std::make_shared<WraithSession>(std::move(transport), pid, dir,
                                             config_.shutdown_timeout_ms);
  script_dir_ = dir;
  pid_ = pid;
  LOG_INFO("Process", "Engine ready at " + std::string("http://127.0.0.1:") +
           std::to_string(port_) + " (instance " + instance_id_ + ")");
  return BridgeResult::Success();
}

BridgeResult WraithProcess::WaitForReady(WraithTransport& transport, pid_t pid) {
  auto start = std::chrono::steady_clock::now();
  auto deadline = start + std::chrono::milliseconds(config_.readiness_timeout_ms);

  while (std::chrono::steady_clock::now() < deadline) {
    std::string how;
    if (WraithPlatform::ChildExited(pid, how)) {
      // Already reaped
      std::string msg = "Engine exited during startup (" + how + ")";
      LOG_ERROR("Process", msg);
      return BridgeResult::Failure(BridgeStatus::LAUNCH_ERROR, msg);
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    int probe_ms = static_cast<int>(std::min<long long>(std::max<long long>(remaining, 1), 1000));

    BridgeResult ping = transport.Ping(probe_ms);
    if (ping.success) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start).count();
      LOG_DEBUG("Process", "Ready after " + std::to_string(elapsed) + "ms");
      return BridgeResult::Success();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(WRAITH_READY_POLL_INTERVAL_MS));
  }

  std::string msg = "Engine did not answer within " +
                    std::to_string(config_.readiness_timeout_ms) + "ms";
  LOG_ERROR("Process", msg);
  return BridgeResult::Failure(BridgeStatus::TIMEOUT, msg);
}

BridgeResult WraithProcess::Close() {
  std::shared_ptr<WraithSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = session_;
  }

  if (!session || !session->Terminate("close requested")) {
    return BridgeResult::Failure(BridgeStatus::ALREADY_CLOSED);
  }
  return BridgeResult::Success();
}

BridgeResult WraithProcess::CreateWebPage(WraithWebPage& page) {
  std::shared_ptr<WraithSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = session_;
  }

  if (!session) {
    return BridgeResult::Failure(BridgeStatus::REGISTRY_ERROR,
                                 "Cannot create a page: process was never opened");
  }

  PageId id = 0;
  BridgeResult result = session->CreatePage(id);
  if (!result.success) {
    return result;
  }
  page = WraithWebPage(session, id);
  return result;
}
