#include "logger.h"
#include <mutex>
#include <unistd.h>  // for write()
#include <fcntl.h>   // for open()
#include <cerrno>
#include <ctime>

namespace WraithLogger {

#ifdef WRAITH_DEBUG_BUILD
Level Logger::current_level_ = DEBUG;
#else
Level Logger::current_level_ = INFO;
#endif

static std::mutex log_mutex;
static std::string log_file_path_global;

void Logger::Init() {
#ifdef WRAITH_DEBUG_BUILD
  current_level_ = DEBUG;
#else
  current_level_ = INFO;
#endif
}

void Logger::Init(const std::string& log_file_path) {
  Init();

  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;
  if (log_file_path.empty()) {
    return;
  }

  // Probe the file once so a bad path is reported at startup
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    log_file_path_global.clear();
    return;
  }
  close(fd);
}

void Logger::SetLevel(Level level) {
  current_level_ = level;
}

Level Logger::GetLevel() {
  return current_level_;
}

void Logger::SetVerbose(bool verbose) {
  current_level_ = verbose ? DEBUG : INFO;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_) {
    return;
  }

  std::lock_guard<std::mutex> lock(log_mutex);

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::cerr << log_line;

  // Open fresh for every line so several bridge processes can share one file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      if (bytes_written < 0) {
        std::cerr << "[Logger] write to " << log_file_path_global
                  << " failed (errno " << errno << ")" << std::endl;
      }
      close(fd);
    }
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace WraithLogger
