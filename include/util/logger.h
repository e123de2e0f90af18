#ifndef WRAITH_LOGGER_H_
#define WRAITH_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace WraithLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to a log file
  static void SetLevel(Level level);
  static Level GetLevel();
  static void SetVerbose(bool verbose);  // DEBUG when true, INFO otherwise
  static void Log(Level level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace WraithLogger

// LOG_DEBUG only compiles in debug builds
#ifdef WRAITH_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) WraithLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) WraithLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) WraithLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) WraithLogger::Logger::Error(component, msg)

#endif  // WRAITH_LOGGER_H_
