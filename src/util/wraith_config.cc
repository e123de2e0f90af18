#include "wraith_config.h"
#include "wraith_platform_utils.h"
#include "logger.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char* GetEnv(const char* name) {
  const char* value = getenv(name);
  return (value && *value) ? value : nullptr;
}

bool ParseInt64(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  long long v = strtoll(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') return false;
  out = static_cast<int64_t>(v);
  return true;
}

void ApplyIntEnv(const char* name, int& field) {
  const char* value = GetEnv(name);
  if (!value) return;
  int64_t parsed = 0;
  if (!ParseInt64(value, parsed) || parsed < 0) {
    LOG_WARN("Config", std::string("Ignoring invalid ") + name + "=" + value);
    return;
  }
  field = static_cast<int>(parsed);
}

bool IsTruthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // namespace

ProcessConfig ProcessConfig::FromEnvironment() {
  ProcessConfig config;

  const char* file = GetEnv("WRAITH_CONFIG_FILE");
  if (file) {
    std::string error;
    if (!LoadConfigFile(file, config, error)) {
      LOG_ERROR("Config", error);
    }
  }

  ApplyEnvironment(config);
  return config;
}

bool LoadConfigFile(const std::string& path, ProcessConfig& config, std::string& error) {
  std::ifstream in(path);
  if (!in.is_open()) {
    error = "Cannot open config file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  ProcessConfig merged = config;
  try {
    json root = json::parse(buffer.str());
    if (!root.is_object()) {
      error = "Config file must contain a JSON object: " + path;
      return false;
    }

    if (root.contains("engine_path")) merged.engine_path = root["engine_path"].get<std::string>();
    if (root.contains("engine_args")) {
      const json& args = root["engine_args"];
      if (args.is_string()) {
        merged.engine_args = WraithPlatform::SplitArgs(args.get<std::string>());
      } else {
        merged.engine_args = args.get<std::vector<std::string>>();
      }
    }
    if (root.contains("working_dir")) merged.working_dir = root["working_dir"].get<std::string>();
    if (root.contains("offline_storage_path")) {
      merged.offline_storage_path = root["offline_storage_path"].get<std::string>();
    }
    if (root.contains("offline_storage_quota")) {
      merged.offline_storage_quota = root["offline_storage_quota"].get<int64_t>();
    }
    if (root.contains("readiness_timeout_ms")) {
      merged.readiness_timeout_ms = root["readiness_timeout_ms"].get<int>();
    }
    if (root.contains("call_timeout_ms")) merged.call_timeout_ms = root["call_timeout_ms"].get<int>();
    if (root.contains("shutdown_timeout_ms")) {
      merged.shutdown_timeout_ms = root["shutdown_timeout_ms"].get<int>();
    }
    if (root.contains("log_file")) merged.log_file = root["log_file"].get<std::string>();
    if (root.contains("verbose")) merged.verbose = root["verbose"].get<bool>();
  } catch (const json::exception& e) {
    error = "Invalid config file " + path + ": " + e.what();
    return false;
  }

  if (merged.readiness_timeout_ms <= 0 || merged.call_timeout_ms < 0 ||
      merged.shutdown_timeout_ms < 0 || merged.offline_storage_quota < 0) {
    error = "Invalid config file " + path + ": timeouts and quota must not be negative";
    return false;
  }

  config = merged;
  LOG_DEBUG("Config", "Loaded " + path);
  return true;
}

void ApplyEnvironment(ProcessConfig& config) {
  if (const char* v = GetEnv("WRAITH_ENGINE_PATH")) config.engine_path = v;
  if (const char* v = GetEnv("WRAITH_ENGINE_ARGS")) config.engine_args = WraithPlatform::SplitArgs(v);
  if (const char* v = GetEnv("WRAITH_WORKING_DIR")) config.working_dir = v;
  if (const char* v = GetEnv("WRAITH_OFFLINE_STORAGE_PATH")) config.offline_storage_path = v;
  if (const char* v = GetEnv("WRAITH_OFFLINE_STORAGE_QUOTA")) {
    int64_t quota = 0;
    if (ParseInt64(v, quota) && quota >= 0) {
      config.offline_storage_quota = quota;
    } else {
      LOG_WARN("Config", std::string("Ignoring invalid WRAITH_OFFLINE_STORAGE_QUOTA=") + v);
    }
  }
  ApplyIntEnv("WRAITH_READY_TIMEOUT_MS", config.readiness_timeout_ms);
  ApplyIntEnv("WRAITH_CALL_TIMEOUT_MS", config.call_timeout_ms);
  if (const char* v = GetEnv("WRAITH_LOG_FILE")) config.log_file = v;
  if (const char* v = GetEnv("WRAITH_VERBOSE")) config.verbose = IsTruthy(v);
}
