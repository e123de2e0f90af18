#ifndef WRAITH_CONFIG_H_
#define WRAITH_CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>

// Default configuration values
#define WRAITH_DEFAULT_ENGINE "phantomjs"
#define WRAITH_DEFAULT_READY_TIMEOUT_MS 10000
#define WRAITH_DEFAULT_CALL_TIMEOUT_MS 0        // 0 = wait for the engine indefinitely
#define WRAITH_DEFAULT_SHUTDOWN_TIMEOUT_MS 5000
#define WRAITH_READY_POLL_INTERVAL_MS 50

// Settings for one supervised engine process.
//
// Sources, lowest priority first: built-in defaults, a JSON config file,
// WRAITH_* environment variables, then fields assigned by the caller.
struct ProcessConfig {
  std::string engine_path;                 // "" = $WRAITH_ENGINE_PATH, then "phantomjs" on $PATH
  std::vector<std::string> engine_args;    // extra engine flags, placed before the script
  std::string working_dir;                 // "" = inherit
  std::string offline_storage_path;        // passed verbatim as --offline-storage-path
  int64_t offline_storage_quota = 0;       // bytes, 0 = engine default
  int readiness_timeout_ms = WRAITH_DEFAULT_READY_TIMEOUT_MS;
  int call_timeout_ms = WRAITH_DEFAULT_CALL_TIMEOUT_MS;
  int shutdown_timeout_ms = WRAITH_DEFAULT_SHUTDOWN_TIMEOUT_MS;
  std::string log_file;                    // "" = stderr only
  bool verbose = false;

  // Defaults, then $WRAITH_CONFIG_FILE when set, then the environment
  static ProcessConfig FromEnvironment();
};

// Merge a JSON config file into |config|. Keys mirror the field names
// ("engine_path", "engine_args", ...). Returns false with |error| set when
// the file is unreadable or malformed; |config| is left unchanged then.
bool LoadConfigFile(const std::string& path, ProcessConfig& config, std::string& error);

// Override |config| with the WRAITH_* variables that are set
void ApplyEnvironment(ProcessConfig& config);

#endif  // WRAITH_CONFIG_H_
