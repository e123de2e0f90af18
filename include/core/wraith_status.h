#pragma once

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Status codes for every bridge operation
enum class BridgeStatus {
  // Success
  OK,                        // Operation completed

  // Process lifecycle
  LAUNCH_ERROR,              // Engine executable missing, not executable or died during startup
  TIMEOUT,                   // Readiness probe or a response never arrived in time
  CHANNEL_ERROR,             // Control endpoint could not be allocated or bound
  ALREADY_CLOSED,            // Close called on a process that is not open

  // Call errors
  TRANSPORT_ERROR,           // Connection fault; the process is no longer usable
  REMOTE_ERROR,              // Engine rejected a well-formed request
  DECODE_ERROR,              // Result did not have the expected shape

  // Handle errors
  INVALID_HANDLE,            // Page closed, or its process is not open
  REGISTRY_ERROR,            // Page requested from a process that is not open
  FRAME_NOT_FOUND,           // Frame switch target missing in the current frameset

  // Validation
  INVALID_PARAMETER,         // A parameter has an invalid value

  // Unknown
  UNKNOWN
};

// Convert BridgeStatus to string code
inline const char* BridgeStatusToCode(BridgeStatus status) {
  switch (status) {
    case BridgeStatus::OK: return "ok";
    case BridgeStatus::LAUNCH_ERROR: return "launch_error";
    case BridgeStatus::TIMEOUT: return "timeout";
    case BridgeStatus::CHANNEL_ERROR: return "channel_error";
    case BridgeStatus::ALREADY_CLOSED: return "already_closed";
    case BridgeStatus::TRANSPORT_ERROR: return "transport_error";
    case BridgeStatus::REMOTE_ERROR: return "remote_error";
    case BridgeStatus::DECODE_ERROR: return "decode_error";
    case BridgeStatus::INVALID_HANDLE: return "invalid_handle";
    case BridgeStatus::REGISTRY_ERROR: return "registry_error";
    case BridgeStatus::FRAME_NOT_FOUND: return "frame_not_found";
    case BridgeStatus::INVALID_PARAMETER: return "invalid_parameter";
    default: return "unknown";
  }
}

// Human-readable message for BridgeStatus
inline const char* BridgeStatusToMessage(BridgeStatus status) {
  switch (status) {
    case BridgeStatus::OK: return "Operation completed successfully";
    case BridgeStatus::LAUNCH_ERROR: return "Engine could not be launched";
    case BridgeStatus::TIMEOUT: return "Operation timed out";
    case BridgeStatus::CHANNEL_ERROR: return "Control channel could not be allocated";
    case BridgeStatus::ALREADY_CLOSED: return "Process is already closed";
    case BridgeStatus::TRANSPORT_ERROR: return "Connection to the engine failed";
    case BridgeStatus::REMOTE_ERROR: return "Engine reported an error";
    case BridgeStatus::DECODE_ERROR: return "Engine returned an unexpected value";
    case BridgeStatus::INVALID_HANDLE: return "Page handle is no longer valid";
    case BridgeStatus::REGISTRY_ERROR: return "Process is not open";
    case BridgeStatus::FRAME_NOT_FOUND: return "Frame not found";
    case BridgeStatus::INVALID_PARAMETER: return "Invalid parameter value";
    default: return "Unknown error";
  }
}

// Structured result for bridge operations
// Carries success/failure plus the decoded wire value for calls
struct BridgeResult {
  bool success;               // True if the operation completed
  BridgeStatus status;        // Detailed status code
  std::string message;        // Human-readable message
  json value;                 // Raw result value (calls only)

  BridgeResult() : success(false), status(BridgeStatus::UNKNOWN) {}

  static BridgeResult Success() {
    BridgeResult r;
    r.success = true;
    r.status = BridgeStatus::OK;
    r.message = BridgeStatusToMessage(BridgeStatus::OK);
    return r;
  }

  static BridgeResult Success(const json& value) {
    BridgeResult r = Success();
    r.value = value;
    return r;
  }

  static BridgeResult Failure(BridgeStatus status, const std::string& msg = "") {
    BridgeResult r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? BridgeStatusToMessage(status) : msg;
    return r;
  }

  static BridgeResult FrameNotFound(const std::string& selector) {
    return Failure(BridgeStatus::FRAME_NOT_FOUND, "Frame not found: " + selector);
  }

  static BridgeResult InvalidHandle(const std::string& reason) {
    return Failure(BridgeStatus::INVALID_HANDLE, "Invalid page handle: " + reason);
  }

  static BridgeResult RemoteError(const std::string& member, const std::string& remote_message) {
    return Failure(BridgeStatus::REMOTE_ERROR, member + ": " + remote_message);
  }

  static BridgeResult DecodeError(const std::string& what) {
    return Failure(BridgeStatus::DECODE_ERROR, "Unexpected value for " + what);
  }

  // Serialize to JSON (for logging and test reports)
  std::string ToJSON() const {
    json out = {
      {"success", success},
      {"status", BridgeStatusToCode(status)},
      {"message", message}
    };
    if (!value.is_null()) {
      out["value"] = value;
    }
    return out.dump();
  }
};
