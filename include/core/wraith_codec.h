#ifndef WRAITH_CODEC_H_
#define WRAITH_CODEC_H_

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "wraith_frame_context.h"
#include "wraith_status.h"
#include "wraith_types.h"

using json = nlohmann::json;

// Child window entry as listed by the engine
struct RemotePageEntry {
  std::string ref;
  std::string window_name;  // empty when opened without a target name
};

// Conversion between bridge value types and the JSON wire encoding.
//
// Every type crossing the process boundary goes through this class, so a
// new value type only needs an Encode/Decode pair here. Decoders never throw:
// a value with the wrong shape makes them return false and leaves |out|
// untouched.
class WraithCodec {
 public:
  // Request/response envelope
  static json EncodeInvoke(int id, const std::string& target, const std::string& member,
                           const json& args, const std::vector<FrameSelector>& frame_path);
  static BridgeResult DecodeEnvelope(const std::string& body, const std::string& what);

  // Geometry
  static json EncodeRect(const Rect& rect);
  static bool DecodeRect(const json& value, Rect& out);
  static json EncodePosition(const Position& pos);
  static bool DecodePosition(const json& value, Position& out);
  static json EncodeViewportSize(const ViewportSize& size);
  static bool DecodeViewportSize(const json& value, ViewportSize& out);

  // Printing layout
  static json EncodePaperSize(const PaperSize& size);
  static bool DecodePaperSize(const json& value, PaperSize& out);

  // Cookies
  static json EncodeCookie(const Cookie& cookie);
  static bool DecodeCookie(const json& value, Cookie& out);
  static json EncodeCookies(const std::vector<Cookie>& cookies);
  static bool DecodeCookies(const json& value, std::vector<Cookie>& out);

  // Headers
  static json EncodeHeaders(const HeaderMap& headers);
  static bool DecodeHeaders(const json& value, HeaderMap& out);

  // Settings
  static json EncodeSettings(const PageSettings& settings);
  static bool DecodeSettings(const json& value, PageSettings& out);

  // Frame paths and child windows
  static json EncodeFramePath(const std::vector<FrameSelector>& path);
  static bool DecodeFramePath(const json& value, std::vector<FrameSelector>& out);
  static bool DecodePageEntries(const json& value, std::vector<RemotePageEntry>& out);

  // Scalars
  static bool DecodeString(const json& value, std::string& out);
  static bool DecodeBool(const json& value, bool& out);
  static bool DecodeInt(const json& value, int& out);
  static bool DecodeInt64(const json& value, int64_t& out);
  static bool DecodeDouble(const json& value, double& out);
  static bool DecodeStringList(const json& value, std::vector<std::string>& out);

  // HTTP-date ("Thu, 02 Jan 2020 03:04:05 GMT") <-> Unix timestamp
  static std::string FormatHTTPDate(int64_t unix_seconds);
  static bool ParseHTTPDate(const std::string& text, int64_t& unix_seconds);
};

#endif  // WRAITH_CODEC_H_
