#include "wraith_codec.h"
#include "logger.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <limits>
#include <strings.h>

namespace {

const char* kDayNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const char* kMonthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// JS numbers arrive as either integers or doubles
bool NumberToInt64(const json& value, int64_t& out) {
  if (value.is_number_unsigned()) {
    uint64_t u = value.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
    out = static_cast<int64_t>(u);
    return true;
  }
  if (value.is_number_integer()) {
    out = value.get<int64_t>();
    return true;
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    if (!std::isfinite(d) || d < -9.2e18 || d > 9.2e18) return false;
    out = static_cast<int64_t>(std::llround(d));
    return true;
  }
  return false;
}

// Same as NumberToInt64, rejecting values outside the int range
bool NumberToInt(const json& value, int& out) {
  int64_t v = 0;
  if (!NumberToInt64(value, v)) return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  out = static_cast<int>(v);
  return true;
}

// Missing or null field -> 0
bool ReadIntField(const json& obj, const char* key, int& out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    out = 0;
    return true;
  }
  return NumberToInt(*it, out);
}

// Missing or null field -> ""
bool ReadStringField(const json& obj, const char* key, std::string& out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    out.clear();
    return true;
  }
  if (it->is_string()) {
    out = it->get<std::string>();
    return true;
  }
  if (it->is_number()) {
    // Margins and sizes may be plain pixel numbers
    out = it->dump();
    return true;
  }
  return false;
}

bool ReadBoolField(const json& obj, const char* key, bool& out, bool fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    out = fallback;
    return true;
  }
  if (!it->is_boolean()) return false;
  out = it->get<bool>();
  return true;
}

int MonthIndex(const char* name) {
  for (int i = 0; i < 12; i++) {
    if (strncasecmp(name, kMonthNames[i], 3) == 0) return i;
  }
  return -1;
}

// |mon| is 0-based
int DaysInMonth(int year, int mon) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return (mon == 1 && leap) ? 29 : kDays[mon];
}

}  // namespace

// ============================================================================
// Envelope
// ============================================================================

json WraithCodec::EncodeInvoke(int id, const std::string& target, const std::string& member,
                               const json& args, const std::vector<FrameSelector>& frame_path) {
  json request = {
    {"id", id},
    {"target", target},
    {"member", member},
    {"args", args.is_null() ? json::array() : args}
  };
  if (!frame_path.empty()) {
    request["frame"] = EncodeFramePath(frame_path);
  }
  return request;
}

BridgeResult WraithCodec::DecodeEnvelope(const std::string& body, const std::string& what) {
  json response;
  try {
    response = json::parse(body);
  } catch (const json::parse_error& e) {
    LOG_ERROR("Transport", "Malformed response for " + what + ": " + e.what());
    return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR,
                                 "Malformed response for " + what);
  }

  if (!response.is_object() || !response.contains("status") || !response["status"].is_string()) {
    return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR,
                                 "Response for " + what + " has no status");
  }

  std::string status = response["status"].get<std::string>();
  if (status == "ok") {
    return BridgeResult::Success(response.value("result", json()));
  }
  if (status == "error") {
    std::string message = "unknown error";
    if (response.contains("message") && response["message"].is_string()) {
      message = response["message"].get<std::string>();
    }
    return BridgeResult::RemoteError(what, message);
  }
  return BridgeResult::Failure(BridgeStatus::TRANSPORT_ERROR,
                               "Unknown response status '" + status + "' for " + what);
}

// ============================================================================
// Geometry
// ============================================================================

json WraithCodec::EncodeRect(const Rect& rect) {
  return {{"top", rect.top}, {"left", rect.left}, {"width", rect.width}, {"height", rect.height}};
}

bool WraithCodec::DecodeRect(const json& value, Rect& out) {
  if (value.is_null()) {
    out = Rect();
    return true;
  }
  if (!value.is_object()) return false;
  Rect r;
  if (!ReadIntField(value, "top", r.top) || !ReadIntField(value, "left", r.left) ||
      !ReadIntField(value, "width", r.width) || !ReadIntField(value, "height", r.height)) {
    return false;
  }
  out = r;
  return true;
}

json WraithCodec::EncodePosition(const Position& pos) {
  return {{"top", pos.top}, {"left", pos.left}};
}

bool WraithCodec::DecodePosition(const json& value, Position& out) {
  if (value.is_null()) {
    out = Position();
    return true;
  }
  if (!value.is_object()) return false;
  Position p;
  if (!ReadIntField(value, "top", p.top) || !ReadIntField(value, "left", p.left)) {
    return false;
  }
  out = p;
  return true;
}

json WraithCodec::EncodeViewportSize(const ViewportSize& size) {
  return {{"width", size.width}, {"height", size.height}};
}

bool WraithCodec::DecodeViewportSize(const json& value, ViewportSize& out) {
  if (value.is_null()) {
    out = ViewportSize();
    return true;
  }
  if (!value.is_object()) return false;
  ViewportSize s;
  if (!ReadIntField(value, "width", s.width) || !ReadIntField(value, "height", s.height)) {
    return false;
  }
  out = s;
  return true;
}

// ============================================================================
// Paper size
// ============================================================================

json WraithCodec::EncodePaperSize(const PaperSize& size) {
  json out = json::object();
  if (!size.width.empty()) out["width"] = size.width;
  if (!size.height.empty()) out["height"] = size.height;
  if (!size.format.empty()) out["format"] = size.format;
  if (!size.orientation.empty()) out["orientation"] = size.orientation;
  if (size.has_margin) {
    out["margin"] = {
      {"top", size.margin.top},
      {"bottom", size.margin.bottom},
      {"left", size.margin.left},
      {"right", size.margin.right}
    };
  }
  return out;
}

bool WraithCodec::DecodePaperSize(const json& value, PaperSize& out) {
  if (value.is_null()) {
    out = PaperSize();
    return true;
  }
  if (!value.is_object()) return false;

  PaperSize p;
  if (!ReadStringField(value, "width", p.width) ||
      !ReadStringField(value, "height", p.height) ||
      !ReadStringField(value, "format", p.format) ||
      !ReadStringField(value, "orientation", p.orientation)) {
    return false;
  }

  auto margin = value.find("margin");
  if (margin != value.end() && !margin->is_null()) {
    if (margin->is_string() || margin->is_number()) {
      // One length for all four sides
      std::string side = margin->is_string() ? margin->get<std::string>() : margin->dump();
      p.margin.top = p.margin.bottom = p.margin.left = p.margin.right = side;
    } else if (margin->is_object()) {
      if (!ReadStringField(*margin, "top", p.margin.top) ||
          !ReadStringField(*margin, "bottom", p.margin.bottom) ||
          !ReadStringField(*margin, "left", p.margin.left) ||
          !ReadStringField(*margin, "right", p.margin.right)) {
        return false;
      }
    } else {
      return false;
    }
    p.has_margin = true;
  }

  out = p;
  return true;
}

// ============================================================================
// Cookies
// ============================================================================

json WraithCodec::EncodeCookie(const Cookie& cookie) {
  json out = {
    {"name", cookie.name},
    {"value", cookie.value},
    {"domain", cookie.domain},
    {"path", cookie.path},
    {"httponly", cookie.http_only},
    {"secure", cookie.secure}
  };
  if (!cookie.raw_expires.empty()) {
    out["expires"] = cookie.raw_expires;
  } else if (cookie.has_expires) {
    out["expires"] = FormatHTTPDate(cookie.expires);
  }
  if (cookie.has_expires) {
    out["expiry"] = cookie.expires;
  }
  return out;
}

bool WraithCodec::DecodeCookie(const json& value, Cookie& out) {
  if (!value.is_object()) return false;

  Cookie c;
  if (!ReadStringField(value, "name", c.name) ||
      !ReadStringField(value, "value", c.value) ||
      !ReadStringField(value, "domain", c.domain) ||
      !ReadStringField(value, "path", c.path) ||
      !ReadBoolField(value, "httponly", c.http_only, false) ||
      !ReadBoolField(value, "secure", c.secure, false)) {
    return false;
  }

  auto expires = value.find("expires");
  if (expires != value.end() && !expires->is_null()) {
    if (!expires->is_string()) return false;
    c.raw_expires = expires->get<std::string>();
  }

  auto expiry = value.find("expiry");
  if (expiry != value.end() && !expiry->is_null()) {
    int64_t ts = 0;
    if (!NumberToInt64(*expiry, ts)) return false;
    c.has_expires = true;
    c.expires = ts;
  } else if (!c.raw_expires.empty()) {
    int64_t ts = 0;
    if (ParseHTTPDate(c.raw_expires, ts)) {
      c.has_expires = true;
      c.expires = ts;
    } else {
      LOG_WARN("Codec", "Unparseable cookie expiry '" + c.raw_expires + "' for " + c.name);
    }
  }

  out = c;
  return true;
}

json WraithCodec::EncodeCookies(const std::vector<Cookie>& cookies) {
  json out = json::array();
  for (const auto& cookie : cookies) {
    out.push_back(EncodeCookie(cookie));
  }
  return out;
}

bool WraithCodec::DecodeCookies(const json& value, std::vector<Cookie>& out) {
  if (value.is_null()) {
    out.clear();
    return true;
  }
  if (!value.is_array()) return false;

  std::vector<Cookie> cookies;
  for (const auto& item : value) {
    Cookie c;
    if (!DecodeCookie(item, c)) return false;
    cookies.push_back(c);
  }
  out = cookies;
  return true;
}

// ============================================================================
// Headers
// ============================================================================

json WraithCodec::EncodeHeaders(const HeaderMap& headers) {
  json out = json::object();
  for (const auto& entry : headers) {
    if (entry.second.size() == 1) {
      out[entry.first] = entry.second.front();
    } else {
      out[entry.first] = entry.second;
    }
  }
  return out;
}

bool WraithCodec::DecodeHeaders(const json& value, HeaderMap& out) {
  if (value.is_null()) {
    out.Clear();
    return true;
  }
  if (!value.is_object()) return false;

  HeaderMap headers;
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (it->is_string()) {
      headers.Add(it.key(), it->get<std::string>());
    } else if (it->is_array()) {
      for (const auto& v : *it) {
        if (!v.is_string()) return false;
        headers.Add(it.key(), v.get<std::string>());
      }
    } else if (it->is_number() || it->is_boolean()) {
      headers.Add(it.key(), it->dump());
    } else {
      return false;
    }
  }
  out = headers;
  return true;
}

// ============================================================================
// Settings
// ============================================================================

json WraithCodec::EncodeSettings(const PageSettings& settings) {
  return {
    {"javascriptEnabled", settings.javascript_enabled},
    {"loadImages", settings.load_images},
    {"localToRemoteUrlAccessEnabled", settings.local_to_remote_url_access_enabled},
    {"userAgent", settings.user_agent},
    {"userName", settings.user_name},
    {"password", settings.password},
    {"XSSAuditingEnabled", settings.xss_auditing_enabled},
    {"webSecurityEnabled", settings.web_security_enabled},
    {"resourceTimeout", settings.resource_timeout_ms}
  };
}

bool WraithCodec::DecodeSettings(const json& value, PageSettings& out) {
  if (!value.is_object()) return false;

  PageSettings defaults;
  PageSettings s;
  if (!ReadBoolField(value, "javascriptEnabled", s.javascript_enabled, defaults.javascript_enabled) ||
      !ReadBoolField(value, "loadImages", s.load_images, defaults.load_images) ||
      !ReadBoolField(value, "localToRemoteUrlAccessEnabled", s.local_to_remote_url_access_enabled,
                     defaults.local_to_remote_url_access_enabled) ||
      !ReadStringField(value, "userAgent", s.user_agent) ||
      !ReadStringField(value, "userName", s.user_name) ||
      !ReadStringField(value, "password", s.password) ||
      !ReadBoolField(value, "XSSAuditingEnabled", s.xss_auditing_enabled,
                     defaults.xss_auditing_enabled) ||
      !ReadBoolField(value, "webSecurityEnabled", s.web_security_enabled,
                     defaults.web_security_enabled) ||
      !ReadIntField(value, "resourceTimeout", s.resource_timeout_ms)) {
    return false;
  }
  out = s;
  return true;
}

// ============================================================================
// Frame paths and child windows
// ============================================================================

json WraithCodec::EncodeFramePath(const std::vector<FrameSelector>& path) {
  json out = json::array();
  for (const auto& step : path) {
    if (step.by_name) {
      out.push_back({{"name", step.name}});
    } else {
      out.push_back({{"index", step.index}});
    }
  }
  return out;
}

bool WraithCodec::DecodeFramePath(const json& value, std::vector<FrameSelector>& out) {
  if (value.is_null()) {
    out.clear();
    return true;
  }
  if (!value.is_array()) return false;

  std::vector<FrameSelector> path;
  for (const auto& step : value) {
    if (step.is_string()) {
      path.push_back(FrameSelector::ByName(step.get<std::string>()));
    } else if (step.is_object() && step.contains("name") && step["name"].is_string()) {
      path.push_back(FrameSelector::ByName(step["name"].get<std::string>()));
    } else if (step.is_object() && step.contains("index")) {
      int index = 0;
      if (!NumberToInt(step["index"], index)) return false;
      path.push_back(FrameSelector::ByIndex(index));
    } else {
      return false;
    }
  }
  out = path;
  return true;
}

bool WraithCodec::DecodePageEntries(const json& value, std::vector<RemotePageEntry>& out) {
  if (value.is_null()) {
    out.clear();
    return true;
  }
  if (!value.is_array()) return false;

  std::vector<RemotePageEntry> entries;
  for (const auto& item : value) {
    if (!item.is_object()) return false;
    RemotePageEntry entry;
    if (!ReadStringField(item, "ref", entry.ref) || entry.ref.empty() ||
        !ReadStringField(item, "windowName", entry.window_name)) {
      return false;
    }
    entries.push_back(entry);
  }
  out = entries;
  return true;
}

// ============================================================================
// Scalars
// ============================================================================

bool WraithCodec::DecodeString(const json& value, std::string& out) {
  if (value.is_null()) {
    out.clear();
    return true;
  }
  if (!value.is_string()) return false;
  out = value.get<std::string>();
  return true;
}

bool WraithCodec::DecodeBool(const json& value, bool& out) {
  if (!value.is_boolean()) return false;
  out = value.get<bool>();
  return true;
}

bool WraithCodec::DecodeInt(const json& value, int& out) {
  return NumberToInt(value, out);
}

bool WraithCodec::DecodeInt64(const json& value, int64_t& out) {
  return NumberToInt64(value, out);
}

bool WraithCodec::DecodeDouble(const json& value, double& out) {
  if (!value.is_number()) return false;
  out = value.get<double>();
  return true;
}

bool WraithCodec::DecodeStringList(const json& value, std::vector<std::string>& out) {
  if (value.is_null()) {
    out.clear();
    return true;
  }
  if (!value.is_array()) return false;

  std::vector<std::string> list;
  for (const auto& item : value) {
    if (!item.is_string()) return false;
    list.push_back(item.get<std::string>());
  }
  out = list;
  return true;
}

// ============================================================================
// HTTP-date
// ============================================================================

std::string WraithCodec::FormatHTTPDate(int64_t unix_seconds) {
  time_t t = static_cast<time_t>(unix_seconds);
  struct tm tm_utc;
  if (gmtime_r(&t, &tm_utc) == nullptr) {
    return "";
  }
  // Day and month names are fixed English tokens regardless of locale
  char buf[64];
  snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
           kDayNames[tm_utc.tm_wday], tm_utc.tm_mday, kMonthNames[tm_utc.tm_mon],
           tm_utc.tm_year + 1900, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
  return buf;
}

bool WraithCodec::ParseHTTPDate(const std::string& text, int64_t& unix_seconds) {
  // Accept "Thu, 02 Jan 2020 03:04:05 GMT" and the cookie form "Thu, 02-Jan-2020 03:04:05 GMT"
  std::string normalized = text;
  for (auto& ch : normalized) {
    if (ch == '-') ch = ' ';
  }

  char day[8] = {0};
  char month[8] = {0};
  int mday = 0, year = 0, hour = 0, minute = 0, second = 0;
  int matched = sscanf(normalized.c_str(), "%7[A-Za-z], %d %7s %d %d:%d:%d",
                       day, &mday, month, &year, &hour, &minute, &second);
  if (matched != 7) {
    return false;
  }

  int mon = MonthIndex(month);
  if (mon < 0 || mday < 1 || mday > 31 || hour > 23 || minute > 59 || second > 60) {
    return false;
  }
  if (year < 100) {
    year += (year < 70) ? 2000 : 1900;
  }
  // "31 Feb" would otherwise roll over into March
  if (mday > DaysInMonth(year, mon)) {
    return false;
  }

  struct tm tm_utc;
  memset(&tm_utc, 0, sizeof(tm_utc));
  tm_utc.tm_year = year - 1900;
  tm_utc.tm_mon = mon;
  tm_utc.tm_mday = mday;
  tm_utc.tm_hour = hour;
  tm_utc.tm_min = minute;
  tm_utc.tm_sec = second;
  unix_seconds = static_cast<int64_t>(timegm(&tm_utc));
  return true;
}
