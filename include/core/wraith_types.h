#ifndef WRAITH_TYPES_H_
#define WRAITH_TYPES_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Rectangle in page coordinates. The zero value means "not set".
struct Rect {
  int top = 0;
  int left = 0;
  int width = 0;
  int height = 0;

  bool IsZero() const { return top == 0 && left == 0 && width == 0 && height == 0; }
  bool operator==(const Rect& o) const {
    return top == o.top && left == o.left && width == o.width && height == o.height;
  }
  bool operator!=(const Rect& o) const { return !(*this == o); }
};

// Scroll offset. The zero value means "not set".
struct Position {
  int top = 0;
  int left = 0;

  bool IsZero() const { return top == 0 && left == 0; }
  bool operator==(const Position& o) const { return top == o.top && left == o.left; }
  bool operator!=(const Position& o) const { return !(*this == o); }
};

// Viewport dimensions. The zero value means "engine default".
struct ViewportSize {
  int width = 0;
  int height = 0;

  bool IsZero() const { return width == 0 && height == 0; }
  bool operator==(const ViewportSize& o) const { return width == o.width && height == o.height; }
  bool operator!=(const ViewportSize& o) const { return !(*this == o); }
};

// Page margins used for printing, as CSS length strings ("1in", "2cm")
struct PaperMargin {
  std::string top;
  std::string bottom;
  std::string left;
  std::string right;

  bool operator==(const PaperMargin& o) const {
    return top == o.top && bottom == o.bottom && left == o.left && right == o.right;
  }
  bool operator!=(const PaperMargin& o) const { return !(*this == o); }
};

// Paper layout. Either width/height or a named format ("A4", "Letter");
// the two are kept as given and never derived from one another.
struct PaperSize {
  std::string width;
  std::string height;
  std::string format;
  std::string orientation;  // "portrait" or "landscape"
  bool has_margin = false;
  PaperMargin margin;

  bool IsZero() const {
    return width.empty() && height.empty() && format.empty() &&
           orientation.empty() && !has_margin;
  }
  bool operator==(const PaperSize& o) const {
    return width == o.width && height == o.height && format == o.format &&
           orientation == o.orientation && has_margin == o.has_margin &&
           (!has_margin || margin == o.margin);
  }
  bool operator!=(const PaperSize& o) const { return !(*this == o); }
};

// Cookie as exchanged with the engine
struct Cookie {
  std::string name;
  std::string value;
  std::string domain;
  std::string path;
  bool secure = false;
  bool http_only = false;
  bool has_expires = false;   // false = session cookie
  int64_t expires = 0;        // Unix timestamp (UTC)
  std::string raw_expires;    // HTTP-date form, e.g. "Thu, 02 Jan 2020 03:04:05 GMT"

  bool operator==(const Cookie& o) const {
    return name == o.name && value == o.value && domain == o.domain &&
           path == o.path && secure == o.secure && http_only == o.http_only &&
           has_expires == o.has_expires && (!has_expires || expires == o.expires) &&
           raw_expires == o.raw_expires;
  }
  bool operator!=(const Cookie& o) const { return !(*this == o); }
};

// Engine page settings
struct PageSettings {
  bool javascript_enabled = true;
  bool load_images = true;
  bool local_to_remote_url_access_enabled = false;
  std::string user_agent;
  std::string user_name;
  std::string password;
  bool xss_auditing_enabled = false;
  bool web_security_enabled = true;
  int resource_timeout_ms = 0;  // 0 = no timeout

  bool operator==(const PageSettings& o) const {
    return javascript_enabled == o.javascript_enabled &&
           load_images == o.load_images &&
           local_to_remote_url_access_enabled == o.local_to_remote_url_access_enabled &&
           user_agent == o.user_agent && user_name == o.user_name &&
           password == o.password && xss_auditing_enabled == o.xss_auditing_enabled &&
           web_security_enabled == o.web_security_enabled &&
           resource_timeout_ms == o.resource_timeout_ms;
  }
  bool operator!=(const PageSettings& o) const { return !(*this == o); }
};

// Case-insensitive ordering for header names
struct HeaderNameLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

// HTTP header map. Names keep the case they were first set with but
// lookups and merges ignore case.
class HeaderMap {
 public:
  using Storage = std::map<std::string, std::vector<std::string>, HeaderNameLess>;
  using const_iterator = Storage::const_iterator;

  // Replace all values of |name|
  void Set(const std::string& name, const std::string& value);
  // Append a value to |name|
  void Add(const std::string& name, const std::string& value);
  void Del(const std::string& name);

  // First value of |name|, or "" when absent
  std::string Get(const std::string& name) const;
  std::vector<std::string> Values(const std::string& name) const;
  bool Has(const std::string& name) const;

  size_t Size() const { return headers_.size(); }
  bool Empty() const { return headers_.empty(); }
  void Clear() { headers_.clear(); }

  const_iterator begin() const { return headers_.begin(); }
  const_iterator end() const { return headers_.end(); }

  bool operator==(const HeaderMap& o) const;
  bool operator!=(const HeaderMap& o) const { return !(*this == o); }

 private:
  Storage headers_;
};

// Mouse and keyboard event kinds accepted by the engine
enum class MouseEventType {
  MOUSE_UP,
  MOUSE_DOWN,
  MOUSE_MOVE,
  CLICK,
  DOUBLE_CLICK
};

enum class KeyboardEventType {
  KEY_UP,
  KEY_DOWN,
  KEY_PRESS
};

enum class MouseButton {
  LEFT,
  RIGHT,
  MIDDLE
};

const char* MouseEventTypeToString(MouseEventType type);
const char* KeyboardEventTypeToString(KeyboardEventType type);
const char* MouseButtonToString(MouseButton button);

#endif  // WRAITH_TYPES_H_
