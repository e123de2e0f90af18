#include "wraith_types.h"
#include <algorithm>
#include <cctype>

bool HeaderNameLess::operator()(const std::string& a, const std::string& b) const {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

void HeaderMap::Set(const std::string& name, const std::string& value) {
  auto it = headers_.find(name);
  if (it != headers_.end()) {
    it->second.assign(1, value);
    return;
  }
  headers_.emplace(name, std::vector<std::string>{value});
}

void HeaderMap::Add(const std::string& name, const std::string& value) {
  headers_[name].push_back(value);
}

void HeaderMap::Del(const std::string& name) {
  headers_.erase(name);
}

std::string HeaderMap::Get(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end() || it->second.empty()) {
    return "";
  }
  return it->second.front();
}

std::vector<std::string> HeaderMap::Values(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end()) {
    return {};
  }
  return it->second;
}

bool HeaderMap::Has(const std::string& name) const {
  return headers_.find(name) != headers_.end();
}

bool HeaderMap::operator==(const HeaderMap& o) const {
  if (headers_.size() != o.headers_.size()) {
    return false;
  }
  for (const auto& entry : headers_) {
    auto it = o.headers_.find(entry.first);
    if (it == o.headers_.end() || it->second != entry.second) {
      return false;
    }
  }
  return true;
}

const char* MouseEventTypeToString(MouseEventType type) {
  switch (type) {
    case MouseEventType::MOUSE_UP: return "mouseup";
    case MouseEventType::MOUSE_DOWN: return "mousedown";
    case MouseEventType::MOUSE_MOVE: return "mousemove";
    case MouseEventType::CLICK: return "click";
    case MouseEventType::DOUBLE_CLICK: return "doubleclick";
    default: return "click";
  }
}

const char* KeyboardEventTypeToString(KeyboardEventType type) {
  switch (type) {
    case KeyboardEventType::KEY_UP: return "keyup";
    case KeyboardEventType::KEY_DOWN: return "keydown";
    case KeyboardEventType::KEY_PRESS: return "keypress";
    default: return "keypress";
  }
}

const char* MouseButtonToString(MouseButton button) {
  switch (button) {
    case MouseButton::LEFT: return "left";
    case MouseButton::RIGHT: return "right";
    case MouseButton::MIDDLE: return "middle";
    default: return "left";
  }
}
