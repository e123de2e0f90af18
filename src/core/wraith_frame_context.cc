#include "wraith_frame_context.h"

FrameSelector FrameSelector::ByName(const std::string& name) {
  FrameSelector s;
  s.by_name = true;
  s.name = name;
  return s;
}

FrameSelector FrameSelector::ByIndex(int index) {
  FrameSelector s;
  s.by_name = false;
  s.index = index;
  return s;
}

std::string FrameSelector::ToString() const {
  return by_name ? name : "#" + std::to_string(index);
}

void WraithFrameContext::Enter(const FrameSelector& selector) {
  path_.push_back(selector);
}

bool WraithFrameContext::Leave() {
  if (path_.empty()) {
    return false;
  }
  path_.pop_back();
  return true;
}

void WraithFrameContext::Reset() {
  path_.clear();
}

void WraithFrameContext::Adopt(const std::vector<FrameSelector>& path) {
  path_ = path;
}

std::string WraithFrameContext::Describe() const {
  if (path_.empty()) {
    return "top";
  }
  std::string out;
  for (size_t i = 0; i < path_.size(); i++) {
    if (i > 0) out += "/";
    out += path_[i].ToString();
  }
  return out;
}
