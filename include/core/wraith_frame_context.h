#ifndef WRAITH_FRAME_CONTEXT_H_
#define WRAITH_FRAME_CONTEXT_H_

#include <string>
#include <vector>

// One step of a frame path: a child frame picked by name or by position
struct FrameSelector {
  bool by_name = true;
  std::string name;
  int index = 0;

  static FrameSelector ByName(const std::string& name);
  static FrameSelector ByIndex(int index);

  // "FRAME2" for names, "#1" for positions
  std::string ToString() const;

  bool operator==(const FrameSelector& o) const {
    return by_name == o.by_name && (by_name ? name == o.name : index == o.index);
  }
  bool operator!=(const FrameSelector& o) const { return !(*this == o); }
};

// Per-page frame navigation state.
//
// The state is the path of frame selectors leading from the top-level
// document to the selected frame; the empty path is the top-level document.
// Transitions are only applied after the engine confirmed that the target
// frame exists, so a failed switch never changes the state.
class WraithFrameContext {
 public:
  bool IsTopLevel() const { return path_.empty(); }
  size_t Depth() const { return path_.size(); }
  const std::vector<FrameSelector>& Path() const { return path_; }

  // Descend into a child of the current frame
  void Enter(const FrameSelector& selector);

  // Return to the parent frame. False when already at the top level.
  bool Leave();

  // Back to the top-level document
  void Reset();

  // Replace the whole path (used when following input focus)
  void Adopt(const std::vector<FrameSelector>& path);

  // "top" or the path joined with '/', e.g. "FRAME2/#0"
  std::string Describe() const;

 private:
  std::vector<FrameSelector> path_;
};

#endif  // WRAITH_FRAME_CONTEXT_H_
