#include "wraith_page_registry.h"
#include "logger.h"
#include <algorithm>
#include <set>

PageId WraithPageRegistry::Register(const std::string& remote_ref, PageId parent_id,
                                    const std::string& window_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return RegisterLocked(remote_ref, parent_id, window_name);
}

PageId WraithPageRegistry::RegisterLocked(const std::string& remote_ref, PageId parent_id,
                                          const std::string& window_name) {
  auto existing = by_ref_.find(remote_ref);
  if (existing != by_ref_.end()) {
    return existing->second;
  }

  PageRecord record;
  record.id = next_id_++;
  record.remote_ref = remote_ref;
  record.parent_id = parent_id;
  record.sequence = next_sequence_++;
  record.window_name = window_name;
  record.open = true;

  records_[record.id] = record;
  by_ref_[remote_ref] = record.id;

  LOG_DEBUG("Registry", "Registered page " + std::to_string(record.id) +
            (parent_id ? " (child of " + std::to_string(parent_id) + ")" : "") +
            (window_name.empty() ? "" : " window=" + window_name));
  return record.id;
}

bool WraithPageRegistry::Get(PageId id, PageRecord& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  out = it->second;
  return true;
}

PageId WraithPageRegistry::FindByRef(const std::string& remote_ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_ref_.find(remote_ref);
  return it != by_ref_.end() ? it->second : 0;
}

bool WraithPageRegistry::MarkClosed(PageId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end() || !it->second.open) {
    return false;
  }
  it->second.open = false;
  it->second.frame.Reset();
  return true;
}

void WraithPageRegistry::InvalidateAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : records_) {
    entry.second.open = false;
  }
}

bool WraithPageRegistry::SetFramePath(PageId id, const std::vector<FrameSelector>& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end() || !it->second.open) {
    return false;
  }
  it->second.frame.Adopt(path);
  return true;
}

bool WraithPageRegistry::ResetFrame(PageId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end() || !it->second.open) {
    return false;
  }
  it->second.frame.Reset();
  return true;
}

std::vector<PageId> WraithPageRegistry::SyncChildren(PageId parent_id,
                                                     const std::vector<RemotePageEntry>& entries) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::set<PageId> live;
  for (const auto& entry : entries) {
    PageId id = RegisterLocked(entry.ref, parent_id, entry.window_name);
    PageRecord& record = records_[id];
    // The engine may only learn the window name after creation
    if (record.window_name.empty() && !entry.window_name.empty()) {
      record.window_name = entry.window_name;
    }
    live.insert(id);
  }

  // Children the engine no longer lists were closed on its side
  for (auto& entry : records_) {
    PageRecord& record = entry.second;
    if (record.parent_id == parent_id && record.open && live.count(record.id) == 0) {
      LOG_DEBUG("Registry", "Page " + std::to_string(record.id) + " closed remotely");
      record.open = false;
    }
  }

  return GetChildrenLocked(parent_id);
}

std::vector<PageId> WraithPageRegistry::GetChildrenLocked(PageId parent_id) const {
  std::vector<const PageRecord*> children;
  for (const auto& entry : records_) {
    if (entry.second.parent_id == parent_id && entry.second.open) {
      children.push_back(&entry.second);
    }
  }
  std::sort(children.begin(), children.end(),
            [](const PageRecord* a, const PageRecord* b) { return a->sequence < b->sequence; });

  std::vector<PageId> ids;
  for (const auto* record : children) {
    ids.push_back(record->id);
  }
  return ids;
}

size_t WraithPageRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

size_t WraithPageRegistry::OpenCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& entry : records_) {
    if (entry.second.open) count++;
  }
  return count;
}
