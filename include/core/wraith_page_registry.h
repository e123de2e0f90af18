#ifndef WRAITH_PAGE_REGISTRY_H_
#define WRAITH_PAGE_REGISTRY_H_

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "wraith_codec.h"
#include "wraith_frame_context.h"

// Process-scoped local page id. 0 is never allocated.
using PageId = uint64_t;

// Local bookkeeping for one remote page object
struct PageRecord {
  PageId id = 0;
  std::string remote_ref;         // engine-side identifier, never handed to callers
  PageId parent_id = 0;           // 0 = created through CreateWebPage
  uint64_t sequence = 0;          // creation order within the process
  std::string window_name;        // target name the window was opened with
  bool open = false;
  WraithFrameContext frame;
};

// Arena of remote page identities for one engine process.
//
// Maps the engine's page refs to stable local ids and keeps the parent/child
// relation between pages. Children are discovered lazily: each time a
// parent's child list is fetched from the engine it is reconciled here, new
// refs get an id and pages that disappeared remotely are marked closed.
class WraithPageRegistry {
 public:
  // Record a page. Registering a known ref returns its existing id.
  PageId Register(const std::string& remote_ref, PageId parent_id,
                  const std::string& window_name);

  // Copy of the record for |id|; false if the id was never allocated
  bool Get(PageId id, PageRecord& out) const;
  PageId FindByRef(const std::string& remote_ref) const;

  // False if |id| is unknown or already closed
  bool MarkClosed(PageId id);
  void InvalidateAll();

  // Frame context updates
  bool SetFramePath(PageId id, const std::vector<FrameSelector>& path);
  bool ResetFrame(PageId id);

  // Reconcile the engine's live child list of |parent_id|. Returns the ids of
  // the open children in creation order.
  std::vector<PageId> SyncChildren(PageId parent_id, const std::vector<RemotePageEntry>& entries);

  size_t Size() const;
  size_t OpenCount() const;

 private:
  mutable std::mutex mutex_;

  // Page id -> record
  std::map<PageId, PageRecord> records_;

  // Remote ref -> page id
  std::map<std::string, PageId> by_ref_;

  PageId next_id_ = 1;
  uint64_t next_sequence_ = 1;

  PageId RegisterLocked(const std::string& remote_ref, PageId parent_id,
                        const std::string& window_name);
  std::vector<PageId> GetChildrenLocked(PageId parent_id) const;
};

#endif  // WRAITH_PAGE_REGISTRY_H_
