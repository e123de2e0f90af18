#ifndef WRAITH_WEB_PAGE_H_
#define WRAITH_WEB_PAGE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "wraith_frame_context.h"
#include "wraith_page_registry.h"
#include "wraith_session.h"
#include "wraith_status.h"
#include "wraith_types.h"

using json = nlohmann::json;

// Handle to a page object living inside an engine process.
//
// Handles are cheap to copy; copies refer to the same remote page. Every
// operation is a synchronous call into the engine and returns a BridgeResult;
// getters write their value to the output argument only on success. Once the
// owning process is closed, or the page itself, every operation fails with
// INVALID_HANDLE.
class WraithWebPage {
 public:
  // Unbound handle; every operation fails with INVALID_HANDLE
  WraithWebPage() = default;
  WraithWebPage(std::shared_ptr<WraithSession> session, PageId id);

  // Local process-scoped id (not the engine's identifier)
  PageId GetId() const { return id_; }
  // True while both the page and its process are open
  bool IsValid() const;

  bool operator==(const WraithWebPage& o) const { return session_ == o.session_ && id_ == o.id_; }
  bool operator!=(const WraithWebPage& o) const { return !(*this == o); }

  // ==================== Lifecycle ====================

  // Release the remote page. Child pages it opened stay open.
  BridgeResult Close();

  // ==================== Navigation ====================

  // Load |url|; resets the frame context to the top-level document
  BridgeResult Open(const std::string& url);
  BridgeResult CanGoBack(bool& can_go_back);
  BridgeResult CanGoForward(bool& can_go_forward);
  BridgeResult GoBack();
  BridgeResult GoForward();
  BridgeResult Go(int index);
  BridgeResult Reload();
  BridgeResult Stop();
  BridgeResult GetNavigationLocked(bool& locked);
  BridgeResult SetNavigationLocked(bool locked);

  // ==================== Content ====================

  BridgeResult GetContent(std::string& content);
  // Replace the document; resets the frame context
  BridgeResult SetContent(const std::string& content);
  BridgeResult SetContentAndURL(const std::string& content, const std::string& url);
  BridgeResult GetPlainText(std::string& text);
  BridgeResult GetTitle(std::string& title);
  BridgeResult GetURL(std::string& url);
  BridgeResult GetWindowName(std::string& name);

  // ==================== Frames ====================

  // Frame accessors below act on the frame selected by the Switch* calls
  BridgeResult GetFrameContent(std::string& content);
  BridgeResult SetFrameContent(const std::string& content);
  BridgeResult GetFrameName(std::string& name);
  BridgeResult GetFramePlainText(std::string& text);
  BridgeResult GetFrameTitle(std::string& title);
  BridgeResult GetFrameURL(std::string& url);

  // Count and names of the top-level document's child frames, in document order
  BridgeResult GetFrameCount(int& count);
  BridgeResult GetFrameNames(std::vector<std::string>& names);

  // Name of the frame holding input focus, whatever frame is selected
  BridgeResult GetFocusedFrameName(std::string& name);

  // Select a direct child of the current frame. FRAME_NOT_FOUND leaves the
  // selection unchanged.
  BridgeResult SwitchToFrameName(const std::string& name);
  BridgeResult SwitchToFramePosition(int index);
  BridgeResult SwitchToMainFrame();
  // FRAME_NOT_FOUND when already at the top level
  BridgeResult SwitchToParentFrame();
  // Select the frame holding input focus
  BridgeResult SwitchToFocusedFrame();

  // Current selection: 0 = top-level document
  BridgeResult GetCurrentFrameDepth(size_t& depth);
  BridgeResult GetCurrentFramePath(std::vector<FrameSelector>& path);

  // ==================== Scripting ====================

  // |script| is a function source, e.g. "function() { return document.title; }"
  BridgeResult EvaluateJavaScript(const std::string& script, json& result);
  BridgeResult InjectJS(const std::string& path, bool& injected);
  BridgeResult IncludeJS(const std::string& url);
  BridgeResult GetLibraryPath(std::string& path);
  BridgeResult SetLibraryPath(const std::string& path);

  // ==================== Cookies & headers ====================

  BridgeResult GetCookies(std::vector<Cookie>& cookies);
  BridgeResult SetCookies(const std::vector<Cookie>& cookies);
  BridgeResult AddCookie(const Cookie& cookie, bool& added);
  BridgeResult DeleteCookie(const std::string& name, bool& deleted);
  BridgeResult ClearCookies();

  BridgeResult GetCustomHeaders(HeaderMap& headers);
  // Replaces the whole header set
  BridgeResult SetCustomHeaders(const HeaderMap& headers);

  // ==================== Geometry & rendering ====================

  BridgeResult GetClipRect(Rect& rect);
  BridgeResult SetClipRect(const Rect& rect);
  BridgeResult GetScrollPosition(Position& pos);
  BridgeResult SetScrollPosition(const Position& pos);
  BridgeResult GetViewportSize(ViewportSize& size);
  BridgeResult SetViewportSize(const ViewportSize& size);
  BridgeResult GetZoomFactor(double& factor);
  BridgeResult SetZoomFactor(double factor);
  BridgeResult GetPaperSize(PaperSize& size);
  BridgeResult SetPaperSize(const PaperSize& size);

  // |format| is "png", "jpeg", "gif" or "pdf"; quality -1 = engine default
  BridgeResult Render(const std::string& filename, const std::string& format, int quality = -1);
  BridgeResult RenderBase64(const std::string& format, std::string& data);

  // ==================== Input ====================

  BridgeResult SendMouseEvent(MouseEventType type, int x, int y,
                              MouseButton button = MouseButton::LEFT);
  BridgeResult SendKeyboardEvent(KeyboardEventType type, const std::string& key,
                                 int modifier = 0);
  BridgeResult UploadFile(const std::string& selector, const std::string& filename);

  // ==================== Settings & storage ====================

  BridgeResult GetSettings(PageSettings& settings);
  BridgeResult SetSettings(const PageSettings& settings);
  BridgeResult GetOfflineStoragePath(std::string& path);
  BridgeResult GetOfflineStorageQuota(int64_t& quota);

  // ==================== Child pages ====================

  BridgeResult GetOwnsPages(bool& owns_pages);
  // Track windows this page opens as child pages
  BridgeResult SetOwnsPages(bool owns_pages);
  // Open child pages in creation order
  BridgeResult GetPages(std::vector<WraithWebPage>& pages);
  // Window names of the open child pages in creation order; unnamed
  // windows are left out
  BridgeResult GetPageWindowNames(std::vector<std::string>& names);

 private:
  std::shared_ptr<WraithSession> session_;
  PageId id_ = 0;

  // INVALID_HANDLE unless the page and its process are open
  BridgeResult CheckHandle() const;
  BridgeResult Invoke(const std::string& member, const json& args = json::array(),
                      FrameScope scope = FrameScope::TOP_LEVEL);

  BridgeResult GetString(const std::string& member, std::string& out,
                         FrameScope scope = FrameScope::TOP_LEVEL);
  BridgeResult GetBool(const std::string& member, bool& out);
  BridgeResult SwitchToFrame(const FrameSelector& selector);
  BridgeResult SyncChildren(std::vector<PageId>& children);
};

#endif  // WRAITH_WEB_PAGE_H_
