#include "wraith_web_page.h"
#include "wraith_codec.h"
#include "wraith_members.h"
#include "logger.h"

WraithWebPage::WraithWebPage(std::shared_ptr<WraithSession> session, PageId id)
    : session_(std::move(session)), id_(id) {}

bool WraithWebPage::IsValid() const {
  return CheckHandle().success;
}

BridgeResult WraithWebPage::CheckHandle() const {
  if (!session_) {
    return BridgeResult::InvalidHandle("page is not bound to a process");
  }
  if (!session_->IsOpen()) {
    return BridgeResult::InvalidHandle("process is closed");
  }
  PageRecord record;
  if (!session_->Registry().Get(id_, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  if (!record.open) {
    return BridgeResult::InvalidHandle("page is closed");
  }
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::Invoke(const std::string& member, const json& args, FrameScope scope) {
  if (!session_) {
    return BridgeResult::InvalidHandle("page is not bound to a process");
  }
  return session_->Invoke(id_, member, args, scope);
}

BridgeResult WraithWebPage::GetString(const std::string& member, std::string& out,
                                      FrameScope scope) {
  BridgeResult result = Invoke(member, json::array(), scope);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeString(result.value, out)) {
    return BridgeResult::DecodeError(member);
  }
  return result;
}

BridgeResult WraithWebPage::GetBool(const std::string& member, bool& out) {
  BridgeResult result = Invoke(member);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeBool(result.value, out)) {
    return BridgeResult::DecodeError(member);
  }
  return result;
}

// ============================================================================
// Lifecycle
// ============================================================================

BridgeResult WraithWebPage::Close() {
  BridgeResult result = Invoke(WraithMember::kClose);
  if (result.success) {
    session_->Registry().MarkClosed(id_);
    LOG_DEBUG("WebPage", "Closed page " + std::to_string(id_));
  }
  return result;
}

// ============================================================================
// Navigation
// ============================================================================

BridgeResult WraithWebPage::Open(const std::string& url) {
  BridgeResult result = Invoke(WraithMember::kOpen, json::array({url}));
  if (session_) {
    // A new document has no frame selected, even when the load failed
    session_->Registry().ResetFrame(id_);
  }
  if (!result.success) {
    LOG_WARN("WebPage", "Failed to open " + url + ": " + result.message);
  }
  return result;
}

BridgeResult WraithWebPage::CanGoBack(bool& can_go_back) {
  return GetBool(WraithMember::kCanGoBack, can_go_back);
}

BridgeResult WraithWebPage::CanGoForward(bool& can_go_forward) {
  return GetBool(WraithMember::kCanGoForward, can_go_forward);
}

BridgeResult WraithWebPage::GoBack() {
  return Invoke(WraithMember::kGoBack);
}

BridgeResult WraithWebPage::GoForward() {
  return Invoke(WraithMember::kGoForward);
}

BridgeResult WraithWebPage::Go(int index) {
  return Invoke(WraithMember::kGo, json::array({index}));
}

BridgeResult WraithWebPage::Reload() {
  return Invoke(WraithMember::kReload);
}

BridgeResult WraithWebPage::Stop() {
  return Invoke(WraithMember::kStop);
}

BridgeResult WraithWebPage::GetNavigationLocked(bool& locked) {
  return GetBool(WraithMember::kNavigationLocked, locked);
}

BridgeResult WraithWebPage::SetNavigationLocked(bool locked) {
  return Invoke(WraithMember::kSetNavigationLocked, json::array({locked}));
}

// ============================================================================
// Content
// ============================================================================

BridgeResult WraithWebPage::GetContent(std::string& content) {
  return GetString(WraithMember::kContent, content);
}

BridgeResult WraithWebPage::SetContent(const std::string& content) {
  BridgeResult result = Invoke(WraithMember::kSetContent, json::array({content}));
  if (session_) {
    session_->Registry().ResetFrame(id_);
  }
  return result;
}

BridgeResult WraithWebPage::SetContentAndURL(const std::string& content, const std::string& url) {
  BridgeResult result = Invoke(WraithMember::kSetContentAndUrl, json::array({content, url}));
  if (session_) {
    session_->Registry().ResetFrame(id_);
  }
  return result;
}

BridgeResult WraithWebPage::GetPlainText(std::string& text) {
  return GetString(WraithMember::kPlainText, text);
}

BridgeResult WraithWebPage::GetTitle(std::string& title) {
  return GetString(WraithMember::kTitle, title);
}

BridgeResult WraithWebPage::GetURL(std::string& url) {
  return GetString(WraithMember::kUrl, url);
}

BridgeResult WraithWebPage::GetWindowName(std::string& name) {
  return GetString(WraithMember::kWindowName, name);
}

// ============================================================================
// Frames
// ============================================================================

BridgeResult WraithWebPage::GetFrameContent(std::string& content) {
  return GetString(WraithMember::kFrameContent, content, FrameScope::CURRENT);
}

BridgeResult WraithWebPage::SetFrameContent(const std::string& content) {
  return Invoke(WraithMember::kSetFrameContent, json::array({content}), FrameScope::CURRENT);
}

BridgeResult WraithWebPage::GetFrameName(std::string& name) {
  return GetString(WraithMember::kFrameName, name, FrameScope::CURRENT);
}

BridgeResult WraithWebPage::GetFramePlainText(std::string& text) {
  return GetString(WraithMember::kFramePlainText, text, FrameScope::CURRENT);
}

BridgeResult WraithWebPage::GetFrameTitle(std::string& title) {
  return GetString(WraithMember::kFrameTitle, title, FrameScope::CURRENT);
}

BridgeResult WraithWebPage::GetFrameURL(std::string& url) {
  return GetString(WraithMember::kFrameUrl, url, FrameScope::CURRENT);
}

BridgeResult WraithWebPage::GetFrameCount(int& count) {
  BridgeResult result = Invoke(WraithMember::kFramesCount);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeInt(result.value, count)) {
    return BridgeResult::DecodeError(WraithMember::kFramesCount);
  }
  return result;
}

BridgeResult WraithWebPage::GetFrameNames(std::vector<std::string>& names) {
  BridgeResult result = Invoke(WraithMember::kFramesName);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeStringList(result.value, names)) {
    return BridgeResult::DecodeError(WraithMember::kFramesName);
  }
  return result;
}

BridgeResult WraithWebPage::GetFocusedFrameName(std::string& name) {
  return GetString(WraithMember::kFocusedFrameName, name);
}

BridgeResult WraithWebPage::SwitchToFrameName(const std::string& name) {
  return SwitchToFrame(FrameSelector::ByName(name));
}

BridgeResult WraithWebPage::SwitchToFramePosition(int index) {
  return SwitchToFrame(FrameSelector::ByIndex(index));
}

BridgeResult WraithWebPage::SwitchToFrame(const FrameSelector& selector) {
  json target = WraithCodec::EncodeFramePath({selector})[0];
  BridgeResult result = Invoke(WraithMember::kHasFrame, json::array({target}), FrameScope::CURRENT);
  if (!result.success) {
    return result;
  }

  bool exists = false;
  if (!WraithCodec::DecodeBool(result.value, exists)) {
    return BridgeResult::DecodeError(WraithMember::kHasFrame);
  }
  if (!exists) {
    return BridgeResult::FrameNotFound(selector.ToString());
  }

  PageRecord record;
  if (!session_->Registry().Get(id_, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  std::vector<FrameSelector> path = record.frame.Path();
  path.push_back(selector);
  if (!session_->Registry().SetFramePath(id_, path)) {
    return BridgeResult::InvalidHandle("page is closed");
  }

  LOG_DEBUG("WebPage", "Page " + std::to_string(id_) + " frame -> " + selector.ToString());
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::SwitchToMainFrame() {
  BridgeResult check = CheckHandle();
  if (!check.success) {
    return check;
  }
  session_->Registry().ResetFrame(id_);
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::SwitchToParentFrame() {
  BridgeResult check = CheckHandle();
  if (!check.success) {
    return check;
  }

  PageRecord record;
  if (!session_->Registry().Get(id_, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  if (!record.frame.Leave()) {
    return BridgeResult::FrameNotFound("parent of top-level document");
  }
  if (!session_->Registry().SetFramePath(id_, record.frame.Path())) {
    return BridgeResult::InvalidHandle("page is closed");
  }
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::SwitchToFocusedFrame() {
  BridgeResult result = Invoke(WraithMember::kFocusedFramePath);
  if (!result.success) {
    return result;
  }

  std::vector<FrameSelector> path;
  if (!WraithCodec::DecodeFramePath(result.value, path)) {
    return BridgeResult::DecodeError(WraithMember::kFocusedFramePath);
  }
  if (!session_->Registry().SetFramePath(id_, path)) {
    return BridgeResult::InvalidHandle("page is closed");
  }
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::GetCurrentFrameDepth(size_t& depth) {
  std::vector<FrameSelector> path;
  BridgeResult result = GetCurrentFramePath(path);
  if (result.success) {
    depth = path.size();
  }
  return result;
}

BridgeResult WraithWebPage::GetCurrentFramePath(std::vector<FrameSelector>& path) {
  BridgeResult check = CheckHandle();
  if (!check.success) {
    return check;
  }
  PageRecord record;
  if (!session_->Registry().Get(id_, record)) {
    return BridgeResult::InvalidHandle("unknown page");
  }
  path = record.frame.Path();
  return BridgeResult::Success();
}

// ============================================================================
// Scripting
// ============================================================================

BridgeResult WraithWebPage::EvaluateJavaScript(const std::string& script, json& result) {
  BridgeResult r = Invoke(WraithMember::kEvaluateJavaScript, json::array({script}));
  if (r.success) {
    result = r.value;
  }
  return r;
}

BridgeResult WraithWebPage::InjectJS(const std::string& path, bool& injected) {
  BridgeResult result = Invoke(WraithMember::kInjectJs, json::array({path}));
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeBool(result.value, injected)) {
    return BridgeResult::DecodeError(WraithMember::kInjectJs);
  }
  return result;
}

BridgeResult WraithWebPage::IncludeJS(const std::string& url) {
  return Invoke(WraithMember::kIncludeJs, json::array({url}));
}

BridgeResult WraithWebPage::GetLibraryPath(std::string& path) {
  return GetString(WraithMember::kLibraryPath, path);
}

BridgeResult WraithWebPage::SetLibraryPath(const std::string& path) {
  return Invoke(WraithMember::kSetLibraryPath, json::array({path}));
}

// ============================================================================
// Cookies & headers
// ============================================================================

BridgeResult WraithWebPage::GetCookies(std::vector<Cookie>& cookies) {
  BridgeResult result = Invoke(WraithMember::kCookies);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeCookies(result.value, cookies)) {
    return BridgeResult::DecodeError(WraithMember::kCookies);
  }
  return result;
}

BridgeResult WraithWebPage::SetCookies(const std::vector<Cookie>& cookies) {
  return Invoke(WraithMember::kSetCookies, json::array({WraithCodec::EncodeCookies(cookies)}));
}

BridgeResult WraithWebPage::AddCookie(const Cookie& cookie, bool& added) {
  BridgeResult result = Invoke(WraithMember::kAddCookie, json::array({WraithCodec::EncodeCookie(cookie)}));
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeBool(result.value, added)) {
    return BridgeResult::DecodeError(WraithMember::kAddCookie);
  }
  return result;
}

BridgeResult WraithWebPage::DeleteCookie(const std::string& name, bool& deleted) {
  BridgeResult result = Invoke(WraithMember::kDeleteCookie, json::array({name}));
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeBool(result.value, deleted)) {
    return BridgeResult::DecodeError(WraithMember::kDeleteCookie);
  }
  return result;
}

BridgeResult WraithWebPage::ClearCookies() {
  return Invoke(WraithMember::kClearCookies);
}

BridgeResult WraithWebPage::GetCustomHeaders(HeaderMap& headers) {
  BridgeResult result = Invoke(WraithMember::kCustomHeaders);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeHeaders(result.value, headers)) {
    return BridgeResult::DecodeError(WraithMember::kCustomHeaders);
  }
  return result;
}

BridgeResult WraithWebPage::SetCustomHeaders(const HeaderMap& headers) {
  return Invoke(WraithMember::kSetCustomHeaders, json::array({WraithCodec::EncodeHeaders(headers)}));
}

// ============================================================================
// Geometry & rendering
// ============================================================================

BridgeResult WraithWebPage::GetClipRect(Rect& rect) {
  BridgeResult result = Invoke(WraithMember::kClipRect);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeRect(result.value, rect)) {
    return BridgeResult::DecodeError(WraithMember::kClipRect);
  }
  return result;
}

BridgeResult WraithWebPage::SetClipRect(const Rect& rect) {
  return Invoke(WraithMember::kSetClipRect, json::array({WraithCodec::EncodeRect(rect)}));
}

BridgeResult WraithWebPage::GetScrollPosition(Position& pos) {
  BridgeResult result = Invoke(WraithMember::kScrollPosition);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodePosition(result.value, pos)) {
    return BridgeResult::DecodeError(WraithMember::kScrollPosition);
  }
  return result;
}

BridgeResult WraithWebPage::SetScrollPosition(const Position& pos) {
  return Invoke(WraithMember::kSetScrollPosition, json::array({WraithCodec::EncodePosition(pos)}));
}

BridgeResult WraithWebPage::GetViewportSize(ViewportSize& size) {
  BridgeResult result = Invoke(WraithMember::kViewportSize);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeViewportSize(result.value, size)) {
    return BridgeResult::DecodeError(WraithMember::kViewportSize);
  }
  return result;
}

BridgeResult WraithWebPage::SetViewportSize(const ViewportSize& size) {
  return Invoke(WraithMember::kSetViewportSize, json::array({WraithCodec::EncodeViewportSize(size)}));
}

BridgeResult WraithWebPage::GetZoomFactor(double& factor) {
  BridgeResult result = Invoke(WraithMember::kZoomFactor);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeDouble(result.value, factor)) {
    return BridgeResult::DecodeError(WraithMember::kZoomFactor);
  }
  return result;
}

BridgeResult WraithWebPage::SetZoomFactor(double factor) {
  if (factor <= 0.0) {
    return BridgeResult::Failure(BridgeStatus::INVALID_PARAMETER,
                                 "Zoom factor must be positive");
  }
  return Invoke(WraithMember::kSetZoomFactor, json::array({factor}));
}

BridgeResult WraithWebPage::GetPaperSize(PaperSize& size) {
  BridgeResult result = Invoke(WraithMember::kPaperSize);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodePaperSize(result.value, size)) {
    return BridgeResult::DecodeError(WraithMember::kPaperSize);
  }
  return result;
}

BridgeResult WraithWebPage::SetPaperSize(const PaperSize& size) {
  return Invoke(WraithMember::kSetPaperSize, json::array({WraithCodec::EncodePaperSize(size)}));
}

BridgeResult WraithWebPage::Render(const std::string& filename, const std::string& format,
                                   int quality) {
  if (filename.empty()) {
    return BridgeResult::Failure(BridgeStatus::INVALID_PARAMETER, "Render needs a file name");
  }
  json options = json::object();
  if (!format.empty()) options["format"] = format;
  if (quality >= 0) options["quality"] = quality;
  return Invoke(WraithMember::kRender, json::array({filename, options}));
}

BridgeResult WraithWebPage::RenderBase64(const std::string& format, std::string& data) {
  BridgeResult result = Invoke(WraithMember::kRenderBase64, json::array({format}));
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeString(result.value, data)) {
    return BridgeResult::DecodeError(WraithMember::kRenderBase64);
  }
  return result;
}

// ============================================================================
// Input
// ============================================================================

BridgeResult WraithWebPage::SendMouseEvent(MouseEventType type, int x, int y, MouseButton button) {
  return Invoke(WraithMember::kSendMouseEvent, json::array({MouseEventTypeToString(type), x, y,
                                               MouseButtonToString(button)}));
}

BridgeResult WraithWebPage::SendKeyboardEvent(KeyboardEventType type, const std::string& key,
                                              int modifier) {
  return Invoke(WraithMember::kSendKeyboardEvent,
                json::array({KeyboardEventTypeToString(type), key, modifier}));
}

BridgeResult WraithWebPage::UploadFile(const std::string& selector, const std::string& filename) {
  return Invoke(WraithMember::kUploadFile, json::array({selector, filename}));
}

// ============================================================================
// Settings & storage
// ============================================================================

BridgeResult WraithWebPage::GetSettings(PageSettings& settings) {
  BridgeResult result = Invoke(WraithMember::kSettings);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeSettings(result.value, settings)) {
    return BridgeResult::DecodeError(WraithMember::kSettings);
  }
  return result;
}

BridgeResult WraithWebPage::SetSettings(const PageSettings& settings) {
  return Invoke(WraithMember::kSetSettings, json::array({WraithCodec::EncodeSettings(settings)}));
}

BridgeResult WraithWebPage::GetOfflineStoragePath(std::string& path) {
  return GetString(WraithMember::kOfflineStoragePath, path);
}

BridgeResult WraithWebPage::GetOfflineStorageQuota(int64_t& quota) {
  BridgeResult result = Invoke(WraithMember::kOfflineStorageQuota);
  if (!result.success) {
    return result;
  }
  if (!WraithCodec::DecodeInt64(result.value, quota)) {
    return BridgeResult::DecodeError(WraithMember::kOfflineStorageQuota);
  }
  return result;
}

// ============================================================================
// Child pages
// ============================================================================

BridgeResult WraithWebPage::GetOwnsPages(bool& owns_pages) {
  return GetBool(WraithMember::kOwnsPages, owns_pages);
}

BridgeResult WraithWebPage::SetOwnsPages(bool owns_pages) {
  return Invoke(WraithMember::kSetOwnsPages, json::array({owns_pages}));
}

BridgeResult WraithWebPage::SyncChildren(std::vector<PageId>& children) {
  BridgeResult result = Invoke(WraithMember::kPages);
  if (!result.success) {
    return result;
  }

  std::vector<RemotePageEntry> entries;
  if (!WraithCodec::DecodePageEntries(result.value, entries)) {
    return BridgeResult::DecodeError(WraithMember::kPages);
  }
  children = session_->Registry().SyncChildren(id_, entries);
  return BridgeResult::Success();
}

BridgeResult WraithWebPage::GetPages(std::vector<WraithWebPage>& pages) {
  std::vector<PageId> children;
  BridgeResult result = SyncChildren(children);
  if (!result.success) {
    return result;
  }

  pages.clear();
  for (PageId child : children) {
    pages.push_back(WraithWebPage(session_, child));
  }
  return result;
}

BridgeResult WraithWebPage::GetPageWindowNames(std::vector<std::string>& names) {
  std::vector<PageId> children;
  BridgeResult result = SyncChildren(children);
  if (!result.success) {
    return result;
  }

  names.clear();
  for (PageId child : children) {
    PageRecord record;
    if (session_->Registry().Get(child, record) && !record.window_name.empty()) {
      names.push_back(record.window_name);
    }
  }
  return result;
}
