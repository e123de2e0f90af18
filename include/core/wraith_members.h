#ifndef WRAITH_MEMBERS_H_
#define WRAITH_MEMBERS_H_

#include <vector>

// Page members the control script dispatches on. Every name here must be a
// key of the script's member tables.
namespace WraithMember {

constexpr char kClose[] = "close";
constexpr char kOpen[] = "open";
constexpr char kCanGoBack[] = "canGoBack";
constexpr char kCanGoForward[] = "canGoForward";
constexpr char kGoBack[] = "goBack";
constexpr char kGoForward[] = "goForward";
constexpr char kGo[] = "go";
constexpr char kReload[] = "reload";
constexpr char kStop[] = "stop";
constexpr char kNavigationLocked[] = "navigationLocked";
constexpr char kSetNavigationLocked[] = "setNavigationLocked";
constexpr char kContent[] = "content";
constexpr char kSetContent[] = "setContent";
constexpr char kSetContentAndUrl[] = "setContentAndUrl";
constexpr char kPlainText[] = "plainText";
constexpr char kTitle[] = "title";
constexpr char kUrl[] = "url";
constexpr char kWindowName[] = "windowName";
constexpr char kFrameContent[] = "frameContent";
constexpr char kSetFrameContent[] = "setFrameContent";
constexpr char kFrameName[] = "frameName";
constexpr char kFramePlainText[] = "framePlainText";
constexpr char kFrameTitle[] = "frameTitle";
constexpr char kFrameUrl[] = "frameUrl";
constexpr char kFramesCount[] = "framesCount";
constexpr char kFramesName[] = "framesName";
constexpr char kFocusedFrameName[] = "focusedFrameName";
constexpr char kHasFrame[] = "hasFrame";
constexpr char kFocusedFramePath[] = "focusedFramePath";
constexpr char kEvaluateJavaScript[] = "evaluateJavaScript";
constexpr char kInjectJs[] = "injectJs";
constexpr char kIncludeJs[] = "includeJs";
constexpr char kLibraryPath[] = "libraryPath";
constexpr char kSetLibraryPath[] = "setLibraryPath";
constexpr char kCookies[] = "cookies";
constexpr char kSetCookies[] = "setCookies";
constexpr char kAddCookie[] = "addCookie";
constexpr char kDeleteCookie[] = "deleteCookie";
constexpr char kClearCookies[] = "clearCookies";
constexpr char kCustomHeaders[] = "customHeaders";
constexpr char kSetCustomHeaders[] = "setCustomHeaders";
constexpr char kClipRect[] = "clipRect";
constexpr char kSetClipRect[] = "setClipRect";
constexpr char kScrollPosition[] = "scrollPosition";
constexpr char kSetScrollPosition[] = "setScrollPosition";
constexpr char kViewportSize[] = "viewportSize";
constexpr char kSetViewportSize[] = "setViewportSize";
constexpr char kZoomFactor[] = "zoomFactor";
constexpr char kSetZoomFactor[] = "setZoomFactor";
constexpr char kPaperSize[] = "paperSize";
constexpr char kSetPaperSize[] = "setPaperSize";
constexpr char kRender[] = "render";
constexpr char kRenderBase64[] = "renderBase64";
constexpr char kSendMouseEvent[] = "sendMouseEvent";
constexpr char kSendKeyboardEvent[] = "sendKeyboardEvent";
constexpr char kUploadFile[] = "uploadFile";
constexpr char kSettings[] = "settings";
constexpr char kSetSettings[] = "setSettings";
constexpr char kOfflineStoragePath[] = "offlineStoragePath";
constexpr char kOfflineStorageQuota[] = "offlineStorageQuota";
constexpr char kOwnsPages[] = "ownsPages";
constexpr char kSetOwnsPages[] = "setOwnsPages";
constexpr char kPages[] = "pages";

// Every member above, in declaration order
inline const std::vector<const char*>& All() {
  static const std::vector<const char*> members = {
    kClose, kOpen, kCanGoBack, kCanGoForward, kGoBack, kGoForward, kGo, kReload, kStop,
    kNavigationLocked, kSetNavigationLocked, kContent, kSetContent, kSetContentAndUrl,
    kPlainText, kTitle, kUrl, kWindowName, kFrameContent, kSetFrameContent, kFrameName,
    kFramePlainText, kFrameTitle, kFrameUrl, kFramesCount, kFramesName, kFocusedFrameName,
    kHasFrame, kFocusedFramePath, kEvaluateJavaScript, kInjectJs, kIncludeJs,
    kLibraryPath, kSetLibraryPath, kCookies, kSetCookies, kAddCookie, kDeleteCookie,
    kClearCookies, kCustomHeaders, kSetCustomHeaders, kClipRect, kSetClipRect,
    kScrollPosition, kSetScrollPosition, kViewportSize, kSetViewportSize, kZoomFactor,
    kSetZoomFactor, kPaperSize, kSetPaperSize, kRender, kRenderBase64, kSendMouseEvent,
    kSendKeyboardEvent, kUploadFile, kSettings, kSetSettings, kOfflineStoragePath,
    kOfflineStorageQuota, kOwnsPages, kSetOwnsPages, kPages
  };
  return members;
}

}  // namespace WraithMember

#endif  // WRAITH_MEMBERS_H_
