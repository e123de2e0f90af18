// End-to-end checks of the bridge against wraith_fake_engine, a stand-in
// engine that serves the fixture site http://fixture.test/.
//
// Usage: wraith_bridge_tests [--quiet] [engine-path]

#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "test_runner.h"
#include "wraith_process.h"
#include "wraith_web_page.h"
#include "wraith_platform_utils.h"
#include "logger.h"

using json = nlohmann::json;

#ifndef WRAITH_FAKE_ENGINE_PATH
#define WRAITH_FAKE_ENGINE_PATH "wraith_fake_engine"
#endif

namespace {

std::string g_engine_path = WRAITH_FAKE_ENGINE_PATH;
std::string g_scratch_dir;

const char kFixtureBase[] = "http://fixture.test/";

std::string Fixture(const std::string& name) {
    return kFixtureBase + name;
}

ProcessConfig FakeEngineConfig() {
    ProcessConfig config;
    config.engine_path = g_engine_path;
    config.readiness_timeout_ms = 5000;
    config.shutdown_timeout_ms = 2000;
    return config;
}

// Opens |process| and one page in it, recording both steps
bool OpenPage(TestRunner& runner, WraithProcess& process, WraithWebPage& page) {
    if (!process.IsOpen()) {
        TestResult opened = runner.Test("open process", [&] { return process.Open(); });
        if (!opened.success) {
            return false;
        }
    }
    return runner.Test("create page", [&] { return process.CreateWebPage(page); }).success;
}

template <typename T>
std::function<std::string(const BridgeResult&)> Yields(const T& actual, const T& expected,
                                                       const std::string& what) {
    return [&actual, expected, what](const BridgeResult&) {
        return ExpectEqual(actual, expected, what);
    };
}

std::function<std::string(const BridgeResult&)> PageCount(const std::vector<WraithWebPage>& pages,
                                                          size_t expected) {
    return [&pages, expected](const BridgeResult&) {
        return ExpectEqual(pages.size(), expected, "page count");
    };
}

// ============================================================================
// Lifecycle
// ============================================================================

void RunLifecycleTests(TestRunner& runner) {
    runner.SetCategory("lifecycle");

    {
        WraithProcess process(FakeEngineConfig());
        WraithWebPage page;
        runner.TestExpectStatus("create page before open", BridgeStatus::REGISTRY_ERROR,
                                [&] { return process.CreateWebPage(page); });
        runner.TestExpectStatus("close before open", BridgeStatus::ALREADY_CLOSED,
                                [&] { return process.Close(); });
        runner.Check("unbound page handle is invalid", !page.IsValid());
    }

    {
        ProcessConfig config = FakeEngineConfig();
        config.engine_path = "/nonexistent/wraith-engine";
        WraithProcess process(config);
        runner.TestExpectStatus("missing engine executable", BridgeStatus::LAUNCH_ERROR,
                                [&] { return process.Open(); });
        runner.Check("failed launch leaves the process unopened",
                     process.GetState() == ProcessState::UNOPENED);
    }

    {
        // Executable bit set, but execv cannot run it
        std::string bogus = g_scratch_dir + "/not-an-engine";
        std::string error;
        bool written = WraithPlatform::WriteFile(bogus, "\x7f" "garbage\n", error) &&
                       chmod(bogus.c_str(), 0755) == 0;
        runner.Check("write unrunnable engine", written, error);
        if (written) {
            ProcessConfig config = FakeEngineConfig();
            config.engine_path = bogus;
            WraithProcess process(config);
            runner.TestExpectStatus("exec failure is reported from the child", BridgeStatus::LAUNCH_ERROR,
                                    [&] { return process.Open(); });
            runner.Check("exec failure leaves the process unopened",
                         process.GetState() == ProcessState::UNOPENED);
        }
    }

    {
        ProcessConfig config = FakeEngineConfig();
        config.working_dir = "/nonexistent/wraith-workdir";
        WraithProcess process(config);
        runner.TestExpectStatus("missing working directory", BridgeStatus::LAUNCH_ERROR,
                                [&] { return process.Open(); });
    }

    {
        ProcessConfig config = FakeEngineConfig();
        config.engine_args = {"--fake-no-listen"};
        config.readiness_timeout_ms = 500;
        WraithProcess process(config);
        runner.TestExpectStatus("engine that never answers", BridgeStatus::TIMEOUT,
                                [&] { return process.Open(); });
        runner.Check("no process is left open after a timeout", !process.IsOpen());
    }

    {
        WraithProcess process(FakeEngineConfig());
        WraithWebPage page;
        if (!OpenPage(runner, process, page)) {
            return;
        }

        runner.Check("process reports its endpoint",
                     process.Port() > 0 && process.Pid() > 0 && !process.InstanceId().empty() &&
                     process.URL() == "http://127.0.0.1:" + std::to_string(process.Port()));
        runner.Check("resolved engine is executable",
                     !process.EnginePath().empty() &&
                     WraithPlatform::IsExecutable(process.EnginePath()));
        runner.Check("control script is in the process directory",
                     WraithPlatform::IsExecutable(g_engine_path) &&
                     access((process.Path() + "/shim.js").c_str(), R_OK) == 0);

        runner.TestExpectStatus("open twice", BridgeStatus::INVALID_PARAMETER,
                                [&] { return process.Open(); });

        std::string dir = process.Path();
        runner.Test("close", [&] { return process.Close(); });
        runner.Check("closed state", process.GetState() == ProcessState::CLOSED);
        runner.Check("process directory removed", access(dir.c_str(), F_OK) != 0);
        runner.TestExpectStatus("close again", BridgeStatus::ALREADY_CLOSED,
                                [&] { return process.Close(); });

        std::string url;
        runner.TestExpectStatus("page of a closed process", BridgeStatus::INVALID_HANDLE,
                                [&] { return page.GetURL(url); });
        runner.TestExpectStatus("create page after close", BridgeStatus::REGISTRY_ERROR,
                                [&] { return process.CreateWebPage(page); });

        runner.Test("reopen", [&] { return process.Open(); });
        runner.TestExpectStatus("handle from the earlier run stays invalid",
                                BridgeStatus::INVALID_HANDLE, [&] { return page.GetURL(url); });

        WraithWebPage fresh;
        runner.Test("create page after reopen", [&] { return process.CreateWebPage(fresh); });
        runner.TestWithValidator("fresh page starts blank",
                                 [&] { return fresh.GetURL(url); },
                                 Yields(url, std::string("about:blank"), "url"));
        runner.Test("close reopened process", [&] { return process.Close(); });
    }
}

// ============================================================================
// Failure handling
// ============================================================================

void RunFailureTests(TestRunner& runner) {
    runner.SetCategory("failures");

    {
        WraithProcess process(FakeEngineConfig());
        WraithWebPage page;
        if (!OpenPage(runner, process, page)) {
            return;
        }
        runner.Test("open fixture", [&] { return page.Open(Fixture("ok.html")); });

        json value;
        runner.TestExpectStatus(
            "script error is reported", BridgeStatus::REMOTE_ERROR,
            [&] { return page.EvaluateJavaScript("function() { throw new Error('boom'); }", value); });
        runner.Check("process survives a remote error", process.IsOpen());

        runner.TestExpectStatus("failed navigation", BridgeStatus::REMOTE_ERROR,
                                [&] { return page.Open(Fixture("missing.html")); });

        // Raw channel to the same engine, for members no page method sends
        WraithTransport channel(process.Port(), 2000);
        BridgeResult created = channel.Create();
        runner.Check("raw channel creates a page", created.success && created.value.is_string(),
                     created.message);
        if (created.success) {
            runner.TestExpectStatus("unknown member", BridgeStatus::REMOTE_ERROR, [&] {
                return channel.Call(created.value.get<std::string>(), "noSuchMember");
            });
        }

        std::string title;
        runner.Test("page usable after remote errors", [&] { return page.GetTitle(title); });

        kill(process.Pid(), SIGKILL);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        runner.TestExpectStatus("call into a crashed engine", BridgeStatus::TRANSPORT_ERROR,
                                [&] { return page.GetTitle(title); });
        runner.Check("crash closes the process", process.GetState() == ProcessState::CLOSED);
        runner.TestExpectStatus("later calls are rejected locally", BridgeStatus::INVALID_HANDLE,
                                [&] { return page.GetTitle(title); });
        runner.TestExpectStatus("close after crash", BridgeStatus::ALREADY_CLOSED,
                                [&] { return process.Close(); });
    }

    {
        ProcessConfig config = FakeEngineConfig();
        config.call_timeout_ms = 300;
        WraithProcess process(config);
        WraithWebPage page;
        if (!OpenPage(runner, process, page)) {
            return;
        }

        json value;
        runner.TestExpectStatus("slow call times out", BridgeStatus::TIMEOUT,
                                [&] { return page.EvaluateJavaScript("function() { sleep(1000); }", value); });
        runner.Check("timeout keeps the process open", process.IsOpen());

        // Let the engine finish the slow script before the next call
        std::this_thread::sleep_for(std::chrono::milliseconds(1200));
        runner.TestWithValidator("calls work after a timeout",
                                 [&] { return page.EvaluateJavaScript("function() { return 7; }", value); },
                                 [&](const BridgeResult&) { return ExpectEqual(value, json(7), "value"); });
        runner.Test("close", [&] { return process.Close(); });
    }

    {
        WraithProcess process(FakeEngineConfig());
        WraithWebPage page;
        if (!OpenPage(runner, process, page)) {
            return;
        }

        json value;
        std::string text;
        std::vector<WraithWebPage> children;
        runner.Test("open links page", [&] { return page.Open(Fixture("links.html")); });
        runner.Test("open a child window",
                    [&] { return page.EvaluateJavaScript(
                              "function() { document.getElementById('link').click(); }", value); });
        runner.TestWithValidator("child window is listed", [&] { return page.GetPages(children); },
                                 PageCount(children, 1));

        BridgeResult inflight;
        long long inflight_ms = -1;
        std::thread slow([&page, &inflight, &inflight_ms] {
            auto start = std::chrono::steady_clock::now();
            json slow_value;
            inflight = page.EvaluateJavaScript("function() { sleep(5000); }", slow_value);
            inflight_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        runner.Test("close with a call in flight", [&] { return process.Close(); });
        slow.join();

        runner.Check("in-flight call ends with a transport error",
                     inflight.status == BridgeStatus::TRANSPORT_ERROR,
                     std::string(BridgeStatusToCode(inflight.status)) + ": " + inflight.message);
        runner.Check("in-flight call returns without waiting for the script",
                     inflight_ms >= 0 && inflight_ms < 3000,
                     std::to_string(inflight_ms) + "ms");
        if (!children.empty()) {
            runner.TestExpectStatus("child page of a closed process", BridgeStatus::INVALID_HANDLE,
                                    [&] { return children[0].GetURL(text); });
        }
    }
}

// ============================================================================
// Navigation & content
// ============================================================================

void RunNavigationTests(TestRunner& runner, WraithWebPage& page) {
    runner.SetCategory("navigation");

    std::string text;
    bool flag = true;

    runner.Test("open", [&] { return page.Open(Fixture("ok.html")); });
    runner.TestWithValidator("content is serialized markup", [&] { return page.GetContent(text); },
                             Yields(text, std::string("<html><head></head><body>OK</body></html>"),
                                    "content"));
    runner.TestWithValidator("cannot go back after first load", [&] { return page.CanGoBack(flag); },
                             Yields(flag, false, "canGoBack"));

    runner.Test("open second page", [&] { return page.Open(Fixture("page2.html")); });
    runner.TestWithValidator("can go back", [&] { return page.CanGoBack(flag); },
                             Yields(flag, true, "canGoBack"));
    runner.Test("go back", [&] { return page.GoBack(); });
    runner.TestWithValidator("back at the first page", [&] { return page.GetURL(text); },
                             Yields(text, Fixture("ok.html"), "url"));
    runner.TestWithValidator("can go forward", [&] { return page.CanGoForward(flag); },
                             Yields(flag, true, "canGoForward"));
    runner.Test("go forward", [&] { return page.GoForward(); });
    runner.Test("go by offset", [&] { return page.Go(-1); });
    runner.TestWithValidator("offset navigation", [&] { return page.GetURL(text); },
                             Yields(text, Fixture("ok.html"), "url"));
    runner.Test("reload", [&] { return page.Reload(); });
    runner.Test("stop", [&] { return page.Stop(); });

    runner.TestWithValidator("navigation unlocked by default",
                             [&] { return page.GetNavigationLocked(flag); },
                             Yields(flag, false, "navigationLocked"));
    runner.Test("lock navigation", [&] { return page.SetNavigationLocked(true); });
    runner.TestExpectStatus("locked page refuses to navigate", BridgeStatus::REMOTE_ERROR,
                            [&] { return page.Open(Fixture("page2.html")); });
    runner.Test("unlock navigation", [&] { return page.SetNavigationLocked(false); });

    runner.Test("open titled page", [&] { return page.Open(Fixture("title.html")); });
    runner.TestWithValidator("title", [&] { return page.GetTitle(text); },
                             Yields(text, std::string("TEST TITLE"), "title"));
    runner.TestWithValidator("plain text", [&] { return page.GetPlainText(text); },
                             Yields(text, std::string("FOO"), "plainText"));
    runner.TestWithValidator("top-level window has no name", [&] { return page.GetWindowName(text); },
                             Yields(text, std::string(), "windowName"));

    runner.Test("set content", [&] { return page.SetContent("<p>HI</p>"); });
    runner.TestWithValidator("content replaced", [&] { return page.GetContent(text); },
                             Yields(text, std::string("<html><head></head><body><p>HI</p></body></html>"),
                                    "content"));
    runner.Test("set content and url",
                [&] { return page.SetContentAndURL("BYE", Fixture("custom.html")); });
    runner.TestWithValidator("url replaced", [&] { return page.GetURL(text); },
                             Yields(text, Fixture("custom.html"), "url"));
}

// ============================================================================
// Frames
// ============================================================================

void RunFrameTests(TestRunner& runner, WraithWebPage& page) {
    runner.SetCategory("frames");

    std::string text;
    int count = 0;
    size_t depth = 99;
    std::vector<std::string> names;

    runner.Test("open frameset", [&] { return page.Open(Fixture("frameset.html")); });
    runner.TestWithValidator("frame count", [&] { return page.GetFrameCount(count); },
                             Yields(count, 2, "framesCount"));
    runner.TestWithValidator("frame names", [&] { return page.GetFrameNames(names); },
                             Yields(names, std::vector<std::string>{"FRAME1", "FRAME2"}, "framesName"));
    runner.TestWithValidator("starts at the top level", [&] { return page.GetCurrentFrameDepth(depth); },
                             Yields(depth, size_t(0), "depth"));

    runner.Test("switch to frame by name", [&] { return page.SwitchToFrameName("FRAME2"); });
    runner.TestWithValidator("frame name", [&] { return page.GetFrameName(text); },
                             Yields(text, std::string("FRAME2"), "frameName"));
    runner.TestWithValidator("frame plain text", [&] { return page.GetFramePlainText(text); },
                             Yields(text, std::string("BAR"), "framePlainText"));
    runner.TestWithValidator("frame title", [&] { return page.GetFrameTitle(text); },
                             Yields(text, std::string("TEST TITLE"), "frameTitle"));
    runner.TestWithValidator("top-level calls ignore the selected frame",
                             [&] { return page.GetFrameCount(count); },
                             Yields(count, 2, "framesCount"));

    runner.Test("set frame content", [&] { return page.SetFrameContent("NEW CONTENT"); });
    runner.TestWithValidator("frame content replaced", [&] { return page.GetFrameContent(text); },
                             Yields(text, std::string("<html><head></head><body>NEW CONTENT</body></html>"),
                                    "frameContent"));

    runner.TestExpectStatus("switch to a missing frame", BridgeStatus::FRAME_NOT_FOUND,
                            [&] { return page.SwitchToFrameName("MISSING"); });
    runner.TestWithValidator("failed switch keeps the selection",
                             [&] { return page.GetCurrentFrameDepth(depth); },
                             Yields(depth, size_t(1), "depth"));

    runner.Test("switch to parent", [&] { return page.SwitchToParentFrame(); });
    runner.TestExpectStatus("no parent above the top level", BridgeStatus::FRAME_NOT_FOUND,
                            [&] { return page.SwitchToParentFrame(); });

    runner.Test("switch to frame by position", [&] { return page.SwitchToFramePosition(1); });
    runner.TestWithValidator("frame url", [&] { return page.GetFrameURL(text); },
                             Yields(text, Fixture("frame2.html"), "frameUrl"));
    runner.TestExpectStatus("position out of range", BridgeStatus::FRAME_NOT_FOUND,
                            [&] { return page.SwitchToFramePosition(5); });
    runner.Test("switch to main frame", [&] { return page.SwitchToMainFrame(); });
    runner.TestWithValidator("main frame content", [&] { return page.GetFrameName(text); },
                             Yields(text, std::string(), "frameName"));

    runner.Test("open nested frameset", [&] { return page.Open(Fixture("nested.html")); });
    runner.Test("enter outer frame", [&] { return page.SwitchToFrameName("OUTER"); });
    runner.Test("enter inner frame", [&] { return page.SwitchToFrameName("FRAME1"); });
    runner.TestWithValidator("inner frame title", [&] { return page.GetFrameTitle(text); },
                             Yields(text, std::string("FRAME ONE"), "frameTitle"));
    std::vector<FrameSelector> path;
    runner.TestWithValidator("frame path", [&] { return page.GetCurrentFramePath(path); },
                             Yields(path, std::vector<FrameSelector>{FrameSelector::ByName("OUTER"),
                                                                     FrameSelector::ByName("FRAME1")},
                                    "path"));
    runner.Test("back to outer frame", [&] { return page.SwitchToParentFrame(); });
    runner.TestWithValidator("outer frame name", [&] { return page.GetFrameName(text); },
                             Yields(text, std::string("OUTER"), "frameName"));
    runner.Test("navigation resets the selection", [&] { return page.Open(Fixture("focus.html")); });
    runner.TestWithValidator("selection is back at the top", [&] { return page.GetCurrentFrameDepth(depth); },
                             Yields(depth, size_t(0), "depth"));

    runner.TestWithValidator("focused frame name", [&] { return page.GetFocusedFrameName(text); },
                             Yields(text, std::string("FRAME2"), "focusedFrameName"));
    runner.Test("switch to focused frame", [&] { return page.SwitchToFocusedFrame(); });
    runner.TestWithValidator("focused frame selected", [&] { return page.GetFrameName(text); },
                             Yields(text, std::string("FRAME2"), "frameName"));

    runner.Test("open page with an unnamed frame", [&] { return page.Open(Fixture("focus_nested.html")); });
    runner.Test("switch to focus below an unnamed frame", [&] { return page.SwitchToFocusedFrame(); });
    runner.TestWithValidator("unnamed ancestor is selected by position",
                             [&] { return page.GetCurrentFramePath(path); },
                             Yields(path, std::vector<FrameSelector>{FrameSelector::ByIndex(0),
                                                                     FrameSelector::ByName("FRAME2")},
                                    "path"));
    runner.TestWithValidator("focused frame is usable", [&] { return page.GetFrameURL(text); },
                             Yields(text, Fixture("focus_frame.html"), "frameUrl"));
    runner.Test("up to the unnamed frame", [&] { return page.SwitchToParentFrame(); });
    runner.TestWithValidator("unnamed frame url", [&] { return page.GetFrameURL(text); },
                             Yields(text, Fixture("focus.html"), "frameUrl"));
}

// ============================================================================
// Scripting
// ============================================================================

void RunScriptingTests(TestRunner& runner, WraithProcess& process, WraithWebPage& page) {
    runner.SetCategory("scripting");

    json value;
    std::string text;
    bool flag = false;

    runner.Test("open titled page", [&] { return page.Open(Fixture("title.html")); });
    runner.TestWithValidator("evaluate returns numbers",
                             [&] { return page.EvaluateJavaScript("function() { return 42; }", value); },
                             [&](const BridgeResult&) { return ExpectEqual(value, json(42), "value"); });
    runner.TestWithValidator("evaluate returns strings",
                             [&] { return page.EvaluateJavaScript("function() { return 'abc'; }", value); },
                             [&](const BridgeResult&) { return ExpectEqual(value, json("abc"), "value"); });
    runner.TestWithValidator("evaluate reads the document",
                             [&] { return page.EvaluateJavaScript("function() { return document.title; }", value); },
                             [&](const BridgeResult&) { return ExpectEqual(value, json("TEST TITLE"), "value"); });

    runner.TestWithValidator("library path defaults to the process directory",
                             [&] { return page.GetLibraryPath(text); },
                             Yields(text, process.Path(), "libraryPath"));
    runner.TestWithValidator("inject script from the library path",
                             [&] { return page.InjectJS("shim.js", flag); },
                             Yields(flag, true, "injectJs"));
    runner.TestWithValidator("inject missing script",
                             [&] { return page.InjectJS("missing.js", flag); },
                             Yields(flag, false, "injectJs"));
    runner.Test("set library path", [&] { return page.SetLibraryPath("/tmp"); });
    runner.TestWithValidator("library path updated", [&] { return page.GetLibraryPath(text); },
                             Yields(text, std::string("/tmp"), "libraryPath"));
    runner.Test("include remote script", [&] { return page.IncludeJS(Fixture("lib.js")); });
}

// ============================================================================
// Cookies & headers
// ============================================================================

void RunCookieTests(TestRunner& runner, WraithWebPage& page) {
    runner.SetCategory("cookies");

    Cookie cookie;
    cookie.name = "NAME";
    cookie.value = "VALUE";
    cookie.domain = "fixture.test";
    cookie.path = "/";
    cookie.http_only = true;
    cookie.secure = false;
    cookie.has_expires = true;
    cookie.expires = 1577934245;
    cookie.raw_expires = "Thu, 02 Jan 2020 03:04:05 GMT";

    std::vector<Cookie> cookies;
    bool flag = false;

    runner.Test("set cookies", [&] { return page.SetCookies({cookie}); });
    runner.TestWithValidator("cookies round trip", [&] { return page.GetCookies(cookies); },
                             Yields(cookies, std::vector<Cookie>{cookie}, "cookies"));

    Cookie other;
    other.name = "SESSION";
    other.value = "1";
    other.domain = "fixture.test";
    runner.TestWithValidator("add cookie", [&] { return page.AddCookie(other, flag); },
                             Yields(flag, true, "addCookie"));
    Cookie nameless;
    runner.TestWithValidator("cookie without name is refused",
                             [&] { return page.AddCookie(nameless, flag); },
                             Yields(flag, false, "addCookie"));
    runner.TestWithValidator("delete cookie", [&] { return page.DeleteCookie("NAME", flag); },
                             Yields(flag, true, "deleteCookie"));
    runner.TestWithValidator("remaining cookie", [&] { return page.GetCookies(cookies); },
                             Yields(cookies, std::vector<Cookie>{other}, "cookies"));
    runner.Test("clear cookies", [&] { return page.ClearCookies(); });
    runner.TestWithValidator("no cookies left", [&] { return page.GetCookies(cookies); },
                             Yields(cookies, std::vector<Cookie>{}, "cookies"));

    runner.SetCategory("headers");

    HeaderMap headers;
    HeaderMap first;
    first.Set("FOO", "BAR");
    runner.Test("set custom headers", [&] { return page.SetCustomHeaders(first); });
    runner.TestWithValidator("custom headers", [&] { return page.GetCustomHeaders(headers); },
                             Yields(headers, first, "headers"));

    HeaderMap second;
    second.Set("BAZ", "BAT");
    second.Add("Accept", "text/html");
    second.Add("Accept", "application/json");
    runner.Test("replace custom headers", [&] { return page.SetCustomHeaders(second); });
    runner.TestWithValidator("previous headers are gone", [&] { return page.GetCustomHeaders(headers); },
                             Yields(headers, second, "headers"));
}

// ============================================================================
// Geometry, rendering & input
// ============================================================================

void RunGeometryTests(TestRunner& runner, WraithWebPage& page) {
    runner.SetCategory("geometry");

    Rect rect;
    rect.top = 99;
    runner.TestWithValidator("clip rect starts unset", [&] { return page.GetClipRect(rect); },
                             Yields(rect, Rect(), "clipRect"));
    Rect clip;
    clip.top = 1;
    clip.left = 2;
    clip.width = 3;
    clip.height = 4;
    runner.Test("set clip rect", [&] { return page.SetClipRect(clip); });
    runner.TestWithValidator("clip rect", [&] { return page.GetClipRect(rect); },
                             Yields(rect, clip, "clipRect"));

    Position pos;
    Position scroll;
    scroll.top = 10;
    scroll.left = 20;
    runner.Test("set scroll position", [&] { return page.SetScrollPosition(scroll); });
    runner.TestWithValidator("scroll position", [&] { return page.GetScrollPosition(pos); },
                             Yields(pos, scroll, "scrollPosition"));

    ViewportSize size;
    ViewportSize viewport;
    viewport.width = 1024;
    viewport.height = 768;
    runner.TestWithValidator("viewport has an engine default",
                             [&] { return page.GetViewportSize(size); },
                             [&](const BridgeResult&) {
                                 return size.IsZero() ? std::string("viewport is zero") : std::string();
                             });
    runner.Test("set viewport size", [&] { return page.SetViewportSize(viewport); });
    runner.TestWithValidator("viewport size", [&] { return page.GetViewportSize(size); },
                             Yields(size, viewport, "viewportSize"));

    double zoom = 0.0;
    runner.Test("set zoom factor", [&] { return page.SetZoomFactor(2.5); });
    runner.TestWithValidator("zoom factor", [&] { return page.GetZoomFactor(zoom); },
                             Yields(zoom, 2.5, "zoomFactor"));
    runner.TestExpectStatus("zero zoom factor", BridgeStatus::INVALID_PARAMETER,
                            [&] { return page.SetZoomFactor(0.0); });

    PaperSize paper;
    runner.TestWithValidator("paper size starts unset", [&] { return page.GetPaperSize(paper); },
                             Yields(paper, PaperSize(), "paperSize"));
    PaperSize a4;
    a4.format = "A4";
    a4.orientation = "landscape";
    a4.has_margin = true;
    a4.margin.top = a4.margin.bottom = "1cm";
    a4.margin.left = a4.margin.right = "2cm";
    runner.Test("set paper size", [&] { return page.SetPaperSize(a4); });
    runner.TestWithValidator("paper size", [&] { return page.GetPaperSize(paper); },
                             Yields(paper, a4, "paperSize"));

    runner.SetCategory("rendering");

    std::string file = g_scratch_dir + "/render.png";
    std::string data;
    runner.Test("render to file", [&] { return page.Render(file, "png", 80); });
    runner.Check("rendered file exists", access(file.c_str(), F_OK) == 0);
    runner.TestExpectStatus("render without a file name", BridgeStatus::INVALID_PARAMETER,
                            [&] { return page.Render("", "png"); });
    runner.TestWithValidator("render to base64", [&] { return page.RenderBase64("png", data); },
                             Yields(data, std::string("RkFLRQ=="), "renderBase64"));
    runner.TestExpectStatus("unsupported render format", BridgeStatus::REMOTE_ERROR,
                            [&] { return page.RenderBase64("bmp", data); });

    runner.SetCategory("input");

    runner.Test("mouse click", [&] { return page.SendMouseEvent(MouseEventType::CLICK, 10, 10); });
    runner.Test("right mouse down",
                [&] { return page.SendMouseEvent(MouseEventType::MOUSE_DOWN, 5, 5, MouseButton::RIGHT); });
    runner.Test("key press", [&] { return page.SendKeyboardEvent(KeyboardEventType::KEY_PRESS, "A"); });
    runner.Test("key down with modifier",
                [&] { return page.SendKeyboardEvent(KeyboardEventType::KEY_DOWN, "Enter", 0x02000000); });
    runner.Test("upload file", [&] { return page.UploadFile("#upload", file); });
}

// ============================================================================
// Settings & storage
// ============================================================================

void RunSettingsTests(TestRunner& runner, WraithWebPage& page) {
    runner.SetCategory("settings");

    PageSettings settings;
    runner.TestWithValidator("settings have a user agent", [&] { return page.GetSettings(settings); },
                             [&](const BridgeResult&) {
                                 return settings.user_agent.empty() ? std::string("empty user agent")
                                                                    : std::string();
                             });

    PageSettings changed = settings;
    changed.user_agent = "wraith-bridge-tests";
    changed.load_images = false;
    changed.resource_timeout_ms = 2000;
    runner.Test("set settings", [&] { return page.SetSettings(changed); });
    runner.TestWithValidator("settings updated", [&] { return page.GetSettings(settings); },
                             Yields(settings, changed, "settings"));

    std::string path;
    int64_t quota = 0;
    runner.TestWithValidator("offline storage path", [&] { return page.GetOfflineStoragePath(path); },
                             Yields(path, g_scratch_dir + "/offline", "offlineStoragePath"));
    runner.TestWithValidator("offline storage quota", [&] { return page.GetOfflineStorageQuota(quota); },
                             Yields(quota, int64_t(1048576), "offlineStorageQuota"));
}

// ============================================================================
// Child pages
// ============================================================================

void RunChildPageTests(TestRunner& runner, WraithProcess& process) {
    runner.SetCategory("pages");

    WraithWebPage parent;
    if (!runner.Test("create parent page", [&] { return process.CreateWebPage(parent); }).success) {
        return;
    }

    bool owns = false;
    json value;
    std::vector<std::string> names;
    std::vector<WraithWebPage> pages;
    std::string text;

    runner.TestWithValidator("owns pages by default", [&] { return parent.GetOwnsPages(owns); },
                             Yields(owns, true, "ownsPages"));
    runner.Test("open links page", [&] { return parent.Open(Fixture("links.html")); });
    runner.TestWithValidator("no child pages yet", [&] { return parent.GetPages(pages); },
                             PageCount(pages, 0));

    runner.Test("click a link with a target",
                [&] { return parent.EvaluateJavaScript(
                          "function() { document.getElementById('link').click(); }", value); });
    runner.TestWithValidator("window names of child pages",
                             [&] { return parent.GetPageWindowNames(names); },
                             Yields(names, std::vector<std::string>{"win1"}, "window names"));
    runner.TestWithValidator("one child page", [&] { return parent.GetPages(pages); },
                             PageCount(pages, 1));
    if (pages.size() != 1) {
        return;
    }

    WraithWebPage win1 = pages[0];
    runner.TestWithValidator("child page url", [&] { return win1.GetURL(text); },
                             Yields(text, Fixture("win1.html"), "url"));
    runner.TestWithValidator("child page window name", [&] { return win1.GetWindowName(text); },
                             Yields(text, std::string("win1"), "windowName"));

    std::vector<WraithWebPage> again;
    runner.TestWithValidator("child keeps its handle across listings",
                             [&] { return parent.GetPages(again); },
                             [&](const BridgeResult&) {
                                 return (again.size() == 1 && again[0] == win1) ? std::string()
                                                                                : std::string("handle changed");
                             });

    runner.Test("open an unnamed window",
                [&] { return parent.EvaluateJavaScript("function() { window.open('win2.html'); }", value); });
    runner.TestWithValidator("unnamed windows are listed", [&] { return parent.GetPages(pages); },
                             PageCount(pages, 2));
    runner.TestWithValidator("unnamed windows have no name",
                             [&] { return parent.GetPageWindowNames(names); },
                             Yields(names, std::vector<std::string>{"win1"}, "window names"));
    if (pages.size() != 2) {
        return;
    }
    WraithWebPage win2 = pages[1];

    runner.Test("close child page", [&] { return win1.Close(); });
    runner.TestExpectStatus("closed child rejects calls", BridgeStatus::INVALID_HANDLE,
                            [&] { return win1.GetURL(text); });
    runner.TestWithValidator("closed child is not listed", [&] { return parent.GetPages(pages); },
                             [&](const BridgeResult&) {
                                 return (pages.size() == 1 && pages[0] == win2) ? std::string()
                                                                                : std::string("unexpected pages");
                             });

    runner.Test("close parent page", [&] { return parent.Close(); });
    runner.TestExpectStatus("closed parent rejects calls", BridgeStatus::INVALID_HANDLE,
                            [&] { return parent.GetURL(text); });
    runner.TestWithValidator("child outlives its parent", [&] { return win2.GetURL(text); },
                             Yields(text, Fixture("win2.html"), "url"));

    WraithWebPage loner;
    if (!runner.Test("create second parent", [&] { return process.CreateWebPage(loner); }).success) {
        return;
    }
    runner.Test("stop owning pages", [&] { return loner.SetOwnsPages(false); });
    runner.Test("open links page again", [&] { return loner.Open(Fixture("links.html")); });
    runner.Test("click link on a non-owning page",
                [&] { return loner.EvaluateJavaScript(
                          "function() { document.getElementById('link').click(); }", value); });
    runner.TestWithValidator("windows are not tracked when not owned",
                             [&] { return loner.GetPages(pages); },
                             PageCount(pages, 0));
}

// ============================================================================
// Concurrency
// ============================================================================

void RunConcurrencyTests(TestRunner& runner, WraithProcess& process) {
    runner.SetCategory("concurrency");

    WraithWebPage first, second;
    if (!runner.Test("create first page", [&] { return process.CreateWebPage(first); }).success ||
        !runner.Test("create second page", [&] { return process.CreateWebPage(second); }).success) {
        return;
    }
    runner.Test("open first page", [&] { return first.Open(Fixture("title.html")); });
    runner.Test("open second page", [&] { return second.Open(Fixture("page2.html")); });

    std::atomic<int> failures{0};
    auto worker = [&failures](WraithWebPage page, const std::string& expected) {
        for (int i = 0; i < 25; i++) {
            std::string url;
            BridgeResult r = page.GetURL(url);
            if (!r.success || url != expected) {
                failures++;
            }
        }
    };

    std::thread a(worker, first, Fixture("title.html"));
    std::thread b(worker, second, Fixture("page2.html"));
    a.join();
    b.join();

    runner.Check("calls from several threads are serialized", failures == 0,
                 std::to_string(failures.load()) + " calls failed");
}

}  // namespace

int main(int argc, char** argv) {
    WraithLogger::Logger::Init();
    WraithLogger::Logger::SetLevel(WraithLogger::WARN);

    TestRunner runner;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--quiet") {
            runner.SetVerbose(false);
        } else {
            g_engine_path = arg;
        }
    }

    std::string error;
    g_scratch_dir = WraithPlatform::MakeTempDirectory("wraith-bridge-tests", error);
    if (g_scratch_dir.empty()) {
        std::cerr << "Cannot create scratch directory: " << error << std::endl;
        return 1;
    }
    std::cout << "Engine: " << g_engine_path << std::endl;

    RunLifecycleTests(runner);
    RunFailureTests(runner);

    {
        ProcessConfig config = FakeEngineConfig();
        config.offline_storage_path = g_scratch_dir + "/offline";
        config.offline_storage_quota = 1048576;
        WraithProcess process(config);
        WraithWebPage page;
        if (OpenPage(runner, process, page)) {
            RunNavigationTests(runner, page);
            RunFrameTests(runner, page);
            RunScriptingTests(runner, process, page);
            RunCookieTests(runner, page);
            RunGeometryTests(runner, page);
            RunSettingsTests(runner, page);
            RunChildPageTests(runner, process);
            RunConcurrencyTests(runner, process);
            runner.SetCategory("lifecycle");
            runner.Test("close shared process", [&] { return process.Close(); });
        }
    }

    WraithPlatform::RemoveDirectoryTree(g_scratch_dir);
    return runner.PrintSummary() ? 0 : 1;
}
