// Stand-in for the headless engine used by the end-to-end tests.
//
// Speaks the control protocol of the embedded shim script (POST /ping,
// /create and /invoke on 127.0.0.1:<port>) and simulates just enough of a
// browser for the bridge to be exercised without a real engine: fixture
// documents, frames, input focus, cookies, child windows and history.
//
// Usage: wraith_fake_engine [--fake-no-listen] [--offline-storage-path=P]
//                           [--offline-storage-quota=Q] <script> <port>

#include <algorithm>
#include <iostream>
#include <fstream>
#include <map>
#include <stdexcept>
#include <regex>
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <nlohmann/json.hpp>

#include "fake_document.h"
#include "logger.h"

using json = nlohmann::json;

namespace {

struct FakePage {
    std::string ref;
    bool open = true;
    FakeDocument doc;
    std::vector<std::string> history;
    int history_index = -1;

    json clip_rect = {{"top", 0}, {"left", 0}, {"width", 0}, {"height", 0}};
    json scroll_position = {{"top", 0}, {"left", 0}};
    json viewport_size = {{"width", 400}, {"height", 300}};
    json paper_size = json::object();
    json custom_headers = json::object();
    json settings = {
        {"javascriptEnabled", true},
        {"loadImages", true},
        {"localToRemoteUrlAccessEnabled", false},
        {"userAgent", "Mozilla/5.0 (Unknown; Linux x86_64) AppleWebKit/538.1 (KHTML, like Gecko) "
                      "WraithFakeEngine/1.0 Safari/538.1"},
        {"userName", ""},
        {"password", ""},
        {"XSSAuditingEnabled", false},
        {"webSecurityEnabled", true},
        {"resourceTimeout", 0}
    };
    double zoom_factor = 1.0;
    std::string library_path;
    bool navigation_locked = false;
    bool owns_pages = true;
    std::string window_name;
    std::vector<std::string> children;  // refs of owned child windows
};

struct EngineState {
    std::string library_path;
    std::string offline_storage_path = "/tmp/wraith-fake-engine/offline";
    int64_t offline_storage_quota = 5242880;
    std::map<std::string, FakePage> pages;
    std::vector<json> cookies;
    int next_ref = 1;
};

EngineState g_state;

class CallError : public std::runtime_error {
public:
    explicit CallError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Page helpers
// ============================================================================

std::string CreatePage(const std::string& window_name) {
    FakePage page;
    page.ref = "fake-" + std::to_string(g_state.next_ref++);
    page.library_path = g_state.library_path;
    page.window_name = window_name;
    std::string ref = page.ref;
    g_state.pages[ref] = page;
    return ref;
}

bool Navigate(FakePage& page, const std::string& url) {
    if (page.navigation_locked) {
        return false;
    }
    if (!page.doc.Load(url)) {
        return false;
    }
    if (page.history_index + 1 < static_cast<int>(page.history.size())) {
        page.history.resize(page.history_index + 1);
    }
    page.history.push_back(url);
    page.history_index = static_cast<int>(page.history.size()) - 1;
    return true;
}

void GoToHistoryEntry(FakePage& page, int index) {
    if (index < 0 || index >= static_cast<int>(page.history.size())) {
        return;
    }
    page.history_index = index;
    page.doc.Load(page.history[index]);
}

FakeDocument& ResolveFrame(FakePage& page, const json& path) {
    FakeDocument* frame = &page.doc;
    if (!path.is_array()) {
        return *frame;
    }
    for (const auto& step : path) {
        FakeDocument* next = nullptr;
        std::string label;
        if (step.contains("name")) {
            label = step["name"].get<std::string>();
            next = frame->FindFrame(label);
        } else {
            int index = step.value("index", -1);
            label = "#" + std::to_string(index);
            next = frame->FrameAt(index);
        }
        if (!next) {
            throw CallError("frame not found: " + label);
        }
        frame = next;
    }
    return *frame;
}

void OpenWindow(FakePage& opener, const std::string& url, const std::string& name) {
    std::string child_ref = CreatePage(name);
    FakePage& child = g_state.pages[child_ref];
    Navigate(child, url);
    // Only owned windows are listed by the opener
    FakePage& parent = g_state.pages[opener.ref];
    if (parent.owns_pages) {
        parent.children.push_back(child_ref);
    }
}

void ForgetChild(const std::string& ref) {
    for (auto& entry : g_state.pages) {
        auto& list = entry.second.children;
        list.erase(std::remove(list.begin(), list.end(), ref), list.end());
    }
}

// ============================================================================
// Script evaluation (pattern based)
// ============================================================================

json Evaluate(FakePage& page, const std::string& script) {
    static const std::regex sleep_regex("sleep\\((\\d+)\\)");
    static const std::regex open_regex(
        "window\\.open\\(\\s*['\"]([^'\"]*)['\"](?:\\s*,\\s*['\"]([^'\"]*)['\"])?");
    static const std::regex number_regex("return\\s+(-?\\d+(?:\\.\\d+)?)\\s*;?");
    static const std::regex string_regex("return\\s+'([^']*)'");

    std::smatch match;
    if (std::regex_search(script, match, sleep_regex)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::stoi(match[1].str())));
        return nullptr;
    }
    if (script.find("throw") != std::string::npos) {
        throw CallError("script threw an exception");
    }
    if (script.find(".click()") != std::string::npos) {
        std::string href, target;
        if (page.doc.FirstLink(href, target)) {
            OpenWindow(page, href, target);
        }
        return nullptr;
    }
    if (std::regex_search(script, match, open_regex)) {
        std::string url = ResolveURL(page.doc.url, match[1].str());
        std::string name = match[2].matched ? match[2].str() : "";
        OpenWindow(page, url, name);
        return nullptr;
    }
    if (script.find("document.title") != std::string::npos) {
        return page.doc.Title();
    }
    if (std::regex_search(script, match, number_regex)) {
        std::string number = match[1].str();
        if (number.find('.') != std::string::npos) {
            return std::stod(number);
        }
        return std::stoll(number);
    }
    if (std::regex_search(script, match, string_regex)) {
        return match[1].str();
    }
    return nullptr;
}

// ============================================================================
// Member dispatch
// ============================================================================

bool ValidMouseEvent(const std::string& type) {
    return type == "mouseup" || type == "mousedown" || type == "mousemove" ||
           type == "click" || type == "doubleclick";
}

bool ValidKeyboardEvent(const std::string& type) {
    return type == "keyup" || type == "keydown" || type == "keypress";
}

const json& Arg(const json& args, size_t i) {
    if (!args.is_array() || i >= args.size()) {
        throw CallError("missing argument " + std::to_string(i));
    }
    return args[i];
}

json Dispatch(const std::string& ref, const std::string& member, const json& args,
              const json& frame_path) {
    auto it = g_state.pages.find(ref);
    if (it == g_state.pages.end() || !it->second.open) {
        throw CallError("unknown page: " + ref);
    }
    FakePage& page = it->second;
    FakeDocument& frame = ResolveFrame(page, frame_path);

    // Navigation
    if (member == "open") {
        std::string url = Arg(args, 0).get<std::string>();
        if (!Navigate(page, url)) throw CallError("failed to load " + url);
        return "success";
    }
    if (member == "canGoBack") return page.history_index > 0;
    if (member == "canGoForward") {
        return page.history_index + 1 < static_cast<int>(page.history.size());
    }
    if (member == "goBack") { GoToHistoryEntry(page, page.history_index - 1); return nullptr; }
    if (member == "goForward") { GoToHistoryEntry(page, page.history_index + 1); return nullptr; }
    if (member == "go") {
        GoToHistoryEntry(page, page.history_index + Arg(args, 0).get<int>());
        return nullptr;
    }
    if (member == "reload" || member == "stop") return nullptr;
    if (member == "navigationLocked") return page.navigation_locked;
    if (member == "setNavigationLocked") { page.navigation_locked = Arg(args, 0).get<bool>(); return nullptr; }

    // Content
    if (member == "content") return page.doc.source;
    if (member == "setContent") { page.doc.SetSource(Arg(args, 0).get<std::string>()); return nullptr; }
    if (member == "setContentAndUrl") {
        page.doc.url = Arg(args, 1).get<std::string>();
        page.doc.SetSource(Arg(args, 0).get<std::string>());
        return nullptr;
    }
    if (member == "plainText") return page.doc.PlainText();
    if (member == "title") return page.doc.Title();
    if (member == "url") return page.doc.url;
    if (member == "windowName") return page.window_name;

    // Frames
    if (member == "frameContent") return frame.source;
    if (member == "setFrameContent") { frame.SetSource(Arg(args, 0).get<std::string>()); return nullptr; }
    if (member == "frameName") return frame.name;
    if (member == "framePlainText") return frame.PlainText();
    if (member == "frameTitle") return frame.Title();
    if (member == "frameUrl") return frame.url;
    if (member == "framesCount") return static_cast<int>(frame.frames.size());
    if (member == "framesName") {
        json names = json::array();
        for (const auto& child : frame.frames) names.push_back(child.name);
        return names;
    }
    if (member == "hasFrame") {
        const json& step = Arg(args, 0);
        if (step.contains("name")) return frame.FindFrame(step["name"].get<std::string>()) != nullptr;
        return frame.FrameAt(step.value("index", -1)) != nullptr;
    }
    if (member == "focusedFrameName" || member == "focusedFramePath") {
        std::vector<std::pair<std::string, int>> steps;
        bool found = page.doc.FocusedPath(steps);
        if (member == "focusedFrameName") return found ? steps.back().first : std::string();
        json path = json::array();
        for (const auto& step : steps) {
            if (step.first.empty()) {
                path.push_back({{"index", step.second}});
            } else {
                path.push_back({{"name", step.first}});
            }
        }
        return path;
    }

    // Scripting
    if (member == "evaluateJavaScript") return Evaluate(page, Arg(args, 0).get<std::string>());
    if (member == "injectJs") {
        std::string path = Arg(args, 0).get<std::string>();
        if (!path.empty() && path[0] != '/') path = page.library_path + "/" + path;
        struct stat st;
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
    }
    if (member == "includeJs") return nullptr;
    if (member == "libraryPath") return page.library_path;
    if (member == "setLibraryPath") { page.library_path = Arg(args, 0).get<std::string>(); return nullptr; }

    // Cookies and headers
    if (member == "cookies") return json(g_state.cookies);
    if (member == "setCookies") {
        g_state.cookies.clear();
        for (const auto& cookie : Arg(args, 0)) g_state.cookies.push_back(cookie);
        return nullptr;
    }
    if (member == "addCookie") {
        const json& cookie = Arg(args, 0);
        std::string name = cookie.value("name", "");
        if (name.empty()) return false;
        for (auto& existing : g_state.cookies) {
            if (existing.value("name", "") == name) {
                existing = cookie;
                return true;
            }
        }
        g_state.cookies.push_back(cookie);
        return true;
    }
    if (member == "deleteCookie") {
        std::string name = Arg(args, 0).get<std::string>();
        size_t before = g_state.cookies.size();
        g_state.cookies.erase(
            std::remove_if(g_state.cookies.begin(), g_state.cookies.end(),
                           [&](const json& c) { return c.value("name", "") == name; }),
            g_state.cookies.end());
        return g_state.cookies.size() != before;
    }
    if (member == "clearCookies") { g_state.cookies.clear(); return nullptr; }
    if (member == "customHeaders") return page.custom_headers;
    if (member == "setCustomHeaders") { page.custom_headers = Arg(args, 0); return nullptr; }

    // Geometry and rendering
    if (member == "clipRect") return page.clip_rect;
    if (member == "setClipRect") { page.clip_rect = Arg(args, 0); return nullptr; }
    if (member == "scrollPosition") return page.scroll_position;
    if (member == "setScrollPosition") { page.scroll_position = Arg(args, 0); return nullptr; }
    if (member == "viewportSize") return page.viewport_size;
    if (member == "setViewportSize") { page.viewport_size = Arg(args, 0); return nullptr; }
    if (member == "zoomFactor") return page.zoom_factor;
    if (member == "setZoomFactor") { page.zoom_factor = Arg(args, 0).get<double>(); return nullptr; }
    if (member == "paperSize") return page.paper_size;
    if (member == "setPaperSize") { page.paper_size = Arg(args, 0); return nullptr; }
    if (member == "render") {
        std::string file = Arg(args, 0).get<std::string>();
        std::ofstream out(file, std::ios::binary);
        if (!out.is_open()) throw CallError("cannot render to " + file);
        out << "WRAITH-FAKE-RENDER " << page.doc.url;
        return nullptr;
    }
    if (member == "renderBase64") {
        std::string format = Arg(args, 0).get<std::string>();
        if (format != "png" && format != "jpeg" && format != "gif") {
            throw CallError("unsupported format: " + format);
        }
        return "RkFLRQ==";
    }

    // Input
    if (member == "sendMouseEvent") {
        std::string type = Arg(args, 0).get<std::string>();
        if (!ValidMouseEvent(type)) throw CallError("unknown mouse event: " + type);
        return nullptr;
    }
    if (member == "sendKeyboardEvent") {
        std::string type = Arg(args, 0).get<std::string>();
        if (!ValidKeyboardEvent(type)) throw CallError("unknown keyboard event: " + type);
        return nullptr;
    }
    if (member == "uploadFile") {
        if (Arg(args, 0).get<std::string>().empty()) throw CallError("empty selector");
        return nullptr;
    }

    // Settings and storage
    if (member == "settings") return page.settings;
    if (member == "setSettings") {
        for (const auto& item : Arg(args, 0).items()) {
            page.settings[item.key()] = item.value();
        }
        return nullptr;
    }
    if (member == "offlineStoragePath") return g_state.offline_storage_path;
    if (member == "offlineStorageQuota") return g_state.offline_storage_quota;

    // Child windows
    if (member == "ownsPages") return page.owns_pages;
    if (member == "setOwnsPages") { page.owns_pages = Arg(args, 0).get<bool>(); return nullptr; }
    if (member == "pages") {
        json list = json::array();
        for (const auto& child_ref : page.children) {
            const FakePage& child = g_state.pages[child_ref];
            list.push_back({{"ref", child_ref}, {"windowName", child.window_name}});
        }
        return list;
    }
    if (member == "close") {
        page.open = false;
        page.owns_pages = false;
        ForgetChild(ref);
        return nullptr;
    }

    throw CallError("unknown member: " + member);
}

// ============================================================================
// HTTP server
// ============================================================================

std::string Envelope(const json& body) {
    std::string payload = body.dump();
    std::string response = "HTTP/1.1 200 OK\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + std::to_string(payload.size()) + "\r\n";
    response += "Connection: close\r\n";
    response += "\r\n";
    response += payload;
    return response;
}

std::string Handle(const std::string& path, const std::string& body) {
    try {
        json request = body.empty() ? json::object() : json::parse(body);
        if (path == "/ping") {
            return Envelope({{"status", "ok"}, {"result", "pong"}});
        }
        if (path == "/create") {
            return Envelope({{"status", "ok"}, {"result", CreatePage("")}});
        }
        if (path == "/invoke") {
            std::string member = request.value("member", "");
            json result = Dispatch(request.value("target", ""), member,
                                   request.value("args", json::array()),
                                   request.value("frame", json::array()));
            return Envelope({{"status", "ok"}, {"result", result}});
        }
        return Envelope({{"status", "error"}, {"message", "unknown endpoint: " + path}});
    } catch (const CallError& e) {
        return Envelope({{"status", "error"}, {"message", e.what()}});
    } catch (const json::exception& e) {
        return Envelope({{"status", "error"}, {"message", std::string("bad request: ") + e.what()}});
    }
}

bool ReadRequest(int fd, std::string& path, std::string& body) {
    std::string data;
    char buf[8192];
    size_t header_end = std::string::npos;

    while (header_end == std::string::npos) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        data.append(buf, n);
        header_end = data.find("\r\n\r\n");
    }

    std::string headers = data.substr(0, header_end);
    size_t first_space = headers.find(' ');
    size_t second_space = headers.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos) return false;
    path = headers.substr(first_space + 1, second_space - first_space - 1);

    size_t content_length = 0;
    static const std::regex length_regex("content-length:\\s*(\\d+)", std::regex::icase);
    std::smatch match;
    if (std::regex_search(headers, match, length_regex)) {
        content_length = std::stoul(match[1].str());
    }

    body = data.substr(header_end + 4);
    while (body.size() < content_length) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        body.append(buf, n);
    }
    body.resize(content_length);
    return true;
}

void SendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            // Client gave up (call timeout); nothing left to do
            return;
        }
        sent += n;
    }
}

int Listen(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0 || listen(fd, 16) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

}  // namespace

int main(int argc, char** argv) {
    signal(SIGPIPE, SIG_IGN);
    WraithLogger::Logger::Init();

    bool no_listen = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--fake-no-listen") {
            no_listen = true;
        } else if (arg.rfind("--offline-storage-path=", 0) == 0) {
            g_state.offline_storage_path = arg.substr(strlen("--offline-storage-path="));
        } else if (arg.rfind("--offline-storage-quota=", 0) == 0) {
            g_state.offline_storage_quota = std::stoll(arg.substr(strlen("--offline-storage-quota=")));
        } else if (arg.rfind("--", 0) == 0) {
            // Other engine flags are accepted and ignored
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        std::cerr << "usage: " << argv[0] << " [flags] <script> <port>" << std::endl;
        return 2;
    }

    const std::string& script = positional[positional.size() - 2];
    int port = std::stoi(positional.back());
    size_t slash = script.rfind('/');
    g_state.library_path = slash == std::string::npos ? "." : script.substr(0, slash);

    if (no_listen) {
        // Never becomes ready; the supervisor has to time out and kill us
        while (true) {
            pause();
        }
    }

    int server_fd = Listen(port);
    if (server_fd < 0) {
        LOG_ERROR("FakeEngine", "Cannot listen on port " + std::to_string(port));
        return 1;
    }
    LOG_INFO("FakeEngine", "Listening on 127.0.0.1:" + std::to_string(port));

    while (true) {
        struct pollfd pfd;
        pfd.fd = server_fd;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 100);  // 100ms timeout
        if (ret <= 0) continue;

        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client = accept(server_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client < 0) continue;

        std::string path, body;
        if (ReadRequest(client, path, body)) {
            SendAll(client, Handle(path, body));
        }
        close(client);
    }
}
