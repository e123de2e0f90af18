#include "fake_document.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

namespace {

const int kMaxFrameDepth = 4;

const std::map<std::string, std::string>& Fixtures() {
    static const std::map<std::string, std::string> fixtures = {
        {"ok.html", "OK"},
        {"page2.html", "PAGE2"},
        {"title.html",
         "<html><head><title>TEST TITLE</title></head><body>FOO</body></html>"},
        {"frameset.html",
         "<html><head></head><frameset rows=\"50%,50%\">"
         "<frame name=\"FRAME1\" src=\"frame1.html\">"
         "<frame name=\"FRAME2\" src=\"frame2.html\">"
         "</frameset></html>"},
        {"frame1.html",
         "<html><head><title>FRAME ONE</title></head><body>FOO</body></html>"},
        {"frame2.html",
         "<html><head><title>TEST TITLE</title></head><body>BAR</body></html>"},
        {"nested.html",
         "<html><head></head><frameset rows=\"100%\">"
         "<frame name=\"OUTER\" src=\"frameset.html\">"
         "</frameset></html>"},
        {"focus.html",
         "<html><head></head><frameset rows=\"50%,50%\">"
         "<frame name=\"FRAME1\" src=\"frame1.html\">"
         "<frame name=\"FRAME2\" src=\"focus_frame.html\">"
         "</frameset></html>"},
        {"focus_nested.html",
         "<html><head></head><frameset rows=\"100%\">"
         "<frame src=\"focus.html\">"
         "</frameset></html>"},
        {"focus_frame.html",
         "<html><head></head><body><input type=\"text\" autofocus></body></html>"},
        {"links.html",
         "<html><head></head><body>"
         "<a id=\"link\" target=\"win1\" href=\"win1.html\">CLICK ME</a>"
         "</body></html>"},
        {"win1.html", "<html><head><title>WIN1</title></head><body>WIN1</body></html>"},
        {"win2.html", "WIN2"},
    };
    return fixtures;
}

std::string Attribute(const std::string& attrs, const std::string& name) {
    std::regex attr_regex("\\b" + name + "\\s*=\\s*[\"']([^\"']*)[\"']", std::regex::icase);
    std::smatch match;
    if (std::regex_search(attrs, match, attr_regex)) {
        return match[1].str();
    }
    return "";
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool HasAutofocus(const std::string& source) {
    static const std::regex autofocus_regex("<[^>]*\\bautofocus\\b[^>]*>", std::regex::icase);
    return std::regex_search(source, autofocus_regex);
}

}  // namespace

bool LookupFixture(const std::string& url, std::string& source) {
    std::string base = FAKE_FIXTURE_BASE;
    if (url.compare(0, base.size(), base) != 0) {
        return false;
    }
    std::string path = url.substr(base.size());
    size_t query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    if (path.empty()) {
        path = "ok.html";
    }

    auto it = Fixtures().find(path);
    if (it == Fixtures().end()) {
        return false;
    }
    source = it->second;
    return true;
}

std::string ResolveURL(const std::string& base, const std::string& ref) {
    if (ref.find("://") != std::string::npos || ref.compare(0, 6, "about:") == 0) {
        return ref;
    }

    std::string dir = FAKE_FIXTURE_BASE;
    if (base.find("://") != std::string::npos) {
        dir = base.substr(0, base.rfind('/') + 1);
    }
    if (!ref.empty() && ref[0] == '/') {
        return std::string(FAKE_FIXTURE_BASE) + ref.substr(1);
    }
    return dir + ref;
}

std::string FakeDocument::Normalize(const std::string& markup) {
    static const std::regex html_open("<html[^>]*>", std::regex::icase);
    static const std::regex head_open("<head[\\s>]", std::regex::icase);

    std::smatch match;
    if (!std::regex_search(markup, match, html_open)) {
        return "<html><head></head><body>" + markup + "</body></html>";
    }

    std::string out = markup;
    if (!std::regex_search(markup, head_open)) {
        size_t insert_at = match.position(0) + match.length(0);
        out.insert(insert_at, "<head></head>");
    }
    return out;
}

bool FakeDocument::Load(const std::string& target_url) {
    std::string markup;
    if (!LookupFixture(target_url, markup)) {
        return false;
    }
    url = target_url;
    source = Normalize(markup);
    BuildFrames(0);
    return true;
}

void FakeDocument::SetSource(const std::string& markup) {
    source = Normalize(markup);
    BuildFrames(0);
}

void FakeDocument::BuildFrames(int depth) {
    frames.clear();
    if (depth >= kMaxFrameDepth) {
        return;
    }

    static const std::regex frame_regex("<i?frame\\b([^>]*)>", std::regex::icase);
    auto begin = std::sregex_iterator(source.begin(), source.end(), frame_regex);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string attrs = (*it)[1].str();

        FakeDocument child;
        child.name = Attribute(attrs, "name");
        std::string src = Attribute(attrs, "src");
        if (!src.empty()) {
            child.url = ResolveURL(url, src);
            std::string markup;
            if (LookupFixture(child.url, markup)) {
                child.source = Normalize(markup);
            }
        }
        child.BuildFrames(depth + 1);
        frames.push_back(child);
    }
}

std::string FakeDocument::Title() const {
    static const std::regex title_regex("<title>([^<]*)</title>", std::regex::icase);
    std::smatch match;
    if (std::regex_search(source, match, title_regex)) {
        return match[1].str();
    }
    return "";
}

std::string FakeDocument::PlainText() const {
    static const std::regex body_regex("<body[^>]*>([\\s\\S]*)</body>", std::regex::icase);
    static const std::regex tag_regex("<[^>]*>");

    std::smatch match;
    if (!std::regex_search(source, match, body_regex)) {
        return "";
    }
    return Trim(std::regex_replace(match[1].str(), tag_regex, ""));
}

FakeDocument* FakeDocument::FindFrame(const std::string& frame_name) {
    for (auto& frame : frames) {
        if (frame.name == frame_name) {
            return &frame;
        }
    }
    return nullptr;
}

FakeDocument* FakeDocument::FrameAt(int index) {
    if (index < 0 || index >= static_cast<int>(frames.size())) {
        return nullptr;
    }
    return &frames[index];
}

bool FakeDocument::FocusedPath(std::vector<std::pair<std::string, int>>& steps) const {
    for (size_t i = 0; i < frames.size(); i++) {
        const FakeDocument& frame = frames[i];
        steps.emplace_back(frame.name, static_cast<int>(i));
        if (HasAutofocus(frame.source) || frame.FocusedPath(steps)) {
            return true;
        }
        steps.pop_back();
    }
    return false;
}

bool FakeDocument::FirstLink(std::string& href, std::string& target) const {
    static const std::regex link_regex("<a\\b([^>]*)>", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(source, match, link_regex)) {
        return false;
    }
    std::string attrs = match[1].str();
    href = ResolveURL(url, Attribute(attrs, "href"));
    target = Attribute(attrs, "target");
    return true;
}
