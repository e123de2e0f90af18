#pragma once

#include <string>
#include <utility>
#include <vector>

// Base URL of the built-in fixture site served by the fake engine
#define FAKE_FIXTURE_BASE "http://fixture.test/"

// Markup of a fixture page, or false for unknown URLs
bool LookupFixture(const std::string& url, std::string& source);

// Resolve |ref| (absolute or relative) against the document URL |base|
std::string ResolveURL(const std::string& base, const std::string& ref);

// One document: the top-level page or a frame inside it.
// Markup is normalized the way a browser serializes it, so "OK" reads back
// as "<html><head></head><body>OK</body></html>".
struct FakeDocument {
    std::string url = "about:blank";
    std::string name;                  // frame name, "" for the top level
    std::string source = "<html><head></head><body></body></html>";
    std::vector<FakeDocument> frames;  // child frames in document order

    // Navigate to |url|; false when nothing is served there
    bool Load(const std::string& url);
    // Replace the markup, keeping the URL
    void SetSource(const std::string& markup);

    std::string Title() const;
    std::string PlainText() const;

    // Child lookup by name or position; nullptr when missing
    FakeDocument* FindFrame(const std::string& frame_name);
    FakeDocument* FrameAt(int index);

    // Frames leading to the first frame asking for focus (autofocus), as
    // (name, index) steps; false when no frame does
    bool FocusedPath(std::vector<std::pair<std::string, int>>& steps) const;

    // First link in the document: its absolute href and target
    bool FirstLink(std::string& href, std::string& target) const;

    static std::string Normalize(const std::string& markup);

private:
    void BuildFrames(int depth);
};
