#include "activity_key.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

// ─────────────────────────────────────
std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ─────────────────────────────────────
std::vector<std::string> SplitTitle(const std::string &title) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (true) {
        const std::size_t sep = title.find(" - ", pos);
        parts.push_back(title.substr(pos, sep == std::string::npos ? std::string::npos : sep - pos));
        if (sep == std::string::npos) {
            break;
        }
        pos = sep + 3;
    }
    return parts;
}

// ─────────────────────────────────────
bool IsChrome(const std::string &app) {
    const std::string name = Lower(app);
    return name.find("chrome") != std::string::npos || name.find("chromium") != std::string::npos;
}

// ─────────────────────────────────────
bool IsVSCode(const std::string &app) {
    const std::string name = Lower(app);
    return name == "code" || name == "code-oss" || name == "vscodium" ||
           name.find("visual studio code") != std::string::npos;
}

// ─────────────────────────────────────
std::string ChromeKey(const std::string &title) {
    const std::string host = UrlHost(title);
    if (!host.empty()) {
        return host;
    }

    std::vector<std::string> parts = SplitTitle(title);
    if (parts.size() > 1 && IsChrome(parts.back())) {
        parts.pop_back();
    }
    return "Chrome - " + parts.back();
}

} // namespace

// ─────────────────────────────────────
std::string UrlHost(const std::string &text) {
    std::size_t pos = std::string::npos;
    for (const char *scheme : {"https://", "http://"}) {
        const std::size_t found = text.find(scheme);
        if (found != std::string::npos && (pos == std::string::npos || found < pos)) {
            pos = found + std::char_traits<char>::length(scheme);
        }
    }
    if (pos == std::string::npos) {
        return {};
    }

    std::size_t end = pos;
    while (end < text.size()) {
        const char c = text[end];
        if (c == '/' || c == '?' || c == '#' || std::isspace(static_cast<unsigned char>(c))) {
            break;
        }
        ++end;
    }
    return text.substr(pos, end - pos);
}

// ─────────────────────────────────────
std::string AppNameKey(const ActivityInterval &interval) {
    return interval.app;
}

// ─────────────────────────────────────
std::string TitleActivityKey(const ActivityInterval &interval) {
    if (interval.title.empty()) {
        return interval.app;
    }
    if (IsChrome(interval.app)) {
        return ChromeKey(interval.title);
    }
    if (IsVSCode(interval.app)) {
        return "VSCode - " + SplitTitle(interval.title).front();
    }
    return interval.app;
}
