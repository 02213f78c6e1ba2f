#include "fsgate/paths.h"
#include "fsgate/error.h"

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#ifndef _WIN32
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace fsgate {
namespace paths {

namespace {

bool is_separator(char c) {
#ifdef _WIN32
    return c == '/' || c == '\\';
#else
    return c == '/';
#endif
}

/// Strip surrounding whitespace and a single pair of matching quotes.
std::string strip_decoration(const std::string& path) {
    size_t b = 0, e = path.size();
    while (b < e && std::isspace(static_cast<unsigned char>(path[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(path[e - 1]))) --e;
    if (e - b >= 2 && (path[b] == '"' || path[b] == '\'') && path[e - 1] == path[b]) {
        ++b;
        --e;
    }
    return path.substr(b, e - b);
}

std::string home_directory() {
    if (const char* home = std::getenv("HOME")) {
        if (*home) return home;
    }
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE")) {
        if (*profile) return profile;
    }
#else
    if (const struct passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return pw->pw_dir;
    }
#endif
    return {};
}

} // anonymous namespace

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && !is_separator(path[1])) return path; // ~user is literal

    std::string home = home_directory();
    if (home.empty()) return path;
    if (path.size() == 1) return home;
    return home + "/" + path.substr(2);
}

bool is_absolute(const std::string& path) {
    if (!path.empty() && path[0] == '/') return true;
#ifdef _WIN32
    if (path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) &&
        path[1] == ':' && path[2] == '/') {
        return true;
    }
#endif
    return false;
}

/// Normalize a requested path: expand `~`, unify separators, collapse
/// `.`/`..`/repeated separators.  `..` never climbs above "/".
std::string normalize(const std::string& raw) {
    if (raw.find('\0') != std::string::npos) {
        throw InvalidPathError("path contains a NUL byte");
    }
    std::string path = expand_home(strip_decoration(raw));
    if (path.empty()) throw InvalidPathError("path must not be empty");

    for (char& c : path) {
        if (is_separator(c)) c = '/';
    }

    std::string prefix;
#ifdef _WIN32
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) &&
        path[1] == ':') {
        prefix = std::string(1, static_cast<char>(
                     std::toupper(static_cast<unsigned char>(path[0])))) + ":";
        path = path.substr(2);
    }
#endif
    bool absolute = !path.empty() && path[0] == '/';

    std::vector<std::string_view> segments;
    std::string_view sv(path);
    size_t start = 0;

    while (start < sv.size()) {
        size_t end = sv.find('/', start);
        if (end == std::string_view::npos) end = sv.size();

        std::string_view seg = sv.substr(start, end - start);
        start = end + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(seg); // relative paths keep leading ..
            }
            continue;
        }
        segments.push_back(seg);
    }

    std::string out = prefix;
    if (absolute) out += '/';
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += std::string(segments[i]);
    }
    if (out.empty() || out == prefix) out += absolute ? "" : ".";
    return out;
}

bool is_within(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    if (path.size() < root.size()) return false;
    if (path.compare(0, root.size(), root) != 0) return false;
    if (path.size() == root.size()) return true;
    // "/data" must not contain "/database"
    return root.back() == '/' || path[root.size()] == '/';
}

std::string relative_to(const std::string& path, const std::string& base) {
    if (path.size() <= base.size()) return {};
    size_t cut = base.size();
    if (base.back() != '/') ++cut;
    return path.substr(cut);
}

std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string parent(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string basename(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace paths
} // namespace fsgate
