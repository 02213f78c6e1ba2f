#include "fsgate/glob.h"

#include <sstream>
#include <string>
#include <vector>

namespace fsgate {
namespace glob {

namespace {

/// Match `ch` against the class starting at `pattern[pi]` ('[').  On
/// return `pi` is just past the closing ']'.  Returns false with `pi`
/// unchanged when the class is unterminated.
bool match_class(const std::string& pattern, size_t& pi, char ch, bool& matched) {
    size_t close = pattern.find(']', pi + 2);
    if (close == std::string::npos) return false;

    size_t i = pi + 1;
    bool negate = pattern[i] == '!' || pattern[i] == '^';
    if (negate) ++i;
    bool hit = false;
    // A ']' right after the opening bracket is a literal member.
    if (i < pattern.size() && pattern[i] == ']') {
        hit = ch == ']';
        ++i;
        close = pattern.find(']', i);
        if (close == std::string::npos) return false;
    }
    for (; i < close; ++i) {
        if (i + 2 < close && pattern[i + 1] == '-') {
            if (ch >= pattern[i] && ch <= pattern[i + 2]) hit = true;
            i += 2;
        } else if (pattern[i] == ch) {
            hit = true;
        }
    }
    matched = hit != negate;
    pi = close + 1;
    return true;
}

} // anonymous namespace

/// Iterative matcher: on a mismatch, back up to the last `*` and let it
/// swallow one more character.
bool fnmatch(const std::string& pattern, const std::string& name) {
    size_t pi = 0, ni = 0;
    size_t star_pi = std::string::npos, star_ni = 0;

    while (ni < name.size()) {
        bool advanced = false;
        if (pi < pattern.size()) {
            char pc = pattern[pi];
            if (pc == '*') {
                star_pi = ++pi;
                star_ni = ni;
                continue;
            }
            if (pc == '?') {
                ++pi;
                ++ni;
                advanced = true;
            } else if (pc == '[') {
                size_t next = pi;
                bool matched = false;
                if (match_class(pattern, next, name[ni], matched)) {
                    if (matched) {
                        pi = next;
                        ++ni;
                        advanced = true;
                    }
                } else if (name[ni] == '[') {
                    // Unterminated class: '[' is literal.
                    ++pi;
                    ++ni;
                    advanced = true;
                }
            } else if (pc == name[ni]) {
                ++pi;
                ++ni;
                advanced = true;
            }
        }
        if (advanced) continue;
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        ni = ++star_ni;
    }

    while (pi < pattern.size() && pattern[pi] == '*') ++pi;
    return pi == pattern.size();
}

namespace {

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segments;
    std::istringstream iss(s);
    std::string seg;
    while (std::getline(iss, seg, '/')) {
        if (!seg.empty() && seg != ".") segments.push_back(seg);
    }
    return segments;
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& name, size_t ni) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            // Collapse runs of ** and try every split point
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = ni; k <= name.size(); ++k) {
                if (match_segments(pat, pi, name, k)) return true;
            }
            return false;
        }
        if (ni >= name.size()) return false;
        if (!fnmatch(pat[pi], name[ni])) return false;
        ++pi; ++ni;
    }
    return ni == name.size();
}

} // anonymous namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    auto pat = split_segments(pattern);
    auto name = split_segments(path);
    if (pat.empty()) return name.empty();
    return match_segments(pat, 0, name, 0);
}

bool is_excluded(const std::vector<std::string>& patterns,
                 const std::string& rel_path) {
    auto pos = rel_path.rfind('/');
    std::string filename = (pos != std::string::npos)
        ? rel_path.substr(pos + 1) : rel_path;

    for (const auto& pat : patterns) {
        if (pat.empty()) continue;
        if (glob_match(pat, rel_path)) return true;
        if (pat.find('/') == std::string::npos && fnmatch(pat, filename)) return true;
    }
    return false;
}

} // namespace glob
} // namespace fsgate
