#include "fsgate/edit.h"
#include "fsgate/error.h"
#include "internal.h"

#include <algorithm>
#include <string>
#include <vector>

namespace fsgate {

namespace {

std::string trim_start(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && (s[n] == ' ' || s[n] == '\t' || s[n] == '\v' ||
                            s[n] == '\f' || s[n] == '\r')) {
        ++n;
    }
    return s.substr(n);
}

/// Index of the first window of `content` whose lines equal `old_lines`
/// after trimming, or npos.
size_t find_trimmed_window(const std::vector<std::string>& content,
                           const std::vector<std::string>& old_lines) {
    if (old_lines.size() > content.size()) return std::string::npos;
    std::vector<std::string> wanted;
    wanted.reserve(old_lines.size());
    for (const auto& l : old_lines) wanted.push_back(text::trim(l));

    for (size_t i = 0; i + old_lines.size() <= content.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < wanted.size(); ++j) {
            if (text::trim(content[i + j]) != wanted[j]) {
                match = false;
                break;
            }
        }
        if (match) return i;
    }
    return std::string::npos;
}

/// Re-indent `new_lines` for insertion where `old_lines` matched at a line
/// whose indentation is `indent`.
///
/// The first line takes `indent`.  Later lines keep whatever indentation
/// they have beyond the old text's first line, placed after `indent`.
/// Whitespace-only lines become empty.
std::vector<std::string> reindent(const std::vector<std::string>& new_lines,
                                  const std::vector<std::string>& old_lines,
                                  const std::string& indent) {
    std::string old_base = text::leading_whitespace(old_lines.front());
    std::vector<std::string> out;
    out.reserve(new_lines.size());
    for (size_t j = 0; j < new_lines.size(); ++j) {
        std::string body = trim_start(new_lines[j]);
        if (body.empty()) {
            out.emplace_back();
            continue;
        }
        std::string own = text::leading_whitespace(new_lines[j]);
        std::string extra;
        if (j > 0 && own.size() > old_base.size()) extra = own.substr(old_base.size());
        out.push_back(indent + extra + body);
    }
    return out;
}

} // anonymous namespace

std::string apply_edits(const std::string& content,
                        const std::vector<EditOperation>& edits) {
    std::string result = text::normalize_line_endings(content);

    for (const auto& edit : edits) {
        std::string old_text = text::normalize_line_endings(edit.old_text);
        std::string new_text = text::normalize_line_endings(edit.new_text);
        if (old_text.empty()) {
            throw EditMatchNotFoundError(edit.old_text);
        }

        size_t pos = result.find(old_text);
        if (pos != std::string::npos) {
            result.replace(pos, old_text.size(), new_text);
            continue;
        }

        auto lines     = text::split_lines(result);
        auto old_lines = text::split_lines(old_text);
        size_t at = find_trimmed_window(lines, old_lines);
        if (at == std::string::npos) {
            throw EditMatchNotFoundError(edit.old_text);
        }

        auto replacement = reindent(text::split_lines(new_text), old_lines,
                                    text::leading_whitespace(lines[at]));
        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(at),
                    lines.begin() + static_cast<std::ptrdiff_t>(at + old_lines.size()));
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at),
                     replacement.begin(), replacement.end());
        result = text::join_lines(lines);
    }
    return result;
}

std::string fence_diff(const std::string& diff) {
    size_t longest = 0, run = 0;
    for (char c : diff) {
        run = (c == '`') ? run + 1 : 0;
        longest = std::max(longest, run);
    }
    std::string fence(std::max<size_t>(3, longest + 1), '`');
    std::string out = fence + "diff\n" + diff;
    if (!diff.empty() && diff.back() != '\n') out += '\n';
    out += fence + "\n\n";
    return out;
}

} // namespace fsgate
