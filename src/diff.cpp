#include "fsgate/edit.h"
#include "internal.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace fsgate {

namespace {

/// Above this many DP cells the changed region is reported as one
/// replacement instead of a minimal diff.
constexpr size_t kMaxLcsCells = size_t(4) * 1024 * 1024;

enum class Op { Equal, Replace, Delete, Insert };

struct Opcode {
    Op     op;
    size_t i1, i2; ///< Range in the original.
    size_t j1, j2; ///< Range in the modified text.
};

/// Split keeping each line's '\n'; a final unterminated line is kept too.
std::vector<std::string> split_keep_ends(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < s.size()) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return out;
}

/// Pairs (i, j) of equal lines forming a longest common subsequence of
/// a[a0, a1) and b[b0, b1), in increasing order.
std::vector<std::pair<size_t, size_t>>
lcs_pairs(const std::vector<std::string>& a, size_t a0, size_t a1,
          const std::vector<std::string>& b, size_t b0, size_t b1) {
    std::vector<std::pair<size_t, size_t>> pairs;
    size_t n = a1 - a0, m = b1 - b0;
    if (n == 0 || m == 0) return pairs;
    if ((n + 1) * (m + 1) > kMaxLcsCells) return pairs;

    // len[i][j] = LCS length of a[a0+i..a1) and b[b0+j..b1)
    std::vector<uint32_t> len((n + 1) * (m + 1), 0);
    auto at = [&](size_t i, size_t j) -> uint32_t& { return len[i * (m + 1) + j]; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if (a[a0 + i] == b[b0 + j]) {
                at(i, j) = at(i + 1, j + 1) + 1;
            } else {
                at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
            }
        }
    }

    size_t i = 0, j = 0;
    while (i < n && j < m) {
        if (a[a0 + i] == b[b0 + j]) {
            pairs.emplace_back(a0 + i, b0 + j);
            ++i;
            ++j;
        } else if (at(i + 1, j) >= at(i, j + 1)) {
            ++i;
        } else {
            ++j;
        }
    }
    return pairs;
}

std::vector<Opcode> opcodes(const std::vector<std::string>& a,
                            const std::vector<std::string>& b) {
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    // Matching blocks: common prefix, LCS of the middle, common suffix.
    std::vector<std::pair<size_t, size_t>> matches;
    for (size_t k = 0; k < prefix; ++k) matches.emplace_back(k, k);
    auto middle = lcs_pairs(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix);
    matches.insert(matches.end(), middle.begin(), middle.end());
    for (size_t k = suffix; k > 0; --k) {
        matches.emplace_back(a.size() - k, b.size() - k);
    }

    std::vector<Opcode> codes;
    size_t i = 0, j = 0;
    size_t k = 0;
    while (k <= matches.size()) {
        size_t mi = k < matches.size() ? matches[k].first : a.size();
        size_t mj = k < matches.size() ? matches[k].second : b.size();
        if (i < mi && j < mj) {
            codes.push_back({Op::Replace, i, mi, j, mj});
        } else if (i < mi) {
            codes.push_back({Op::Delete, i, mi, j, j});
        } else if (j < mj) {
            codes.push_back({Op::Insert, i, i, j, mj});
        }
        if (k == matches.size()) break;

        // Extend over the run of consecutive matches.
        size_t run = 1;
        while (k + run < matches.size() &&
               matches[k + run].first == mi + run &&
               matches[k + run].second == mj + run) {
            ++run;
        }
        codes.push_back({Op::Equal, mi, mi + run, mj, mj + run});
        i = mi + run;
        j = mj + run;
        k += run;
    }
    return codes;
}

/// Split opcodes into hunks with at most `n` lines of context around
/// each change.
std::vector<std::vector<Opcode>> grouped(std::vector<Opcode> codes, size_t n) {
    std::vector<std::vector<Opcode>> groups;
    if (codes.empty()) return groups;

    if (codes.front().op == Op::Equal) {
        Opcode& c = codes.front();
        if (c.i2 - c.i1 > n) {
            c.i1 = c.i2 - n;
            c.j1 = c.j2 - n;
        }
    }
    if (codes.back().op == Op::Equal) {
        Opcode& c = codes.back();
        if (c.i2 - c.i1 > n) {
            c.i2 = c.i1 + n;
            c.j2 = c.j1 + n;
        }
    }

    std::vector<Opcode> group;
    for (Opcode c : codes) {
        if (c.op == Op::Equal && c.i2 - c.i1 > 2 * n) {
            group.push_back({Op::Equal, c.i1, c.i1 + n, c.j1, c.j1 + n});
            groups.push_back(std::move(group));
            group.clear();
            c.i1 = c.i2 - n;
            c.j1 = c.j2 - n;
        }
        group.push_back(c);
    }
    if (!group.empty() && !(group.size() == 1 && group[0].op == Op::Equal)) {
        groups.push_back(std::move(group));
    }
    return groups;
}

/// "start,len" with the one-line and empty-range conventions of diff(1).
std::string format_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1) return std::to_string(beginning);
    if (length == 0) beginning -= 1;
    return std::to_string(beginning) + "," + std::to_string(length);
}

void emit_line(std::string& out, char tag, const std::string& line) {
    out += tag;
    out += line;
    if (line.empty() || line.back() != '\n') {
        out += "\n\\ No newline at end of file\n";
    }
}

} // anonymous namespace

std::string unified_diff(const std::string& original,
                         const std::string& modified,
                         const std::string& label,
                         size_t context) {
    std::string a_text = text::normalize_line_endings(original);
    std::string b_text = text::normalize_line_endings(modified);
    if (a_text == b_text) return "";

    auto a = split_keep_ends(a_text);
    auto b = split_keep_ends(b_text);

    std::string out;
    out += "--- " + label + "\toriginal\n";
    out += "+++ " + label + "\tmodified\n";

    for (const auto& group : grouped(opcodes(a, b), context)) {
        const Opcode& first = group.front();
        const Opcode& last = group.back();
        out += "@@ -" + format_range(first.i1, last.i2) +
               " +" + format_range(first.j1, last.j2) + " @@\n";

        for (const auto& c : group) {
            if (c.op == Op::Equal) {
                for (size_t i = c.i1; i < c.i2; ++i) emit_line(out, ' ', a[i]);
                continue;
            }
            if (c.op == Op::Replace || c.op == Op::Delete) {
                for (size_t i = c.i1; i < c.i2; ++i) emit_line(out, '-', a[i]);
            }
            if (c.op == Op::Replace || c.op == Op::Insert) {
                for (size_t j = c.j1; j < c.j2; ++j) emit_line(out, '+', b[j]);
            }
        }
    }
    return out;
}

} // namespace fsgate
