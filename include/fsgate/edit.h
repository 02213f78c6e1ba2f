#pragma once

#include "types.h"

#include <string>
#include <vector>

namespace fsgate {

/// Apply `edits` in order to `content` and return the result.
///
/// Line endings are normalized to `\n` in the content and in every edit.
/// Each edit first tries an exact substring match (first occurrence).
/// Failing that, it looks for the first run of lines that equals the old
/// text line by line once leading and trailing whitespace is ignored; the
/// replacement then takes the indentation of the first matched line.
/// @throws EditMatchNotFoundError naming the first edit that matches
///         nowhere (an empty old text never matches).
std::string apply_edits(const std::string& content,
                        const std::vector<EditOperation>& edits);

/// Unified diff of two texts, three lines of context.
///
/// Headers are `--- <label>\toriginal` and `+++ <label>\tmodified`.
/// Returns an empty string when the texts are equal.
std::string unified_diff(const std::string& original,
                         const std::string& modified,
                         const std::string& label,
                         size_t context = 3);

/// Wrap a diff in a ```diff fence longer than any backtick run inside it.
std::string fence_diff(const std::string& diff);

} // namespace fsgate
