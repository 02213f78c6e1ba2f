#pragma once

#include <string>

namespace fsgate {
namespace paths {

/// Normalize a requested path without touching the filesystem.
///
/// Strips surrounding whitespace and one pair of quotes, expands a leading
/// `~`, converts separators to `/`, collapses `.`, `..` and repeated
/// separators, and drops a trailing separator (except for "/").
/// Relative inputs stay relative.
/// @throws InvalidPathError on an empty path or an embedded NUL byte.
std::string normalize(const std::string& path);

/// Replace a leading `~` or `~/` with the home directory.
/// Returns the input unchanged when the home directory is unknown.
std::string expand_home(const std::string& path);

/// True for "/..." (and "C:/..." on Windows).
bool is_absolute(const std::string& path);

/// Boundary-aware containment: true when `path` equals `root` or lies
/// below it. Both arguments must already be normalized.
bool is_within(const std::string& path, const std::string& root);

/// The "/"-joined remainder of `path` below `base` ("" when equal).
/// Both arguments must be normalized and `path` must be within `base`.
std::string relative_to(const std::string& path, const std::string& base);

/// Join a normalized directory and a single name.
std::string join(const std::string& dir, const std::string& name);

/// Directory part of a normalized path ("/" for top-level entries).
std::string parent(const std::string& path);

/// Last component of a normalized path.
std::string basename(const std::string& path);

} // namespace paths
} // namespace fsgate
