#pragma once

#include <string>
#include <vector>

namespace fsgate {
namespace glob {

/// Match a single pattern segment against a single name.
/// Supports `*` (any run), `?` (any one character) and `[...]` / `[!...]`
/// character classes with ranges.  Neither side may contain `/`.
bool fnmatch(const std::string& pattern, const std::string& name);

/// Match a `/`-separated glob against a `/`-separated relative path.
///
/// `*`, `?` and classes never cross a separator.  A segment that is exactly
/// `**` matches zero or more whole segments, so `docs/**` matches `docs`
/// itself as well as everything below it.
bool glob_match(const std::string& pattern, const std::string& path);

/// True when any exclude pattern matches the entry.
///
/// Patterns containing `/` are matched against `rel_path`; patterns
/// without `/` are also matched against the last component, so `*.log`
/// excludes log files at any depth.
bool is_excluded(const std::vector<std::string>& patterns,
                 const std::string& rel_path);

} // namespace glob
} // namespace fsgate
