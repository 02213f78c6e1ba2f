#pragma once

#include <memory>
#include <string>
#include <vector>

namespace fsgate {

// ---------------------------------------------------------------------------
// RootSet — an immutable snapshot of allowed directories
// ---------------------------------------------------------------------------

/// An ordered, duplicate-free set of allowed root directories.
///
/// Each member stores its real (symlink-resolved) path.  When the root was
/// registered under a different spelling (e.g. through a symlinked
/// directory) that spelling is kept as an alias; aliases only take part in
/// the pre-resolution check (admits()), never in the final one (contains()).
class RootSet {
public:
    struct Root {
        std::string path;  ///< Real path.
        std::string alias; ///< Normalized registration spelling, or "".
    };

    RootSet() = default;

    /// Build from already-validated entries.  Later duplicates of a real
    /// path are dropped.
    explicit RootSet(std::vector<Root> roots);

    /// Build from real paths with no aliases (used by tests and fakes).
    static RootSet from_paths(const std::vector<std::string>& real_paths);

    const std::vector<Root>& roots() const { return roots_; }

    /// Real paths in registration order.
    std::vector<std::string> paths() const;

    bool   empty() const { return roots_.empty(); }
    size_t size()  const { return roots_.size(); }

    /// True when the normalized real path equals a root or lies below one
    /// (boundary-aware).
    bool contains(const std::string& real_path) const;

    /// Like contains(), but also accepts paths under a root's alias.
    bool admits(const std::string& normalized_path) const;

private:
    std::vector<Root> roots_;
};

// ---------------------------------------------------------------------------
// RootRegistry
// ---------------------------------------------------------------------------

/// Holds the active RootSet.
///
/// Replacement is all-or-nothing and is published by a single atomic
/// shared_ptr swap; readers holding an older snapshot keep it alive.
///
/// @code
///     fsgate::RootRegistry registry;
///     registry.replace_roots({"/home/u/docs", "~/notes"});
///     auto roots = registry.snapshot();
///     bool ok = roots->contains("/home/u/docs/a.txt");
/// @endcode
class RootRegistry {
public:
    RootRegistry();

    /// Validate every candidate and install them as the new RootSet.
    ///
    /// Candidates may be plain paths or `file://` URIs; relative paths are
    /// taken against the current working directory.
    /// @throws RootNotFoundError if a candidate does not exist.
    /// @throws RootNotADirectoryError if a candidate is not a directory.
    /// @throws InvalidPathError if a candidate is malformed.
    /// On any exception the previous RootSet stays active.
    void replace_roots(const std::vector<std::string>& candidates);

    /// The current snapshot.  Never null.
    std::shared_ptr<const RootSet> snapshot() const;

    /// Real paths of the current snapshot.
    std::vector<std::string> list_roots() const;

private:
    std::shared_ptr<const RootSet> current_;
};

/// Convert a root URI (`file:///a/b`, percent-escaped) or a plain path into
/// a path string.  Other URI schemes raise InvalidPathError.
std::string root_uri_to_path(const std::string& uri);

} // namespace fsgate
