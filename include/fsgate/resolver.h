#pragma once

#include "roots.h"
#include "types.h"

#include <memory>
#include <string>

namespace fsgate {

// ---------------------------------------------------------------------------
// FsProbe — the resolver's only window onto the filesystem
// ---------------------------------------------------------------------------

/// Read-only filesystem queries needed for symlink resolution.
///
/// LocalFsProbe answers from the real filesystem; tests substitute fakes to
/// model link layouts that are awkward to build on disk.
class FsProbe {
public:
    virtual ~FsProbe() = default;

    /// Kind of the entry at `path` without following a final symlink.
    /// Returns EntryKind::Missing when nothing is there, including when an
    /// intermediate component is not a directory.
    /// @throws IoError for other failures (e.g. permission denied).
    virtual EntryKind kind(const std::string& path) const = 0;

    /// Target of the symlink at `path`, verbatim.
    /// @throws IoError if it cannot be read.
    virtual std::string read_link(const std::string& path) const = 0;
};

/// FsProbe backed by lstat(2) / readlink(2).
class LocalFsProbe : public FsProbe {
public:
    EntryKind   kind(const std::string& path) const override;
    std::string read_link(const std::string& path) const override;
};

// ---------------------------------------------------------------------------
// PathResolver
// ---------------------------------------------------------------------------

/// Turns a requested path into a ResolvedPath confined to a RootSet.
///
/// Resolution is two-phase: the normalized request must lie under an
/// allowed root, and so must the path obtained after replacing every symlink
/// on its existing prefix by its target.  A link inside a root that points
/// outside it is therefore rejected even though the request looks confined.
class PathResolver {
public:
    /// Resolve against the real filesystem.
    PathResolver();

    explicit PathResolver(std::shared_ptr<const FsProbe> probe);

    /// @param requested  Absolute path from the client (`~` allowed).
    /// @param roots      Snapshot to check against.
    /// @param must_exist Fail with NotFoundError when the target is missing.
    /// @throws InvalidPathError, NotAbsoluteError, AccessDeniedError,
    ///         NotFoundError, IoError.
    ResolvedPath resolve(const std::string& requested,
                         const RootSet& roots,
                         bool must_exist) const;

    /// Replace every symlink on the existing prefix of an absolute,
    /// normalized path; the missing suffix is appended literally.
    /// Sets `exists` when every component was found.
    std::string real_path(const std::string& normalized, bool& exists) const;

    const FsProbe& probe() const { return *probe_; }

private:
    std::shared_ptr<const FsProbe> probe_;
};

} // namespace fsgate
