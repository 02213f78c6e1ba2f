#pragma once

#include "types.h"

#include <functional>
#include <string>
#include <vector>

namespace fsgate {

/// Performs writes, edits, moves and directory creation on paths that the
/// caller has already resolved and confined.
///
/// Every mutation either completes or leaves the original untouched:
/// content is published through a temporary file in the target directory
/// and rename(2).  Failures propagate as typed exceptions.
///
/// @code
///     fsgate::FileMutationEngine engine;
///     engine.write_file("/srv/docs/a.txt", "hello\n");
///     std::string diff = engine.edit_file("/srv/docs/a.txt",
///                                         {{"hello", "world"}}, true);
/// @endcode
class FileMutationEngine {
public:
    /// rename(2)-shaped primitive: returns 0 on success or an errno value.
    /// It must fail with EEXIST rather than replace an existing `to`.
    using RenameFn = std::function<int(const std::string& from,
                                       const std::string& to)>;

    /// Uses rename_noreplace().
    FileMutationEngine();

    /// Substitute the rename primitive used by move().  Tests use this to
    /// simulate EXDEV.
    explicit FileMutationEngine(RenameFn rename_fn);

    /// Atomically replace (or create) `target` with `content`.
    /// @throws NotFoundError if the parent directory is missing.
    /// @throws IsADirectoryError if `target` is a directory.
    /// @throws IoError on any other failure; no temporary file is left.
    void write_file(const std::string& target, const std::string& content) const;

    /// Apply `edits` and return the fenced unified diff.
    ///
    /// The file's CRLF line endings are kept when it used them.  With
    /// `dry_run` the file is not touched at all.
    /// @param label  Path shown in the diff headers ("" uses `target`).
    /// @throws NotFoundError, IsADirectoryError, EditMatchNotFoundError,
    ///         IoError.
    std::string edit_file(const std::string& target,
                          const std::vector<EditOperation>& edits,
                          bool dry_run,
                          const std::string& label = "") const;

    /// Move `source` to `destination`.
    ///
    /// The destination must not exist and its parent must.  A destination
    /// that appears during the move is never replaced.  When rename(2)
    /// reports EXDEV the tree is copied and the source removed.  A failed
    /// copy removes the partial destination and keeps the source.  If the
    /// source cannot be removed after a complete copy the destination stays
    /// and IoError names the leftover source.
    /// @throws NotFoundError, AlreadyExistsError, IoError.
    void move(const std::string& source, const std::string& destination) const;

    /// Create `target` and any missing parents.  Succeeds when it already
    /// is a directory.
    /// @throws NotADirectoryError if a non-directory is in the way.
    /// @throws IoError on any other failure.
    void create_directory(const std::string& target) const;

    /// Default rename primitive: renameat2(RENAME_NOREPLACE) where the
    /// kernel has it, link(2) and unlink(2) for non-directories otherwise.
    static int rename_noreplace(const std::string& from, const std::string& to);

private:
    void copy_tree(const std::string& from, const std::string& to) const;

    RenameFn rename_;
};

} // namespace fsgate
