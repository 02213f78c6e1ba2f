#pragma once

#include "types.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

/// Whether the symlink at an absolute path may be shown for what it points
/// to.  An empty filter admits every link.
using LinkFilter = std::function<bool(const std::string& link_path)>;

// ---------------------------------------------------------------------------
// SearchCursor
// ---------------------------------------------------------------------------

/// Lazy depth-first search below a directory.
///
/// Entries are visited in pre-order with names sorted at each level.
/// Excluded entries are skipped and excluded directories are not entered;
/// symlinked directories are never followed; unreadable directories are
/// skipped.  Symlinks rejected by the link filter are never reported.
/// A cursor is single-pass; start a new search to restart.
///
/// @code
///     auto cursor = engine.search("/srv/docs", "**/*.md", {"**/drafts/**"});
///     while (auto hit = cursor.next()) {
///         std::cout << *hit << "\n";
///     }
/// @endcode
class SearchCursor {
public:
    SearchCursor(std::string root, std::string pattern,
                 std::vector<std::string> excludes,
                 LinkFilter admit_link = {});

    /// Absolute path of the next match, or nullopt when exhausted.
    std::optional<std::string> next();

    /// All remaining matches.
    std::vector<std::string> drain();

private:
    struct Frame {
        std::string              dir;   ///< Absolute directory path.
        std::string              rel;   ///< Path relative to root ("" at root).
        std::vector<std::string> names; ///< Remaining names, sorted.
        std::vector<bool>        dirs;  ///< Whether each name is a real directory.
        std::vector<bool>        links; ///< Whether each name is a symlink.
        size_t                   index = 0;
    };

    void push_dir(const std::string& dir, const std::string& rel);
    bool matches(const std::string& rel, const std::string& name) const;

    std::string              root_;
    std::string              pattern_;
    std::vector<std::string> excludes_;
    LinkFilter               admit_link_;
    std::vector<Frame>       stack_;
};

// ---------------------------------------------------------------------------
// TraversalEngine
// ---------------------------------------------------------------------------

/// Directory listings, trees and searches on resolved directories.
///
/// Exclude patterns match an entry's path relative to the starting
/// directory; patterns without `/` also match its name.  Symlinks that
/// `admit_link` rejects are listed as plain symlinks without looking at
/// their targets.
class TraversalEngine {
public:
    /// One level, sorted by name.  Sizes are not filled in.
    /// @throws NotFoundError, NotADirectoryError, IoError.
    std::vector<DirectoryEntry> list_directory(const std::string& dir,
                                               const LinkFilter& admit_link = {}) const;

    /// One level with byte sizes for files.  SortBy::Size puts the largest
    /// first (directories count as 0) and breaks ties by name.
    /// @throws NotFoundError, NotADirectoryError, IoError.
    std::vector<DirectoryEntry> list_with_sizes(const std::string& dir,
                                                SortBy sort_by,
                                                const LinkFilter& admit_link = {}) const;

    /// Recursive tree rooted at `dir` (the returned entry is `dir` itself).
    ///
    /// Symlinked directories appear as directory leaves with no children;
    /// unreadable directories have empty children.
    /// @throws NotFoundError, NotADirectoryError, IoError.
    DirectoryEntry tree(const std::string& dir,
                        const std::vector<std::string>& excludes = {},
                        const LinkFilter& admit_link = {}) const;

    /// Start a lazy search.  A pattern without `/` matches entry names,
    /// otherwise paths relative to `dir`.
    /// @throws NotFoundError, NotADirectoryError, IoError.
    SearchCursor search(const std::string& dir,
                        const std::string& pattern,
                        const std::vector<std::string>& excludes = {},
                        LinkFilter admit_link = {}) const;
};

} // namespace fsgate
