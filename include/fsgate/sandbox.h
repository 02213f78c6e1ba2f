#pragma once

#include "mutation.h"
#include "reader.h"
#include "resolver.h"
#include "roots.h"
#include "traversal.h"
#include "types.h"

#include <memory>
#include <string>
#include <vector>

namespace fsgate {

/// Confined filesystem access: every path is resolved against the current
/// roots before any engine sees it.
///
/// Reads resolve with must_exist; writes and creates accept a missing final
/// component.  Each call takes its own RootSet snapshot, so a concurrent
/// roots update never changes the rules halfway through an operation.
///
/// @code
///     fsgate::Sandbox box;
///     box.replace_roots({"/srv/docs"});
///     box.write_file("/srv/docs/a.txt", "hello\n");
///     std::string text = box.read_text("/srv/docs/a.txt");
/// @endcode
class Sandbox {
public:
    Sandbox();
    Sandbox(PathResolver resolver, FileMutationEngine mutation);

    // -- Roots --------------------------------------------------------------

    /// @see RootRegistry::replace_roots
    void replace_roots(const std::vector<std::string>& candidates);
    std::vector<std::string> roots() const;
    std::shared_ptr<const RootSet> root_set() const;

    /// Resolve `path` against the current roots.
    ResolvedPath resolve(const std::string& path, bool must_exist) const;

    // -- Reads --------------------------------------------------------------

    std::string  read_text(const std::string& path, const ReadOptions& opts = {}) const;
    MediaContent read_media(const std::string& path) const;
    FileInfo     info(const std::string& path) const;

    // -- Mutations ----------------------------------------------------------

    void write_file(const std::string& path, const std::string& content) const;

    /// Returns the fenced diff; the diff headers show `path` as requested.
    std::string edit_file(const std::string& path,
                          const std::vector<EditOperation>& edits,
                          bool dry_run) const;

    void create_directory(const std::string& path) const;

    /// Source and destination are resolved independently; both must be
    /// confined.
    void move(const std::string& source, const std::string& destination) const;

    // -- Traversal ----------------------------------------------------------
    //
    // Symlinks whose targets leave the roots are listed as plain symlinks
    // and never returned by search.

    std::vector<DirectoryEntry> list_directory(const std::string& path) const;
    std::vector<DirectoryEntry> list_with_sizes(const std::string& path, SortBy sort_by) const;
    DirectoryEntry tree(const std::string& path,
                        const std::vector<std::string>& excludes = {}) const;
    SearchCursor search(const std::string& path,
                        const std::string& pattern,
                        const std::vector<std::string>& excludes = {}) const;

private:
    /// Admits a symlink only when its fully resolved target is in `roots`.
    LinkFilter link_filter(std::shared_ptr<const RootSet> roots) const;

    RootRegistry       registry_;
    PathResolver       resolver_;
    FileMutationEngine mutation_;
    FileReader         reader_;
    TraversalEngine    traversal_;
};

} // namespace fsgate
