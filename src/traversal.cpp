#include "fsgate/traversal.h"
#include "fsgate/error.h"
#include "fsgate/glob.h"
#include "fsgate/log.h"
#include "fsgate/paths.h"
#include "internal.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace fsgate {

namespace {

/// Report a symlink as what it points to, without ever following it for
/// traversal.  Dangling links, and links `admit_link` rejects, stay Symlink.
DirectoryEntry to_entry(const std::string& dir, const io::DirItem& item,
                        const LinkFilter& admit_link) {
    DirectoryEntry e;
    e.name = item.name;
    e.kind = item.kind;
    if (item.kind == EntryKind::File) {
        e.size = item.size;
    } else if (item.kind == EntryKind::Symlink) {
        struct ::stat st;
        std::string full = paths::join(dir, item.name);
        if (admit_link && !admit_link(full)) return e;
        if (::stat(full.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) e.kind = EntryKind::Directory;
            else if (S_ISREG(st.st_mode)) e.kind = EntryKind::File;
        }
    }
    return e;
}

void require_directory(const std::string& dir) {
    EntryKind k = io::kind_of(dir);
    if (k == EntryKind::Missing) throw NotFoundError(dir);
    if (k != EntryKind::Directory) throw NotADirectoryError(dir);
}

std::string child_rel(const std::string& rel, const std::string& name) {
    return rel.empty() ? name : rel + "/" + name;
}

std::vector<DirectoryEntry> build_tree(const std::string& dir,
                                       const std::string& rel,
                                       const std::vector<std::string>& excludes,
                                       const LinkFilter& admit_link) {
    std::vector<DirectoryEntry> children;
    for (const auto& item : io::read_dir(dir)) {
        std::string item_rel = child_rel(rel, item.name);
        if (glob::is_excluded(excludes, item_rel)) continue;

        DirectoryEntry e = to_entry(dir, item, admit_link);
        if (item.kind == EntryKind::Directory) {
            std::string sub = paths::join(dir, item.name);
            try {
                e.children = build_tree(sub, item_rel, excludes, admit_link);
            } catch (const FsGateError& err) {
                logger().debug(std::string("skipping unreadable directory: ") + err.what());
                e.children = std::vector<DirectoryEntry>{};
            }
        } else if (e.kind == EntryKind::Directory) {
            // Symlinked directory: listed, never entered.
            e.children = std::vector<DirectoryEntry>{};
        }
        children.push_back(std::move(e));
    }
    return children;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Listings
// ---------------------------------------------------------------------------

std::vector<DirectoryEntry> TraversalEngine::list_directory(const std::string& dir,
                                                            const LinkFilter& admit_link) const {
    std::vector<DirectoryEntry> out;
    for (const auto& item : io::read_dir(dir)) {
        DirectoryEntry e = to_entry(dir, item, admit_link);
        e.size.reset();
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<DirectoryEntry> TraversalEngine::list_with_sizes(const std::string& dir,
                                                             SortBy sort_by,
                                                             const LinkFilter& admit_link) const {
    std::vector<DirectoryEntry> out;
    for (const auto& item : io::read_dir(dir)) {
        out.push_back(to_entry(dir, item, admit_link));
    }
    if (sort_by == SortBy::Size) {
        std::stable_sort(out.begin(), out.end(),
                         [](const DirectoryEntry& a, const DirectoryEntry& b) {
                             uint64_t sa = a.size.value_or(0), sb = b.size.value_or(0);
                             if (sa != sb) return sa > sb;
                             return a.name < b.name;
                         });
    }
    return out;
}

DirectoryEntry TraversalEngine::tree(const std::string& dir,
                                     const std::vector<std::string>& excludes,
                                     const LinkFilter& admit_link) const {
    require_directory(dir);
    DirectoryEntry root;
    root.name = paths::basename(dir);
    root.kind = EntryKind::Directory;
    root.children = build_tree(dir, "", excludes, admit_link);
    return root;
}

SearchCursor TraversalEngine::search(const std::string& dir,
                                     const std::string& pattern,
                                     const std::vector<std::string>& excludes,
                                     LinkFilter admit_link) const {
    require_directory(dir);
    return SearchCursor(dir, pattern, excludes, std::move(admit_link));
}

// ---------------------------------------------------------------------------
// SearchCursor
// ---------------------------------------------------------------------------

SearchCursor::SearchCursor(std::string root, std::string pattern,
                           std::vector<std::string> excludes,
                           LinkFilter admit_link)
    : root_(std::move(root))
    , pattern_(std::move(pattern))
    , excludes_(std::move(excludes))
    , admit_link_(std::move(admit_link))
{
    push_dir(root_, "");
}

void SearchCursor::push_dir(const std::string& dir, const std::string& rel) {
    std::vector<io::DirItem> items;
    try {
        items = io::read_dir(dir);
    } catch (const FsGateError& err) {
        // Vanished or unreadable directories are skipped.
        logger().debug(std::string("search skipped directory: ") + err.what());
        return;
    }
    Frame f;
    f.dir = dir;
    f.rel = rel;
    for (const auto& item : items) {
        f.names.push_back(item.name);
        f.dirs.push_back(item.kind == EntryKind::Directory);
        f.links.push_back(item.kind == EntryKind::Symlink);
    }
    stack_.push_back(std::move(f));
}

bool SearchCursor::matches(const std::string& rel, const std::string& name) const {
    if (pattern_.find('/') == std::string::npos) {
        return glob::fnmatch(pattern_, name);
    }
    return glob::glob_match(pattern_, rel);
}

std::optional<std::string> SearchCursor::next() {
    while (!stack_.empty()) {
        Frame& top = stack_.back();
        if (top.index >= top.names.size()) {
            stack_.pop_back();
            continue;
        }
        size_t i = top.index++;
        std::string name = top.names[i];
        bool is_dir = top.dirs[i];
        bool is_link = top.links[i];
        std::string rel = child_rel(top.rel, name);
        std::string full = paths::join(top.dir, name);

        if (glob::is_excluded(excludes_, rel)) continue;
        if (is_link && admit_link_ && !admit_link_(full)) continue;

        bool hit = matches(rel, name);
        // `top` may dangle after push_dir.
        if (is_dir) push_dir(full, rel);
        if (hit) return full;
    }
    return std::nullopt;
}

std::vector<std::string> SearchCursor::drain() {
    std::vector<std::string> out;
    while (auto hit = next()) out.push_back(std::move(*hit));
    return out;
}

} // namespace fsgate
