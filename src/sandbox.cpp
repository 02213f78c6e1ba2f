#include "fsgate/sandbox.h"
#include "fsgate/error.h"
#include "fsgate/log.h"

#include <string>
#include <utility>

namespace fsgate {

Sandbox::Sandbox() = default;

Sandbox::Sandbox(PathResolver resolver, FileMutationEngine mutation)
    : resolver_(std::move(resolver))
    , mutation_(std::move(mutation))
{}

// ---------------------------------------------------------------------------
// Roots
// ---------------------------------------------------------------------------

void Sandbox::replace_roots(const std::vector<std::string>& candidates) {
    registry_.replace_roots(candidates);
}

std::vector<std::string> Sandbox::roots() const {
    return registry_.list_roots();
}

std::shared_ptr<const RootSet> Sandbox::root_set() const {
    return registry_.snapshot();
}

ResolvedPath Sandbox::resolve(const std::string& path, bool must_exist) const {
    auto roots = registry_.snapshot();
    return resolver_.resolve(path, *roots, must_exist);
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

std::string Sandbox::read_text(const std::string& path, const ReadOptions& opts) const {
    return reader_.read_text(resolve(path, true).path, opts);
}

MediaContent Sandbox::read_media(const std::string& path) const {
    return reader_.read_media(resolve(path, true).path);
}

FileInfo Sandbox::info(const std::string& path) const {
    return reader_.info(resolve(path, true).path);
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

void Sandbox::write_file(const std::string& path, const std::string& content) const {
    mutation_.write_file(resolve(path, false).path, content);
}

std::string Sandbox::edit_file(const std::string& path,
                               const std::vector<EditOperation>& edits,
                               bool dry_run) const {
    return mutation_.edit_file(resolve(path, true).path, edits, dry_run, path);
}

void Sandbox::create_directory(const std::string& path) const {
    mutation_.create_directory(resolve(path, false).path);
}

void Sandbox::move(const std::string& source, const std::string& destination) const {
    auto roots = registry_.snapshot();
    ResolvedPath from = resolver_.resolve(source, *roots, true);
    ResolvedPath to = resolver_.resolve(destination, *roots, false);
    mutation_.move(from.path, to.path);
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

LinkFilter Sandbox::link_filter(std::shared_ptr<const RootSet> roots) const {
    return [resolver = resolver_, roots = std::move(roots)](const std::string& link) {
        try {
            bool exists = false;
            return roots->contains(resolver.real_path(link, exists));
        } catch (const FsGateError& e) {
            logger().debug(std::string("hiding unresolvable link: ") + e.what());
            return false;
        }
    };
}

std::vector<DirectoryEntry> Sandbox::list_directory(const std::string& path) const {
    auto roots = registry_.snapshot();
    std::string dir = resolver_.resolve(path, *roots, true).path;
    return traversal_.list_directory(dir, link_filter(roots));
}

std::vector<DirectoryEntry> Sandbox::list_with_sizes(const std::string& path,
                                                     SortBy sort_by) const {
    auto roots = registry_.snapshot();
    std::string dir = resolver_.resolve(path, *roots, true).path;
    return traversal_.list_with_sizes(dir, sort_by, link_filter(roots));
}

DirectoryEntry Sandbox::tree(const std::string& path,
                             const std::vector<std::string>& excludes) const {
    auto roots = registry_.snapshot();
    std::string dir = resolver_.resolve(path, *roots, true).path;
    return traversal_.tree(dir, excludes, link_filter(roots));
}

SearchCursor Sandbox::search(const std::string& path,
                             const std::string& pattern,
                             const std::vector<std::string>& excludes) const {
    auto roots = registry_.snapshot();
    std::string dir = resolver_.resolve(path, *roots, true).path;
    return traversal_.search(dir, pattern, excludes, link_filter(roots));
}

} // namespace fsgate
