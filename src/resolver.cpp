#include "fsgate/resolver.h"
#include "fsgate/error.h"
#include "fsgate/log.h"
#include "fsgate/paths.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fsgate {

namespace {

/// Same bound as Linux's MAXSYMLINKS.
constexpr int kMaxSymlinks = 40;

std::deque<std::string> split_components(const std::string& path) {
    std::deque<std::string> out;
    std::istringstream iss(path);
    std::string seg;
    while (std::getline(iss, seg, '/')) {
        if (!seg.empty() && seg != ".") out.push_back(seg);
    }
    return out;
}

std::string join_components(std::string base, const std::deque<std::string>& rest) {
    for (const auto& c : rest) base = paths::join(base, c);
    return base;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LocalFsProbe
// ---------------------------------------------------------------------------

EntryKind LocalFsProbe::kind(const std::string& path) const {
    struct ::stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return EntryKind::Missing;
        throw IoError("cannot stat " + path + ": " + std::strerror(errno));
    }
    if (S_ISLNK(st.st_mode)) return EntryKind::Symlink;
    if (S_ISDIR(st.st_mode)) return EntryKind::Directory;
    if (S_ISREG(st.st_mode)) return EntryKind::File;
    return EntryKind::Other;
}

std::string LocalFsProbe::read_link(const std::string& path) const {
    std::vector<char> buf(256);
    while (true) {
        ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
        if (n < 0) {
            throw IoError("cannot read link " + path + ": " + std::strerror(errno));
        }
        if (static_cast<size_t>(n) < buf.size()) {
            return std::string(buf.data(), static_cast<size_t>(n));
        }
        buf.resize(buf.size() * 2);
    }
}

// ---------------------------------------------------------------------------
// PathResolver
// ---------------------------------------------------------------------------

PathResolver::PathResolver()
    : probe_(std::make_shared<LocalFsProbe>()) {}

PathResolver::PathResolver(std::shared_ptr<const FsProbe> probe)
    : probe_(std::move(probe)) {}

std::string PathResolver::real_path(const std::string& normalized,
                                    bool& exists) const {
    std::deque<std::string> pending = split_components(normalized);
    std::string resolved = "/";
    int links = 0;
    exists = true;

    while (!pending.empty()) {
        std::string comp = std::move(pending.front());
        pending.pop_front();

        if (comp == "..") {
            // `resolved` is already symlink-free, so its parent is real
            resolved = paths::parent(resolved);
            continue;
        }

        std::string candidate = paths::join(resolved, comp);
        EntryKind k = probe_->kind(candidate);

        if (k == EntryKind::Missing) {
            std::string rest = paths::normalize(join_components(candidate, pending));
            bool climbs = std::find(pending.begin(), pending.end(), "..") != pending.end();
            if (climbs) {
                // A link target walked back out of a missing directory:
                // collapse algebraically and walk the result again.
                pending = split_components(rest);
                resolved = "/";
                continue;
            }
            exists = false;
            return rest;
        }

        if (k == EntryKind::Symlink) {
            if (++links > kMaxSymlinks) {
                throw IoError("too many levels of symbolic links: " + normalized);
            }
            std::string target = probe_->read_link(candidate);
            if (target.empty()) {
                throw IoError("empty symbolic link: " + candidate);
            }
            auto parts = split_components(target);
            pending.insert(pending.begin(), parts.begin(), parts.end());
            if (target[0] == '/') resolved = "/";
            continue;
        }

        resolved = std::move(candidate);
    }
    return resolved;
}

ResolvedPath PathResolver::resolve(const std::string& requested,
                                   const RootSet& roots,
                                   bool must_exist) const {
    std::string norm = paths::normalize(requested);
    if (!paths::is_absolute(norm)) {
        throw NotAbsoluteError(requested);
    }

    if (!roots.admits(norm)) {
        logger().warn("rejected path outside allowed directories: " + norm);
        throw AccessDeniedError(norm, "path outside allowed directories");
    }

    ResolvedPath out;
    out.path = real_path(norm, out.exists);

    if (!roots.contains(out.path)) {
        logger().warn("rejected symlink escape: " + norm);
        throw AccessDeniedError(norm, "symlink target outside allowed directories");
    }

    if (must_exist && !out.exists) {
        throw NotFoundError(norm);
    }
    return out;
}

} // namespace fsgate
