#include "fsgate/mutation.h"
#include "fsgate/edit.h"
#include "fsgate/error.h"
#include "fsgate/log.h"
#include "fsgate/paths.h"
#include "internal.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace fsgate {

namespace {

std::string to_crlf(const std::string& s) {
    std::string out;
    out.reserve(s.size() + s.size() / 16);
    for (char c : s) {
        if (c == '\n') out += '\r';
        out += c;
    }
    return out;
}

} // anonymous namespace

FileMutationEngine::FileMutationEngine()
    : rename_(&FileMutationEngine::rename_noreplace) {}

FileMutationEngine::FileMutationEngine(RenameFn rename_fn)
    : rename_(std::move(rename_fn)) {}

// ---------------------------------------------------------------------------
// write / edit
// ---------------------------------------------------------------------------

void FileMutationEngine::write_file(const std::string& target,
                                    const std::string& content) const {
    io::write_atomic(target, content);
    logger().info("wrote " + target + " (" + std::to_string(content.size()) + " bytes)");
}

std::string FileMutationEngine::edit_file(const std::string& target,
                                          const std::vector<EditOperation>& edits,
                                          bool dry_run,
                                          const std::string& label) const {
    std::string raw = io::read_all(target);
    bool crlf = raw.find("\r\n") != std::string::npos;
    std::string original = text::normalize_line_endings(raw);
    std::string modified = apply_edits(original, edits);

    std::string diff = unified_diff(original, modified, label.empty() ? target : label);

    if (dry_run) {
        logger().debug("dry-run edit of " + target);
    } else if (modified != original) {
        io::write_atomic(target, crlf ? to_crlf(modified) : modified);
        logger().info("edited " + target + " (" + std::to_string(edits.size()) + " edits)");
    }
    return fence_diff(diff);
}

// ---------------------------------------------------------------------------
// move
// ---------------------------------------------------------------------------

void FileMutationEngine::move(const std::string& source,
                              const std::string& destination) const {
    if (io::kind_of(source) == EntryKind::Missing) {
        throw NotFoundError(source);
    }
    if (io::kind_of(destination) != EntryKind::Missing) {
        throw AlreadyExistsError(destination);
    }
    std::string dest_parent = paths::parent(destination);
    EntryKind parent_kind = io::kind_of(dest_parent);
    if (parent_kind == EntryKind::Missing) throw NotFoundError(dest_parent);
    if (parent_kind != EntryKind::Directory) throw NotADirectoryError(dest_parent);

    int rc = rename_(source, destination);
    if (rc == 0) {
        logger().info("moved " + source + " to " + destination);
        return;
    }
    if (rc == ENOENT) throw NotFoundError(source);
    if (rc == EEXIST || rc == ENOTEMPTY) throw AlreadyExistsError(destination);
    if (rc != EXDEV) {
        throw IoError("cannot move " + source + " to " + destination + ": " +
                      std::strerror(rc));
    }

    logger().debug("cross-device move, copying " + source + " to " + destination);
    try {
        copy_tree(source, destination);
    } catch (const FsGateError& e) {
        // A destination created by someone else is not ours to remove.
        auto* exists = dynamic_cast<const AlreadyExistsError*>(&e);
        if (!exists || exists->path() != destination) {
            std::error_code ec;
            fs::remove_all(destination, ec);
            if (ec) {
                logger().error("cannot remove partial copy " + destination + ": " + ec.message());
            }
        }
        throw;
    }

    std::error_code ec;
    fs::remove_all(source, ec);
    if (ec) {
        logger().error("copied " + source + " to " + destination +
                       " but cannot remove the source: " + ec.message());
        throw IoError("moved " + source + " to " + destination +
                      " but the source could not be removed: " + ec.message());
    }
    logger().info("moved " + source + " to " + destination + " (copied across devices)");
}

int FileMutationEngine::rename_noreplace(const std::string& from, const std::string& to) {
    return io::rename_noreplace(from, to);
}

void FileMutationEngine::copy_tree(const std::string& from,
                                   const std::string& to) const {
    switch (io::kind_of(from)) {
        case EntryKind::File:
            io::copy_file_atomic(from, to);
            return;

        case EntryKind::Directory: {
            struct ::stat st;
            mode_t mode = 0777;
            if (::stat(from.c_str(), &st) == 0) mode = st.st_mode & 07777;
            if (::mkdir(to.c_str(), mode | S_IRWXU) != 0) {
                if (errno == EEXIST) throw AlreadyExistsError(to);
                throw IoError("cannot create directory " + to + ": " + std::strerror(errno));
            }
            for (const auto& item : io::read_dir(from)) {
                copy_tree(paths::join(from, item.name), paths::join(to, item.name));
            }
            if (::chmod(to.c_str(), mode) != 0) {
                throw IoError("cannot set mode on " + to + ": " + std::strerror(errno));
            }
            return;
        }

        case EntryKind::Symlink: {
            std::error_code ec;
            fs::path target = fs::read_symlink(from, ec);
            if (ec) throw IoError("cannot read link " + from + ": " + ec.message());
            fs::create_symlink(target, to, ec);
            if (ec == std::errc::file_exists) throw AlreadyExistsError(to);
            if (ec) throw IoError("cannot create link " + to + ": " + ec.message());
            return;
        }

        case EntryKind::Missing:
            throw NotFoundError(from);

        case EntryKind::Other:
            break;
    }
    throw IoError("cannot copy special file: " + from);
}

// ---------------------------------------------------------------------------
// create_directory
// ---------------------------------------------------------------------------

void FileMutationEngine::create_directory(const std::string& target) const {
    EntryKind k = io::kind_of(target);
    if (k == EntryKind::Directory) return;
    if (k != EntryKind::Missing) throw NotADirectoryError(target);

    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        if (ec == std::errc::not_a_directory || ec == std::errc::file_exists) {
            throw NotADirectoryError(target);
        }
        throw IoError("cannot create directory " + target + ": " + ec.message());
    }
    logger().info("created directory " + target);
}

} // namespace fsgate
