#include "internal.h"
#include "fsgate/paths.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fsgate {
namespace io {

namespace {

std::string errno_text(int err) { return std::strerror(err); }

/// RAII file descriptor.
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() {
        if (fd >= 0) ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    /// Close now and report failure; the guard then owns nothing.
    int close_checked() {
        int rc = ::close(fd);
        fd = -1;
        return rc;
    }
};

/// Unlinks the temporary file unless released after a successful rename.
struct TempFileGuard {
    std::string path;
    bool        armed = true;
    explicit TempFileGuard(std::string p) : path(std::move(p)) {}
    ~TempFileGuard() {
        if (armed) ::unlink(path.c_str());
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
};

void write_fully(int fd, const char* data, size_t size, const std::string& path) {
    size_t off = 0;
    while (off < size) {
        ssize_t n = ::write(fd, data + off, size - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("cannot write " + path + ": " + errno_text(errno));
        }
        off += static_cast<size_t>(n);
    }
}

/// Temporary name beside `target`.  Long basenames get a short hidden name
/// so the suffix never pushes the entry past NAME_MAX.
std::string temp_name_for(const std::string& target) {
    std::string base = paths::basename(target);
    if (base.size() + 38 <= NAME_MAX) {
        return target + "." + random_hex(16) + ".tmp";
    }
    return paths::join(paths::parent(target), "." + random_hex(8) + ".tmp");
}

/// Write through a temporary file and rename over `target`.
/// With `mode` set, it is applied to the temporary file before the rename;
/// otherwise the file keeps the creation mode 0666 filtered by the umask.
/// Without `replace` an existing `target` is left alone.
void publish(const std::string& target, const std::string& content,
             std::optional<mode_t> mode, bool replace) {
    std::string tmp;
    int fd = -1;
    for (int attempt = 0; attempt < 8 && fd < 0; ++attempt) {
        tmp = temp_name_for(target);
        fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    mode ? 0600 : 0666);
        if (fd < 0 && errno != EEXIST) {
            int err = errno;
            if (err == ENOENT || err == ENOTDIR) {
                throw NotFoundError(paths::parent(target));
            }
            throw IoError("cannot create temporary file for " + target +
                          ": " + errno_text(err));
        }
    }
    if (fd < 0) {
        throw IoError("cannot create temporary file for " + target);
    }

    FdGuard fd_guard(fd);
    TempFileGuard tmp_guard(tmp);

    write_fully(fd, content.data(), content.size(), target);
    if (mode && ::fchmod(fd, *mode) != 0) {
        throw IoError("cannot set mode on " + tmp + ": " + errno_text(errno));
    }
    if (::fsync(fd) != 0) {
        throw IoError("cannot sync " + tmp + ": " + errno_text(errno));
    }
    if (fd_guard.close_checked() != 0) {
        throw IoError("cannot close " + tmp + ": " + errno_text(errno));
    }
    int err = 0;
    if (replace) {
        if (::rename(tmp.c_str(), target.c_str()) != 0) err = errno;
    } else {
        err = rename_noreplace(tmp, target);
    }
    if (err != 0) {
        if (err == EISDIR) throw IsADirectoryError(target);
        if (err == EEXIST && !replace) throw AlreadyExistsError(target);
        throw IoError("cannot rename " + tmp + " to " + target + ": " + errno_text(err));
    }
    tmp_guard.armed = false;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

int open_regular(const std::string& path, uint64_t* size) {
    // O_NONBLOCK keeps a FIFO without a writer from stalling the open.
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) throw NotFoundError(path);
        throw IoError("cannot open " + path + ": " + errno_text(err));
    }
    FdGuard guard(fd);

    struct ::stat st;
    if (::fstat(fd, &st) != 0) {
        throw IoError("cannot stat " + path + ": " + errno_text(errno));
    }
    if (S_ISDIR(st.st_mode)) throw IsADirectoryError(path);
    if (!S_ISREG(st.st_mode)) throw IoError("not a regular file: " + path);

    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) != 0) {
        throw IoError("cannot set flags on " + path + ": " + errno_text(errno));
    }
    if (size) *size = static_cast<uint64_t>(st.st_size);
    guard.fd = -1;
    return fd;
}

std::string read_all(const std::string& path) {
    uint64_t size = 0;
    FdGuard guard(open_regular(path, &size));
    int fd = guard.fd;

    std::string out;
    out.reserve(static_cast<size_t>(size));
    char buf[65536];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("cannot read " + path + ": " + errno_text(errno));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void write_atomic(const std::string& path, const std::string& content) {
    std::optional<mode_t> mode;
    struct ::stat st;
    if (::stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) throw IsADirectoryError(path);
        mode = st.st_mode & 07777;
    }
    publish(path, content, mode, true);
}

void copy_file_atomic(const std::string& from, const std::string& to) {
    struct ::stat st;
    if (::stat(from.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) throw NotFoundError(from);
        throw IoError("cannot stat " + from + ": " + errno_text(err));
    }
    if (!S_ISREG(st.st_mode)) {
        throw IoError("cannot copy special file: " + from);
    }
    publish(to, read_all(from), st.st_mode & 07777, false);
}

int rename_noreplace(const std::string& from, const std::string& to) {
#ifdef RENAME_NOREPLACE
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return 0;
    }
    if (errno != EINVAL && errno != ENOSYS) return errno;
#endif
    // No kernel support: hard links refuse to replace for non-directories.
    struct ::stat st;
    if (::lstat(from.c_str(), &st) != 0) return errno;
    if (!S_ISDIR(st.st_mode)) {
        if (::link(from.c_str(), to.c_str()) == 0) {
            if (::unlink(from.c_str()) != 0) return errno;
            return 0;
        }
        if (errno != EPERM && errno != EOPNOTSUPP) return errno;
    }
    if (::lstat(to.c_str(), &st) == 0) return EEXIST;
    if (::rename(from.c_str(), to.c_str()) != 0) return errno;
    return 0;
}

std::string random_hex(size_t bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; ++i) {
        int b = dist(gen);
        out.push_back(kHex[(b >> 4) & 0xF]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

EntryKind kind_of(const std::string& path) {
    struct ::stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return EntryKind::Missing;
        throw IoError("cannot stat " + path + ": " + errno_text(errno));
    }
    if (S_ISLNK(st.st_mode)) return EntryKind::Symlink;
    if (S_ISDIR(st.st_mode)) return EntryKind::Directory;
    if (S_ISREG(st.st_mode)) return EntryKind::File;
    return EntryKind::Other;
}

std::vector<DirItem> read_dir(const std::string& dir) {
    EntryKind k = kind_of(dir);
    if (k == EntryKind::Missing) throw NotFoundError(dir);
    if (k == EntryKind::File || k == EntryKind::Other) throw NotADirectoryError(dir);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IoError("cannot read directory " + dir + ": " + ec.message());
    }

    std::vector<DirItem> items;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        DirItem item;
        item.name = it->path().filename().string();
        item.size = 0;
        std::string full = paths::join(dir, item.name);
        struct ::stat st;
        if (::lstat(full.c_str(), &st) != 0) {
            // Vanished between readdir and lstat.
            continue;
        }
        if (S_ISLNK(st.st_mode)) {
            item.kind = EntryKind::Symlink;
        } else if (S_ISDIR(st.st_mode)) {
            item.kind = EntryKind::Directory;
        } else if (S_ISREG(st.st_mode)) {
            item.kind = EntryKind::File;
            item.size = static_cast<uint64_t>(st.st_size);
        } else {
            item.kind = EntryKind::Other;
        }
        items.push_back(std::move(item));
    }
    if (ec) {
        throw IoError("cannot read directory " + dir + ": " + ec.message());
    }

    std::sort(items.begin(), items.end(),
              [](const DirItem& a, const DirItem& b) { return a.name < b.name; });
    return items;
}

} // namespace io
} // namespace fsgate
