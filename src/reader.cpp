#include "fsgate/reader.h"
#include "fsgate/error.h"
#include "internal.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fsgate {

namespace {

constexpr size_t kTailChunk = 1024;

/// RAII read-only descriptor on a regular file.
struct ReadFd {
    uint64_t size = 0; ///< Declared first; open_regular() fills it.
    int      fd;
    explicit ReadFd(const std::string& path)
        : fd(io::open_regular(path, &size)) {}
    ~ReadFd() { ::close(fd); }
    ReadFd(const ReadFd&) = delete;
    ReadFd& operator=(const ReadFd&) = delete;
};

ssize_t pread_fully(int fd, char* buf, size_t len, off_t offset) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd, buf + done, len - done, offset + static_cast<off_t>(done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(done);
}

std::string strip_cr(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string head_lines(const std::string& path, size_t count) {
    ReadFd f(path);
    std::string out, pending;
    size_t emitted = 0;
    char buf[8192];
    off_t offset = 0;
    while (emitted < count) {
        ssize_t n = pread_fully(f.fd, buf, sizeof(buf), offset);
        if (n < 0) throw IoError("cannot read " + path + ": " + std::strerror(errno));
        if (n == 0) break;
        offset += n;
        pending.append(buf, static_cast<size_t>(n));
        size_t nl;
        while (emitted < count && (nl = pending.find('\n')) != std::string::npos) {
            if (emitted > 0) out += '\n';
            out += strip_cr(pending.substr(0, nl));
            pending.erase(0, nl + 1);
            ++emitted;
        }
    }
    if (emitted < count && !pending.empty()) {
        if (emitted > 0) out += '\n';
        out += strip_cr(pending);
    }
    return out;
}

std::string tail_lines(const std::string& path, size_t count) {
    ReadFd f(path);
    if (f.size == 0 || count == 0) return "";

    std::deque<std::string> lines;
    std::string remaining;
    uint64_t position = f.size;
    char buf[kTailChunk];
    bool last_chunk = true;

    while (position > 0 && lines.size() < count) {
        size_t size = static_cast<size_t>(std::min<uint64_t>(kTailChunk, position));
        position -= size;
        ssize_t n = pread_fully(f.fd, buf, size, static_cast<off_t>(position));
        if (n < 0) throw IoError("cannot read " + path + ": " + std::strerror(errno));

        std::string chunk = text::normalize_line_endings(
            std::string(buf, static_cast<size_t>(n)) + remaining);
        auto chunk_lines = text::split_lines(chunk);
        if (last_chunk) {
            // A final newline terminates the last line; it does not start one.
            if (chunk_lines.back().empty()) chunk_lines.pop_back();
            last_chunk = false;
        }
        if (position > 0 && !chunk_lines.empty()) {
            // The first piece may continue in the previous chunk.
            remaining = chunk_lines.front();
            chunk_lines.erase(chunk_lines.begin());
        } else {
            remaining.clear();
        }
        for (auto it = chunk_lines.rbegin(); it != chunk_lines.rend() && lines.size() < count; ++it) {
            lines.push_front(strip_cr(*it));
        }
    }
    return text::join_lines(std::vector<std::string>(lines.begin(), lines.end()));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FileReader
// ---------------------------------------------------------------------------

std::string FileReader::read_text(const std::string& path, const ReadOptions& opts) const {
    if (opts.head && opts.tail) {
        throw std::invalid_argument("cannot specify both head and tail");
    }
    if (opts.tail) return tail_lines(path, *opts.tail);
    if (opts.head) return head_lines(path, *opts.head);
    return io::read_all(path);
}

MediaContent FileReader::read_media(const std::string& path) const {
    MediaContent out;
    out.mime_type = mime_type_for(path);
    out.data = base64::encode(io::read_all(path));
    return out;
}

FileInfo FileReader::info(const std::string& path) const {
    struct ::stat st;
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) throw NotFoundError(path);
        throw IoError("cannot stat " + path + ": " + std::strerror(err));
    }
    FileInfo fi;
    fi.size         = static_cast<uint64_t>(st.st_size);
    fi.created      = static_cast<int64_t>(st.st_ctime);
    fi.modified     = static_cast<int64_t>(st.st_mtime);
    fi.accessed     = static_cast<int64_t>(st.st_atime);
    fi.is_directory = S_ISDIR(st.st_mode);
    fi.is_file      = S_ISREG(st.st_mode);
    fi.is_symlink   = io::kind_of(path) == EntryKind::Symlink;

    char perms[8];
    std::snprintf(perms, sizeof(perms), "%03o", static_cast<unsigned>(st.st_mode & 0777));
    fi.permissions = perms;
    return fi;
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::string mime_type_for(const std::string& name) {
    static const std::map<std::string, std::string> kTypes = {
        {"png",  "image/png"},
        {"jpg",  "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif",  "image/gif"},
        {"webp", "image/webp"},
        {"bmp",  "image/bmp"},
        {"svg",  "image/svg+xml"},
        {"mp3",  "audio/mpeg"},
        {"wav",  "audio/wav"},
        {"ogg",  "audio/ogg"},
        {"flac", "audio/flac"},
    };
    auto slash = name.rfind('/');
    auto dot = name.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "application/octet-stream";
}

std::string format_size(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes == 0) return "0 B";

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    if (unit == 0) return std::to_string(bytes) + " B";

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", size, kUnits[unit]);
    return buf;
}

} // namespace fsgate
