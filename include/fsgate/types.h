#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

// ---------------------------------------------------------------------------
// EntryKind
// ---------------------------------------------------------------------------

/// The kind of a filesystem entry as seen without following symlinks.
enum class EntryKind : uint8_t {
    Missing,   ///< Nothing at this path.
    File,      ///< Regular file.
    Directory, ///< Directory.
    Symlink,   ///< Symbolic link (not followed).
    Other,     ///< FIFO, socket, device, ...
};

inline const char* entry_kind_name(EntryKind k) {
    switch (k) {
        case EntryKind::Missing:   return "missing";
        case EntryKind::File:      return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink:   return "symlink";
        case EntryKind::Other:     return "other";
    }
    return "other"; // unreachable
}

// ---------------------------------------------------------------------------
// ResolvedPath
// ---------------------------------------------------------------------------

/// An absolute, symlink-free, normalized path inside some allowed root.
///
/// Produced by PathResolver::resolve for a single operation; never cached.
struct ResolvedPath {
    std::string path;           ///< Real path ("/"-separated).
    bool        exists = false; ///< True when the final component exists.
};

// ---------------------------------------------------------------------------
// EditOperation
// ---------------------------------------------------------------------------

/// One text replacement of an edit call.
struct EditOperation {
    std::string old_text;
    std::string new_text;
};

// ---------------------------------------------------------------------------
// DirectoryEntry
// ---------------------------------------------------------------------------

/// An entry yielded by directory listings and trees.
struct DirectoryEntry {
    std::string                 name;     ///< Basename of the entry.
    EntryKind                   kind;     ///< File, Directory, ...
    std::optional<uint64_t>     size;     ///< Byte size (files only).
    std::optional<std::vector<DirectoryEntry>> children; ///< Tree only.

    bool is_directory() const { return kind == EntryKind::Directory; }
};

/// Ordering for list_with_sizes.
enum class SortBy : uint8_t {
    Name, ///< Lexicographic by name.
    Size, ///< Largest first, ties broken by name.
};

// ---------------------------------------------------------------------------
// FileInfo
// ---------------------------------------------------------------------------

/// Metadata returned by get_file_info.
struct FileInfo {
    uint64_t    size;         ///< Size in bytes.
    int64_t     created;      ///< Status-change time (POSIX seconds).
    int64_t     modified;     ///< Modification time (POSIX seconds).
    int64_t     accessed;     ///< Access time (POSIX seconds).
    bool        is_directory;
    bool        is_file;
    bool        is_symlink;
    std::string permissions;  ///< Three octal digits, e.g. "644".
};

// ---------------------------------------------------------------------------
// MediaContent
// ---------------------------------------------------------------------------

/// A binary file encoded for transport.
struct MediaContent {
    std::string mime_type; ///< e.g. "image/png".
    std::string data;      ///< Base64-encoded bytes.

    bool is_image() const { return mime_type.rfind("image/", 0) == 0; }
    bool is_audio() const { return mime_type.rfind("audio/", 0) == 0; }
};

// ---------------------------------------------------------------------------
// ReadOptions
// ---------------------------------------------------------------------------

/// Options for FileReader::read_text. Setting both is an error.
struct ReadOptions {
    std::optional<size_t> head; ///< Return only the first N lines.
    std::optional<size_t> tail; ///< Return only the last N lines.
};

} // namespace fsgate
