#pragma once
/// Internal helpers shared between fsgate source files.
/// Not part of the public API.

#include "fsgate/error.h"
#include "fsgate/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fsgate {

// ---------------------------------------------------------------------------
// text — line handling shared by edits, diffs and reads
// ---------------------------------------------------------------------------

namespace text {

/// Replace every "\r\n" with "\n".
std::string normalize_line_endings(const std::string& s);

/// Split on '\n'.  "a\nb" -> {"a", "b"}; "a\n" -> {"a", ""}.
std::vector<std::string> split_lines(const std::string& s);

std::string join_lines(const std::vector<std::string>& lines);

/// Strip leading and trailing blanks (space, tab, \r, \v, \f).
std::string trim(const std::string& s);

/// Leading run of spaces and tabs.
std::string leading_whitespace(const std::string& s);

} // namespace text

// ---------------------------------------------------------------------------
// io — POSIX file helpers
// ---------------------------------------------------------------------------

namespace io {

/// Open a regular file read-only without blocking on FIFOs or devices.
/// Stores the byte size in `size` when given.  The caller owns the fd.
/// @throws NotFoundError, IsADirectoryError.
/// @throws IoError for anything that is not a regular file.
int open_regular(const std::string& path, uint64_t* size = nullptr);

/// Read a whole regular file in binary mode.
/// @throws NotFoundError, IsADirectoryError, IoError.
std::string read_all(const std::string& path);

/// Write `content` to `path` through a uniquely named temporary file in
/// the same directory followed by rename(2).  An existing file's
/// permission bits are carried over.  The temporary file is removed on
/// every failure path.
/// @throws NotFoundError if the parent directory is missing.
/// @throws IsADirectoryError if `path` is a directory.
/// @throws IoError on any other failure.
void write_atomic(const std::string& path, const std::string& content);

/// Copy a regular file to `to` via a temporary file and rename.
/// @throws AlreadyExistsError if `to` appears before the rename.
void copy_file_atomic(const std::string& from, const std::string& to);

/// rename(2) that fails with EEXIST instead of replacing `to`.
/// Returns 0 or an errno value.
int rename_noreplace(const std::string& from, const std::string& to);

/// `bytes` random bytes as lowercase hex.
std::string random_hex(size_t bytes);

/// Kind of the entry at `path` without following a final symlink.
EntryKind kind_of(const std::string& path);

/// One directory entry as seen by listings and walks.
struct DirItem {
    std::string name;
    EntryKind   kind;
    uint64_t    size; ///< Byte size for regular files, 0 otherwise.
};

/// Entries of `dir` sorted by name, symlinks reported as Symlink.
/// @throws NotFoundError, NotADirectoryError, IoError.
std::vector<DirItem> read_dir(const std::string& dir);

} // namespace io

// ---------------------------------------------------------------------------
// base64
// ---------------------------------------------------------------------------

namespace base64 {

std::string encode(const std::string& data);

} // namespace base64

} // namespace fsgate
