#pragma once

#include "types.h"

#include <cstdint>
#include <string>

namespace fsgate {

/// Read-side operations on resolved paths.
class FileReader {
public:
    /// Whole file, or its first / last lines.
    ///
    /// Head and tail output joins lines with `\n` and has no trailing
    /// newline.  The tail is read backwards in 1 KiB chunks so only the end
    /// of a large file is touched.
    /// @throws std::invalid_argument if both head and tail are set.
    /// @throws NotFoundError, IsADirectoryError, IoError.
    std::string read_text(const std::string& path, const ReadOptions& opts = {}) const;

    /// Base64 of the file with a MIME type taken from its extension.
    /// @throws NotFoundError, IsADirectoryError, IoError.
    MediaContent read_media(const std::string& path) const;

    /// @throws NotFoundError, IoError.
    FileInfo info(const std::string& path) const;
};

/// MIME type for a file name's extension (case-insensitive);
/// "application/octet-stream" when unknown.
std::string mime_type_for(const std::string& name);

/// "0 B", "512 B", "1.50 KB", ... up to TB.
std::string format_size(uint64_t bytes);

} // namespace fsgate
