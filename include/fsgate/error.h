#pragma once

#include <stdexcept>
#include <string>

namespace fsgate {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all fsgate exceptions.
class FsGateError : public std::runtime_error {
public:
    explicit FsGateError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Path errors
// ---------------------------------------------------------------------------

/// A requested path is malformed (empty, embedded NUL byte, ...).
class InvalidPathError : public FsGateError {
public:
    explicit InvalidPathError(const std::string& msg)
        : FsGateError("invalid path: " + msg) {}
};

/// A requested path is not absolute after normalization.
class NotAbsoluteError : public FsGateError {
public:
    explicit NotAbsoluteError(const std::string& path)
        : FsGateError("path must be absolute: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A path lies outside every allowed root, either as written or after
/// symlink resolution. The message never says whether the path exists.
class AccessDeniedError : public FsGateError {
public:
    AccessDeniedError(const std::string& path, const std::string& reason)
        : FsGateError("access denied - " + reason + ": " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A path that must exist does not.
class NotFoundError : public FsGateError {
public:
    explicit NotFoundError(const std::string& path)
        : FsGateError("not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// An operation expected a file but encountered a directory.
class IsADirectoryError : public FsGateError {
public:
    explicit IsADirectoryError(const std::string& path)
        : FsGateError("is a directory: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// An operation expected a directory but encountered something else.
class NotADirectoryError : public FsGateError {
public:
    explicit NotADirectoryError(const std::string& path)
        : FsGateError("not a directory: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// The target of a create or move already exists.
class AlreadyExistsError : public FsGateError {
public:
    explicit AlreadyExistsError(const std::string& path)
        : FsGateError("already exists: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// ---------------------------------------------------------------------------
// Root configuration errors
// ---------------------------------------------------------------------------

/// A root directory candidate does not exist.
class RootNotFoundError : public FsGateError {
public:
    explicit RootNotFoundError(const std::string& path)
        : FsGateError("root directory does not exist: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A root directory candidate exists but is not a directory.
class RootNotADirectoryError : public FsGateError {
public:
    explicit RootNotADirectoryError(const std::string& path)
        : FsGateError("root is not a directory: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// ---------------------------------------------------------------------------
// Mutation errors
// ---------------------------------------------------------------------------

/// An edit's old text has no exact or whitespace-normalized match.
class EditMatchNotFoundError : public FsGateError {
public:
    explicit EditMatchNotFoundError(const std::string& old_text)
        : FsGateError("could not find match for edit:\n" + old_text),
          old_text_(old_text) {}
    const std::string& old_text() const { return old_text_; }
private:
    std::string old_text_;
};

/// A filesystem I/O error occurred (permission denied, disk full,
/// cross-device failure, ...).
class IoError : public FsGateError {
public:
    explicit IoError(const std::string& msg)
        : FsGateError("io error: " + msg) {}
};

// ---------------------------------------------------------------------------
// Configuration errors
// ---------------------------------------------------------------------------

/// The command line or the config file is malformed.
class ConfigError : public FsGateError {
public:
    explicit ConfigError(const std::string& msg)
        : FsGateError("config error: " + msg) {}
};

} // namespace fsgate
