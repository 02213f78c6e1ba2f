#pragma once

#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace fsgate {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

/// Process-wide logger.
///
/// Lines go to stderr (stdout belongs to the wire protocol) and, when
/// configured, are appended to a log file.  An optional callback sees every
/// line that passes the level filter; tests use it to capture output.
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level);
    LogLevel level() const;

    /// Also append to `path`.  An empty path closes the current file.
    /// @throws IoError if the file cannot be opened.
    void set_file(const std::string& path);

    /// Suppress the stderr sink (the file and callback still receive lines).
    void set_console(bool enabled);

    void set_callback(LogCallback callback);

    void log(LogLevel level, const std::string& message);

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::Debug, m); }
    void info(const std::string& m)  { log(LogLevel::Info, m); }
    void warn(const std::string& m)  { log(LogLevel::Warning, m); }
    void error(const std::string& m) { log(LogLevel::Error, m); }

private:
    Logger() = default;

    mutable std::mutex mtx_;
    LogLevel           level_   = LogLevel::Info;
    bool               console_ = true;
    std::ofstream      file_;
    LogCallback        callback_;
};

/// Shorthand for Logger::instance().
inline Logger& logger() { return Logger::instance(); }

} // namespace fsgate
