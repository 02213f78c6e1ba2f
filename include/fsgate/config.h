#pragma once

#include "log.h"

#include <string>
#include <vector>

namespace fsgate {

/// Settings for fsgate-server.
///
/// Command line:
///     fsgate-server [--config FILE] [--log-level L] [--log-file F] [DIR...]
///
/// Config file (JSON, every key optional):
/// @code
///     {
///       "roots": ["/srv/docs", "~/notes"],
///       "log_level": "info",
///       "log_file": "/var/log/fsgate.log",
///       "server_name": "fsgate"
///     }
/// @endcode
/// Command-line values win over the file; directories given on the command
/// line replace the file's roots.
struct ServerConfig {
    std::vector<std::string> roots;
    LogLevel                 log_level = LogLevel::Info;
    std::string              log_file;
    std::string              server_name = "fsgate";
    std::string              config_file;
    bool                     show_help = false;

    /// Parse the command line, reading --config when given.
    /// @throws ConfigError on unknown options, missing values, an unknown
    ///         log level or a bad config file.
    static ServerConfig from_args(int argc, const char* const* argv);

    /// Merge the keys of a JSON config file into `cfg`.
    /// @throws ConfigError if the file cannot be read or is malformed.
    static void load_file(const std::string& path, ServerConfig& cfg);

    /// Configure the process-wide Logger (level and file).
    /// @throws IoError if the log file cannot be opened.
    void apply_logging() const;
};

/// Usage text for --help.
std::string usage(const std::string& program);

} // namespace fsgate
