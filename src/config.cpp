#include "fsgate/config.h"
#include "fsgate/error.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fsgate {

namespace {

LogLevel level_from(const std::string& name) {
    auto level = parse_log_level(name);
    if (!level) throw ConfigError("unknown log level: " + name);
    return *level;
}

} // anonymous namespace

void ServerConfig::load_file(const std::string& path, ServerConfig& cfg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("could not open config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("JSON parse error in " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError(path + ": top level must be an object");
    }

    try {
        if (j.contains("roots")) {
            cfg.roots = j.at("roots").get<std::vector<std::string>>();
        }
        if (j.contains("log_level")) {
            cfg.log_level = level_from(j.at("log_level").get<std::string>());
        }
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.server_name = j.value("server_name", cfg.server_name);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

ServerConfig ServerConfig::from_args(int argc, const char* const* argv) {
    ServerConfig cfg;
    std::vector<std::string> dirs;
    std::string level, log_file;
    bool level_set = false, log_file_set = false;

    auto value_of = [&](int& i, const std::string& opt) -> std::string {
        if (i + 1 >= argc) throw ConfigError("missing value for " + opt);
        return argv[++i];
    };

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || arg.empty() || arg[0] != '-') {
            dirs.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "--config") {
            cfg.config_file = value_of(i, arg);
        } else if (arg == "--log-level") {
            level = value_of(i, arg);
            level_set = true;
        } else if (arg == "--log-file") {
            log_file = value_of(i, arg);
            log_file_set = true;
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }

    if (!cfg.config_file.empty()) load_file(cfg.config_file, cfg);
    if (level_set) cfg.log_level = level_from(level);
    if (log_file_set) cfg.log_file = log_file;
    if (!dirs.empty()) cfg.roots = dirs;
    return cfg;
}

void ServerConfig::apply_logging() const {
    Logger& log = Logger::instance();
    log.set_level(log_level);
    if (!log_file.empty()) log.set_file(log_file);
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options] [DIR...]\n"
           "\n"
           "Serve filesystem tools over stdio, confined to the given directories.\n"
           "\n"
           "Options:\n"
           "  --config FILE     read settings from a JSON file\n"
           "  --log-level L     debug, info, warn or error (default info)\n"
           "  --log-file F      also append log lines to F\n"
           "  -h, --help        show this help\n"
           "\n"
           "Without directories the server waits for the client to supply roots.\n";
}

} // namespace fsgate
