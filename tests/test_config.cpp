#include <catch2/catch.hpp>
#include <fsgate/fsgate.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <chrono>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace fsgate;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("fsgate_ctest_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return fs::canonical(tmp);
}

static ServerConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "fsgate-server");
    std::vector<const char*> argv;
    for (const auto& a : args) argv.push_back(a.c_str());
    return ServerConfig::from_args(static_cast<int>(argv.size()), argv.data());
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

TEST_CASE("config: defaults", "[config]") {
    auto cfg = parse({});
    CHECK(cfg.roots.empty());
    CHECK(cfg.log_level == LogLevel::Info);
    CHECK(cfg.log_file.empty());
    CHECK(cfg.server_name == "fsgate");
    CHECK_FALSE(cfg.show_help);
}

TEST_CASE("config: directories and options", "[config]") {
    auto cfg = parse({"/srv/a", "--log-level", "DEBUG", "/srv/b", "--log-file", "/tmp/x.log"});
    CHECK(cfg.roots == std::vector<std::string>{"/srv/a", "/srv/b"});
    CHECK(cfg.log_level == LogLevel::Debug);
    CHECK(cfg.log_file == "/tmp/x.log");
}

TEST_CASE("config: double dash ends options", "[config]") {
    auto cfg = parse({"--", "--weird-dir"});
    CHECK(cfg.roots == std::vector<std::string>{"--weird-dir"});
}

TEST_CASE("config: help flag", "[config]") {
    CHECK(parse({"-h"}).show_help);
    CHECK(parse({"--help"}).show_help);
    CHECK(usage("fsgate-server").find("Usage: fsgate-server") == 0);
}

TEST_CASE("config: bad command lines", "[config]") {
    CHECK_THROWS_AS(parse({"--verbose"}), ConfigError);
    CHECK_THROWS_AS(parse({"--log-level"}), ConfigError);
    CHECK_THROWS_AS(parse({"--log-level", "chatty"}), ConfigError);
    CHECK_THROWS_AS(parse({"--config", "/nonexistent/fsgate.json"}), ConfigError);
}

// ---------------------------------------------------------------------------
// Config file
// ---------------------------------------------------------------------------

TEST_CASE("config: file values and command-line overrides", "[config]") {
    auto dir = make_temp_dir();
    auto file = (dir / "fsgate.json").string();
    std::ofstream(file) << R"({
        "roots": ["/from/file"],
        "log_level": "warn",
        "log_file": "/var/log/fsgate.log",
        "server_name": "docs-gate"
    })";

    auto from_file = parse({"--config", file});
    CHECK(from_file.config_file == file);
    CHECK(from_file.roots == std::vector<std::string>{"/from/file"});
    CHECK(from_file.log_level == LogLevel::Warning);
    CHECK(from_file.log_file == "/var/log/fsgate.log");
    CHECK(from_file.server_name == "docs-gate");

    auto overridden = parse({"--config", file, "--log-level", "error", "/from/cli"});
    CHECK(overridden.roots == std::vector<std::string>{"/from/cli"});
    CHECK(overridden.log_level == LogLevel::Error);
    CHECK(overridden.server_name == "docs-gate");
    fs::remove_all(dir);
}

TEST_CASE("config: malformed files", "[config]") {
    auto dir = make_temp_dir();
    ServerConfig cfg;

    std::ofstream(dir / "syntax.json") << "{roots: ";
    CHECK_THROWS_AS(ServerConfig::load_file((dir / "syntax.json").string(), cfg), ConfigError);

    std::ofstream(dir / "array.json") << "[\"/a\"]";
    CHECK_THROWS_AS(ServerConfig::load_file((dir / "array.json").string(), cfg), ConfigError);

    std::ofstream(dir / "type.json") << R"({"roots": "/not/a/list"})";
    CHECK_THROWS_AS(ServerConfig::load_file((dir / "type.json").string(), cfg), ConfigError);

    std::ofstream(dir / "level.json") << R"({"log_level": "loud"})";
    CHECK_THROWS_AS(ServerConfig::load_file((dir / "level.json").string(), cfg), ConfigError);
    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

TEST_CASE("config: logging level and file", "[config]") {
    auto dir = make_temp_dir();
    auto log_path = (dir / "fsgate.log").string();
    std::vector<std::pair<LogLevel, std::string>> seen;

    Logger& log = Logger::instance();
    log.set_console(false);
    log.set_callback([&seen](LogLevel level, const std::string& msg) {
        seen.emplace_back(level, msg);
    });

    ServerConfig cfg;
    cfg.log_level = LogLevel::Warning;
    cfg.log_file = log_path;
    cfg.apply_logging();

    log.info("dropped");
    log.warn("kept\n");
    log.error("also kept");

    log.set_callback(nullptr);
    log.set_file("");
    log.set_level(LogLevel::Info);
    log.set_console(true);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0].first == LogLevel::Warning);
    CHECK(seen[0].second == "kept");
    CHECK(seen[1].second == "also kept");

    std::ifstream f(log_path);
    std::string line;
    REQUIRE(std::getline(f, line));
    CHECK(line.find("[WARN] kept") != std::string::npos);
    fs::remove_all(dir);
}

TEST_CASE("config: unwritable log file is IoError", "[config]") {
    ServerConfig cfg;
    cfg.log_file = "/nonexistent-dir/fsgate.log";
    CHECK_THROWS_AS(cfg.apply_logging(), IoError);
    Logger::instance().set_level(LogLevel::Info);
}
