#include "fsgate/log.h"
#include "fsgate/error.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fsgate {

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warning;
    if (n == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO"; // unreachable
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mtx_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return level_;
}

void Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return;
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw IoError("cannot open log file: " + path);
    }
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    console_ = enabled;
}

void Logger::set_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mtx_);
    callback_ = std::move(callback);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (level < level_) return;

    // Trim trailing newlines to avoid blank lines
    std::string msg = message;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream line;
    line << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ")
         << "[" << log_level_name(level) << "] " << msg;

    if (console_) std::cerr << line.str() << std::endl;
    if (file_.is_open()) file_ << line.str() << std::endl;
    if (callback_) callback_(level, msg);
}

} // namespace fsgate
