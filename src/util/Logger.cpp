#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <atomic>
#include <algorithm>

namespace debtscan::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_path = Logger::default_log_path();
static std::atomic<Logger::Level> min_level{Logger::Level::Info};
static bool mirror_stderr = false;

std::filesystem::path Logger::default_log_path() {
    return "/tmp/debtscan.log";
}

void Logger::init(const std::filesystem::path& path, Level level, bool mirror_to_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    min_level = level;
    mirror_stderr = mirror_to_stderr;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Not initialized: append so concurrent test binaries don't truncate each other
        log_file.open(log_path, std::ios::app);
    }

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    const char* level_str = "[INFO]  ";
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    if (log_file) {
        log_file << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
        log_file.flush();
    }
    if (mirror_stderr) {
        std::cerr << level_str << message << '\n';
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

}  // namespace debtscan::util
