#pragma once

#include <string>
#include <filesystem>

namespace debtscan::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& log_path = default_log_path(),
                     Level min_level = Level::Info,
                     bool mirror_to_stderr = false);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn"/"warning", "error"; anything else maps to Info
    static Level parse_level(const std::string& name);
    static std::filesystem::path default_log_path();
};

}  // namespace debtscan::util
