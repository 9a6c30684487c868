#pragma once

#include <filesystem>
#include <string>

namespace debtscan::util {

class Platform {
public:
    // $XDG_CONFIG_HOME/debtscan, else ~/.config/debtscan
    static std::filesystem::path get_config_directory();
    // $XDG_CACHE_HOME/debtscan, else ~/.cache/debtscan
    static std::filesystem::path get_cache_directory();

    // Lowercased extension without the leading dot ("" if none)
    static std::string get_extension(const std::filesystem::path& path);
};

}  // namespace debtscan::util
