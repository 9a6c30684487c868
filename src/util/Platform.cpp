#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>

namespace debtscan::util {

std::filesystem::path Platform::get_config_directory() {
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "debtscan";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "debtscan";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/debtscan");
    return ".config/debtscan";
}

std::filesystem::path Platform::get_cache_directory() {
    if (auto xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "debtscan";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "debtscan";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .cache/debtscan");
    return ".cache/debtscan";
}

std::string Platform::get_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

}  // namespace debtscan::util
