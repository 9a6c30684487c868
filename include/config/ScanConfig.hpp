#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace debtscan::config {

struct ScanConfig {
    // [scan]
    std::vector<std::string> tags;         // empty = built-in set
    std::vector<std::string> custom_tags;  // added to `tags`
    bool case_sensitive = true;
    bool precise = false;                  // AST verification
    size_t workers = 0;                    // 0 = hardware concurrency
    size_t mmap_threshold = 256 * 1024;
    uint64_t max_file_size = 0;            // 0 = unlimited

    // [cache]
    bool cache_enabled = true;
    std::filesystem::path cache_path;      // empty = platform cache dir

    // [logging]
    std::string log_level = "info";
    std::filesystem::path log_file;        // empty = Logger default
    bool log_to_stderr = false;

    // File this config was read from; empty for defaults
    std::filesystem::path source;
};

class ConfigLoader {
public:
    static constexpr const char* PROJECT_FILE_NAME = ".debtscan.toml";

    // Explicit path, else project file, else user config, else defaults
    static ScanConfig load_config(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

    // Empty optional when the file cannot be opened
    static std::optional<ScanConfig> load_from_file(const std::filesystem::path& path);
    static ScanConfig parse(const std::string& text);

    static bool save_config(const ScanConfig& cfg, const std::filesystem::path& path);
    static std::string render(const ScanConfig& cfg);
    static std::string default_template() { return render(ScanConfig()); }

    // Nearest PROJECT_FILE_NAME in start_dir or one of its parents
    static std::optional<std::filesystem::path> find_project_file(const std::filesystem::path& start_dir);
    static std::filesystem::path get_user_config_file();
};

}  // namespace debtscan::config
