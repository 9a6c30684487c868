#include "../framework/SimpleTest.hpp"
#include "config/ScanConfig.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>

using namespace debtscan::config;
namespace fs = std::filesystem;

namespace {

fs::path temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("debtscan_config_test_" + std::to_string(getpid()) + "_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}  // namespace

TEST_CASE(test_config_defaults) {
    ScanConfig cfg;
    ASSERT_TRUE(cfg.tags.empty());
    ASSERT_TRUE(cfg.case_sensitive);
    ASSERT_FALSE(cfg.precise);
    ASSERT_TRUE(cfg.cache_enabled);
    ASSERT_EQ(cfg.mmap_threshold, 256u * 1024u);
    ASSERT_EQ(cfg.log_level, std::string("info"));
}

TEST_CASE(test_config_parse_all_sections) {
    auto cfg = ConfigLoader::parse(
        "# comment\n"
        "[scan]\n"
        "tags = [\"TODO\", \"FIXME\"]   # trailing comment\n"
        "custom_tags = [\"NOTE\"]\n"
        "case_sensitive = false\n"
        "precise = true\n"
        "workers = 8\n"
        "mmap_threshold = 1048576\n"
        "max_file_size = 5000000\n"
        "\n"
        "[cache]\n"
        "enabled = false\n"
        "path = \"/var/tmp/ds.db\"\n"
        "\n"
        "[logging]\n"
        "level = \"debug\"\n"
        "file = \"/tmp/ds.log\"\n"
        "stderr = true\n");

    ASSERT_EQ(cfg.tags.size(), 2u);
    ASSERT_EQ(cfg.tags[1], std::string("FIXME"));
    ASSERT_EQ(cfg.custom_tags.size(), 1u);
    ASSERT_FALSE(cfg.case_sensitive);
    ASSERT_TRUE(cfg.precise);
    ASSERT_EQ(cfg.workers, 8u);
    ASSERT_EQ(cfg.mmap_threshold, 1048576u);
    ASSERT_EQ(cfg.max_file_size, 5000000u);
    ASSERT_FALSE(cfg.cache_enabled);
    ASSERT_EQ(cfg.cache_path.string(), std::string("/var/tmp/ds.db"));
    ASSERT_EQ(cfg.log_level, std::string("debug"));
    ASSERT_EQ(cfg.log_file.string(), std::string("/tmp/ds.log"));
    ASSERT_TRUE(cfg.log_to_stderr);
}

TEST_CASE(test_config_bad_values_keep_defaults) {
    auto cfg = ConfigLoader::parse(
        "[scan]\n"
        "workers = lots\n"
        "mmap_threshold = -5\n"
        "unknown_key = 1\n"
        "no equals sign\n");
    ASSERT_EQ(cfg.workers, 0u);
    ASSERT_EQ(cfg.mmap_threshold, 256u * 1024u);
}

TEST_CASE(test_config_booleans_ignore_case) {
    auto cfg = ConfigLoader::parse(
        "[scan]\n"
        "case_sensitive = False\n"
        "precise = TRUE\n"
        "[logging]\n"
        "stderr = Yes\n");
    ASSERT_FALSE(cfg.case_sensitive);
    ASSERT_TRUE(cfg.precise);
    ASSERT_TRUE(cfg.log_to_stderr);
}

TEST_CASE(test_config_template_round_trips) {
    ScanConfig original;
    original.custom_tags = {"NOTE", "PERF"};
    original.precise = true;
    original.workers = 3;
    original.cache_path = "/tmp/x/cache.db";

    auto parsed = ConfigLoader::parse(ConfigLoader::render(original));
    ASSERT_TRUE(parsed.custom_tags == original.custom_tags);
    ASSERT_TRUE(parsed.precise);
    ASSERT_EQ(parsed.workers, 3u);
    ASSERT_EQ(parsed.cache_path, original.cache_path);

    auto defaults = ConfigLoader::parse(ConfigLoader::default_template());
    ASSERT_TRUE(defaults.tags.empty());
    ASSERT_TRUE(defaults.cache_path.empty());
    ASSERT_TRUE(defaults.cache_enabled);
}

TEST_CASE(test_config_load_from_file) {
    auto dir = temp_dir("load");
    auto path = dir / "config.toml";
    {
        std::ofstream out(path);
        out << "[scan]\nprecise = true\n";
    }
    auto cfg = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(cfg.has_value());
    ASSERT_TRUE(cfg->precise);
    ASSERT_EQ(cfg->source, path);

    ASSERT_FALSE(ConfigLoader::load_from_file(dir / "missing.toml").has_value());
}

TEST_CASE(test_config_explicit_missing_path_uses_defaults) {
    auto cfg = ConfigLoader::load_config(fs::path("/nonexistent/debtscan.toml"));
    ASSERT_TRUE(cfg.source.empty());
    ASSERT_FALSE(cfg.precise);
}

TEST_CASE(test_config_find_project_file_walks_up) {
    auto root = temp_dir("walk");
    auto nested = root / "a" / "b" / "c";
    fs::create_directories(nested);
    {
        std::ofstream out(root / "a" / ConfigLoader::PROJECT_FILE_NAME);
        out << "[scan]\nworkers = 2\n";
    }

    auto found = ConfigLoader::find_project_file(nested);
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(*found, root / "a" / ConfigLoader::PROJECT_FILE_NAME);
}

TEST_CASE(test_config_save) {
    auto dir = temp_dir("save");
    ScanConfig cfg;
    cfg.workers = 4;
    ASSERT_TRUE(ConfigLoader::save_config(cfg, dir / "sub" / "config.toml"));

    auto loaded = ConfigLoader::load_from_file(dir / "sub" / "config.toml");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->workers, 4u);
}

int main() {
    return debtscan::test::TestRunner::instance().run_all();
}
