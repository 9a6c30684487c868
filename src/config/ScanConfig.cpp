#include "config/ScanConfig.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace debtscan::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.length() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

// Drops a trailing "# comment" that is not inside quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

// ["TODO", "FIXME"] or TODO, FIXME
std::vector<std::string> parse_list(const std::string& value) {
    std::string body = value;
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> items;
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

bool parse_bool(const std::string& value) {
    return util::equals_ignore_case(value, "true") || util::equals_ignore_case(value, "yes") ||
           value == "1";
}

template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) {
            util::Logger::warn("Config: Negative value for " + key + " ignored");
            return;
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid number for " + key + ": " + value);
    }
}

std::string quote_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += "\"" + items[i] + "\"";
    }
    return out + "]";
}

}  // namespace

ScanConfig ConfigLoader::load_config(const std::optional<fs::path>& explicit_path) {
    util::Logger::info("Config: Loading configuration");

    if (explicit_path) {
        if (auto cfg = load_from_file(*explicit_path)) {
            return *cfg;
        }
        util::Logger::warn("Config: Cannot read " + explicit_path->string() + ", using defaults");
        return ScanConfig();
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        if (auto project = find_project_file(cwd)) {
            if (auto cfg = load_from_file(*project)) {
                return *cfg;
            }
        }
    }

    fs::path user = get_user_config_file();
    if (fs::exists(user, ec)) {
        if (auto cfg = load_from_file(user)) {
            return *cfg;
        }
    }

    util::Logger::debug("Config: No config file found, using defaults");
    return ScanConfig();
}

std::optional<ScanConfig> ConfigLoader::load_from_file(const fs::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();

    ScanConfig cfg = parse(buffer.str());
    cfg.source = path;
    return cfg;
}

ScanConfig ConfigLoader::parse(const std::string& text) {
    ScanConfig cfg;

    std::istringstream in(text);
    std::string line, current_section;
    while (std::getline(in, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[' && line.back() == ']' && line.find('=') == std::string::npos) {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string raw = trim(line.substr(eq_pos + 1));
        std::string value = unquote(raw);

        if (current_section == "scan") {
            if (key == "tags") cfg.tags = parse_list(raw);
            else if (key == "custom_tags") cfg.custom_tags = parse_list(raw);
            else if (key == "case_sensitive") cfg.case_sensitive = parse_bool(value);
            else if (key == "precise") cfg.precise = parse_bool(value);
            else if (key == "workers") parse_number(key, value, cfg.workers);
            else if (key == "mmap_threshold") parse_number(key, value, cfg.mmap_threshold);
            else if (key == "max_file_size") parse_number(key, value, cfg.max_file_size);
            else util::Logger::warn("Config: Unknown key scan." + key);
        }
        else if (current_section == "cache") {
            if (key == "enabled") cfg.cache_enabled = parse_bool(value);
            else if (key == "path") cfg.cache_path = fs::path(value);
            else util::Logger::warn("Config: Unknown key cache." + key);
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = fs::path(value);
            else if (key == "stderr") cfg.log_to_stderr = parse_bool(value);
            else util::Logger::warn("Config: Unknown key logging." + key);
        }
        else {
            util::Logger::warn("Config: Unknown section [" + current_section + "]");
        }
    }

    return cfg;
}

std::string ConfigLoader::render(const ScanConfig& cfg) {
    std::ostringstream file;

    file << "# debtscan configuration\n\n";

    file << "[scan]\n";
    file << "# Tag keywords; empty list means TODO, FIXME, HACK, BUG, XXX\n";
    file << "tags = " << quote_list(cfg.tags) << "\n";
    file << "# Extra keywords matched like the built-in ones\n";
    file << "custom_tags = " << quote_list(cfg.custom_tags) << "\n";
    file << "case_sensitive = " << (cfg.case_sensitive ? "true" : "false") << "\n";
    file << "# Drop matches outside real comments (tree-sitter)\n";
    file << "precise = " << (cfg.precise ? "true" : "false") << "\n";
    file << "# Worker threads (0 = one per core)\n";
    file << "workers = " << cfg.workers << "\n";
    file << "# Files larger than this many bytes are memory-mapped\n";
    file << "mmap_threshold = " << cfg.mmap_threshold << "\n";
    file << "# Skip files larger than this many bytes (0 = no limit)\n";
    file << "max_file_size = " << cfg.max_file_size << "\n\n";

    file << "[cache]\n";
    file << "enabled = " << (cfg.cache_enabled ? "true" : "false") << "\n";
    if (!cfg.cache_path.empty()) {
        file << "path = \"" << cfg.cache_path.string() << "\"\n\n";
    } else {
        file << "# path = \"~/.cache/debtscan/cache.db\"\n\n";
    }

    file << "[logging]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    if (!cfg.log_file.empty()) {
        file << "file = \"" << cfg.log_file.string() << "\"\n";
    } else {
        file << "# file = \"/tmp/debtscan.log\"\n";
    }
    file << "stderr = " << (cfg.log_to_stderr ? "true" : "false") << "\n";

    return file.str();
}

bool ConfigLoader::save_config(const ScanConfig& cfg, const fs::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) return false;
    file << render(cfg);
    return static_cast<bool>(file);
}

std::optional<fs::path> ConfigLoader::find_project_file(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = start_dir;
    while (true) {
        fs::path candidate = dir / PROJECT_FILE_NAME;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

fs::path ConfigLoader::get_user_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

}  // namespace debtscan::config
